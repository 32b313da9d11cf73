// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "errors.h"

#include <kj/test.h>

namespace rill {
namespace {

KJ_TEST("errorTypeOf recognizes prefixed exceptions") {
  KJ_EXPECT(errorTypeOf(RILL_KJ_EXCEPTION(FAILED, TypeError, "bad")) == ErrorType::TYPE_ERROR);
  KJ_EXPECT(errorTypeOf(RILL_KJ_EXCEPTION(FAILED, RangeError, "bad")) == ErrorType::RANGE_ERROR);
  KJ_EXPECT(errorTypeOf(RILL_KJ_EXCEPTION(FAILED, Error, "bad")) == ErrorType::ERROR);
  KJ_EXPECT(errorTypeOf(abortError()) == ErrorType::ABORT_ERROR);
  KJ_EXPECT(errorTypeOf(RILL_KJ_EXCEPTION(DISCONNECTED, TimeoutError, "late")) ==
      ErrorType::TIMEOUT_ERROR);
  KJ_EXPECT(errorTypeOf(KJ_EXCEPTION(FAILED, "plain")) == ErrorType::UNKNOWN);
}

KJ_TEST("RILL_REQUIRE failures keep the error class") {
  try {
    RILL_REQUIRE(1 + 1 == 3, TypeError, "This stream is locked to a reader.");
    KJ_FAIL_EXPECT("should have thrown");
  } catch (kj::Exception& e) {
    KJ_EXPECT(errorTypeOf(e) == ErrorType::TYPE_ERROR, e);
    KJ_EXPECT(stripErrorPrefix(e.getDescription()) == "This stream is locked to a reader.",
        e.getDescription());
  }
}

KJ_TEST("stripErrorPrefix leaves foreign descriptions alone") {
  KJ_EXPECT(stripErrorPrefix("boom"_kj) == "boom");
  KJ_EXPECT(stripErrorPrefix("rill.RangeError: too big"_kj) == "too big");
  KJ_EXPECT(stripErrorPrefix("expected x; rill.Error: nope"_kj) == "nope");
  KJ_EXPECT(stripErrorPrefix("expected x; something else"_kj) == "expected x; something else");
}

}  // namespace
}  // namespace rill
