// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>

namespace rill {

// Errors raised by the streams engine are plain kj::Exceptions. The web-facing error class that
// the exception represents (TypeError, RangeError, AbortError, ...) is carried as a prefix of the
// exception description, e.g. "rill.TypeError: This ReadableStream is locked.".

#define RILL_EXCEPTION(errorType) RILL_ERROR_##errorType
#define RILL_DOM_EXCEPTION(name) "rill.DOMException(" name ")"

#define RILL_ERROR_TypeError "rill.TypeError"
#define RILL_ERROR_RangeError "rill.RangeError"
#define RILL_ERROR_Error "rill.Error"
#define RILL_ERROR_AbortError RILL_DOM_EXCEPTION("AbortError")
#define RILL_ERROR_TimeoutError RILL_DOM_EXCEPTION("TimeoutError")

#define RILL_KJ_EXCEPTION(type, errorType, ...)                                                    \
  kj::Exception(kj::Exception::Type::type, __FILE__, __LINE__,                                     \
      kj::str(RILL_EXCEPTION(errorType) ": ", __VA_ARGS__))

#define RILL_REQUIRE(cond, errorType, ...)                                                         \
  KJ_REQUIRE(cond, kj::str(RILL_EXCEPTION(errorType) ": ", ##__VA_ARGS__))
// Unlike KJ_REQUIRE, RILL_REQUIRE passes all message arguments through kj::str, so the resulting
// description is exactly "<prefix>: <message>" with no "; x = 5" style annotations.

#define RILL_REQUIRE_NONNULL(value, errorType, ...)                                                \
  KJ_REQUIRE_NONNULL(value, kj::str(RILL_EXCEPTION(errorType) ": ", ##__VA_ARGS__))

#define RILL_FAIL_REQUIRE(errorType, ...)                                                          \
  KJ_FAIL_REQUIRE(kj::str(RILL_EXCEPTION(errorType) ": ", ##__VA_ARGS__))

enum class ErrorType {
  // The description carries no recognized prefix.
  UNKNOWN,
  ERROR,
  TYPE_ERROR,
  RANGE_ERROR,
  ABORT_ERROR,
  TIMEOUT_ERROR,
};

// Given an exception description, strips any leading "expected <cond>; " annotation that KJ adds
// for failed requirements.
kj::StringPtr stripRequirementPrefix(kj::StringPtr description);

// Returns the error class an exception was raised with.
ErrorType errorTypeOf(const kj::Exception& exception);

// Returns the human readable message of an exception with both the requirement annotation and the
// error class prefix removed.
kj::StringPtr stripErrorPrefix(kj::StringPtr description);

// The default reason used when a stream is aborted or cancelled without an explicit reason, and
// when an AbortSignal is triggered without one.
kj::Exception abortError(kj::StringPtr message = "The operation was aborted."_kj);

// Returns the given reason, or abortError() when there is none.
kj::Exception reasonOrAbortError(kj::Maybe<kj::Exception> reason);

kj::StringPtr KJ_STRINGIFY(ErrorType type);

}  // namespace rill
