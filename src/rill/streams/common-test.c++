// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "common.h"

#include <kj/test.h>

namespace rill {
namespace {

KJ_TEST("Chunk kinds") {
  KJ_EXPECT(Chunk().isUndefined());
  KJ_EXPECT(Chunk(true).get<bool>());
  KJ_EXPECT(Chunk(42).get<int64_t>() == 42);
  KJ_EXPECT(Chunk(1.5).get<double>() == 1.5);
  KJ_EXPECT(Chunk("abc").get<kj::String>() == "abc");
  KJ_EXPECT(Chunk::copyOf("xy"_kjb).isBytes());
}

KJ_TEST("Chunk equality compares values") {
  KJ_EXPECT(Chunk(1) == Chunk(1));
  KJ_EXPECT(!(Chunk(1) == Chunk(1.0)));
  KJ_EXPECT(Chunk("a") == Chunk(kj::str("a")));
  KJ_EXPECT(Chunk::copyOf("ab"_kjb) == Chunk::copyOf("ab"_kjb));
  KJ_EXPECT(!(Chunk::copyOf("ab"_kjb) == Chunk("ab")));
  KJ_EXPECT(Chunk() == Chunk());
}

KJ_TEST("Chunk addRef shares, clone copies") {
  auto chunk = Chunk::copyOf("hello"_kjb);
  auto shared = chunk.addRef();
  auto copy = chunk.clone();
  KJ_EXPECT(shared.asBytes().begin() == chunk.asBytes().begin());
  KJ_EXPECT(copy.asBytes().begin() != chunk.asBytes().begin());
  KJ_EXPECT(copy == chunk);
}

KJ_TEST("Chunk asBytes") {
  KJ_EXPECT(Chunk("héllo").byteLength() == 6);
  KJ_EXPECT(Chunk::copyOf("abc"_kjb).byteLength() == 3);
  KJ_EXPECT_THROW_MESSAGE("This chunk is not a byte sequence.", Chunk(5).asBytes());
}

KJ_TEST("Chunk stringifies") {
  KJ_EXPECT(kj::str(Chunk()) == "undefined");
  KJ_EXPECT(kj::str(Chunk(7)) == "7");
  KJ_EXPECT(kj::str(Chunk("x")) == "\"x\"");
  KJ_EXPECT(kj::str(Chunk::copyOf("\x01\xff"_kjb)) == "bytes(01ff)");
}

KJ_TEST("queuing strategies") {
  auto count = countQueuingStrategy(3);
  KJ_EXPECT(KJ_ASSERT_NONNULL(count.highWaterMark) == 3);
  KJ_EXPECT(KJ_ASSERT_NONNULL(count.size)(Chunk::copyOf("abcd"_kjb)) == 1);

  auto bytes = byteLengthQueuingStrategy(16);
  KJ_EXPECT(KJ_ASSERT_NONNULL(bytes.highWaterMark) == 16);
  KJ_EXPECT(KJ_ASSERT_NONNULL(bytes.size)(Chunk::copyOf("abcd"_kjb)) == 4);
  KJ_EXPECT(KJ_ASSERT_NONNULL(bytes.size)(Chunk("ab")) == 2);
}

}  // namespace
}  // namespace rill
