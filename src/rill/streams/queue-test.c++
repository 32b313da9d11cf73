// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "queue.h"

#include <kj/test.h>

namespace rill {
namespace {

KJ_TEST("ValueQueue tracks size and desired size") {
  ValueQueue queue(2);
  KJ_EXPECT(queue.desiredSize() == 2);
  KJ_EXPECT(queue.empty());

  queue.push(Chunk(1), 1);
  queue.push(Chunk(2), 3);
  KJ_EXPECT(queue.size() == 4);
  KJ_EXPECT(queue.entryCount() == 2);
  KJ_EXPECT(queue.desiredSize() == -2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(queue.peek()).value == Chunk(1));

  auto entry = queue.pop();
  KJ_EXPECT(entry.value == Chunk(1));
  KJ_EXPECT(entry.size == 1);
  KJ_EXPECT(queue.size() == 3);
  KJ_EXPECT(queue.desiredSize() == -1);
}

KJ_TEST("ValueQueue close keeps entries, error drops them") {
  ValueQueue closed(1);
  closed.push(Chunk("a"), 1);
  closed.close();
  KJ_EXPECT(closed.isClosed());
  KJ_EXPECT(closed.desiredSize() == 0);
  KJ_EXPECT(closed.pop().value == Chunk("a"));
  KJ_EXPECT_THROW_MESSAGE("The queue is closed or errored.", closed.push(Chunk("b"), 1));

  ValueQueue errored(1);
  errored.push(Chunk("a"), 1);
  errored.error(KJ_EXCEPTION(FAILED, "boom"));
  KJ_EXPECT(errored.empty());
  KJ_EXPECT(errored.size() == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(errored.getError()).getDescription() == "boom");

  // Only the first terminal transition counts.
  errored.close();
  KJ_EXPECT(!errored.isClosed());
}

KJ_TEST("ValueQueue pop on empty queue") {
  ValueQueue queue(1);
  KJ_EXPECT_THROW_MESSAGE("The queue is empty.", queue.pop());
}

KJ_TEST("ByteQueue partial consumption") {
  ByteQueue queue(8);
  queue.push(kj::heapArray("abc"_kjb));
  queue.push(kj::heapArray<kj::byte>(0));
  queue.push(kj::heapArray("defg"_kjb));
  KJ_EXPECT(queue.size() == 7);
  KJ_EXPECT(queue.desiredSize() == 1);

  kj::byte buffer[2];
  KJ_EXPECT(queue.consumeInto(kj::arrayPtr(buffer, 2)) == 2);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 2) == "ab"_kjb);
  KJ_EXPECT(queue.size() == 5);

  // The rest of a partially consumed entry comes out on its own.
  KJ_EXPECT(queue.popEntry().asPtr() == "c"_kjb);

  kj::byte big[10];
  KJ_EXPECT(queue.consumeInto(kj::arrayPtr(big, 10)) == 4);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(big, 4) == "defg"_kjb);
  KJ_EXPECT(queue.empty());
  KJ_EXPECT(queue.size() == 0);
}

KJ_TEST("ByteQueue consumeInto spans entries") {
  ByteQueue queue(0);
  queue.push(kj::heapArray("ab"_kjb));
  queue.push(kj::heapArray("cd"_kjb));
  kj::byte buffer[3];
  KJ_EXPECT(queue.consumeInto(kj::arrayPtr(buffer, 3)) == 3);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 3) == "abc"_kjb);
  KJ_EXPECT(queue.popEntry().asPtr() == "d"_kjb);
}

KJ_TEST("ByteQueue reset keeps the queue open") {
  ByteQueue queue(4);
  queue.push(kj::heapArray("abcdef"_kjb));
  KJ_EXPECT(queue.desiredSize() == -2);
  queue.reset();
  KJ_EXPECT(queue.isOpen());
  KJ_EXPECT(queue.empty());
  KJ_EXPECT(queue.desiredSize() == 4);
}

}  // namespace
}  // namespace rill
