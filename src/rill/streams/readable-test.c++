// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "readable.h"

#include <kj/test.h>

namespace rill {
namespace {

kj::Vector<Chunk> readAll(ReadableStreamDefaultReader& reader, kj::WaitScope& ws) {
  kj::Vector<Chunk> chunks;
  while (true) {
    auto result = reader.read().wait(ws);
    if (result.done) break;
    chunks.add(kj::mv(KJ_ASSERT_NONNULL(result.value)));
  }
  return kj::mv(chunks);
}

KJ_TEST("ReadableStream::from yields its chunks then closes") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::from(kj::arr(Chunk(1), Chunk("two")));
  KJ_EXPECT(!stream->isDisturbed());
  auto reader = stream->getReader();
  KJ_EXPECT(stream->isLocked());

  auto chunks = readAll(*reader, ws);
  KJ_ASSERT(chunks.size() == 2);
  KJ_EXPECT(chunks[0] == Chunk(1));
  KJ_EXPECT(chunks[1] == Chunk("two"));
  KJ_EXPECT(stream->isClosed());
  KJ_EXPECT(stream->isDisturbed());
  reader->closed().wait(ws);

  // Reads after the end keep reporting done.
  KJ_EXPECT(reader->read().wait(ws).done);
}

KJ_TEST("ReadableStream::from a function") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  int next = 0;
  auto stream = ReadableStream::from(kj::Function<ReadableStream::NextFunction>(
      [&next]() -> kj::Promise<kj::Maybe<Chunk>> {
    if (next < 3) {
      return kj::Maybe<Chunk>(Chunk(next++));
    }
    return kj::Maybe<Chunk>(kj::none);
  }));
  auto reader = stream->getReader();
  auto chunks = readAll(*reader, ws);
  KJ_ASSERT(chunks.size() == 3);
  KJ_EXPECT(chunks[2] == Chunk(2));
}

KJ_TEST("ReadableStream::from a failing function errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::from(kj::Function<ReadableStream::NextFunction>(
      []() -> kj::Promise<kj::Maybe<Chunk>> { return KJ_EXCEPTION(FAILED, "no more"); }));
  auto reader = stream->getReader();
  KJ_EXPECT_THROW_MESSAGE("no more", reader->read().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("no more", reader->closed().wait(ws));
  KJ_EXPECT(KJ_ASSERT_NONNULL(stream->getStoredError()).getDescription() == "no more");
}

KJ_TEST("only one reader at a time") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::create();
  auto reader = stream->getReader();
  KJ_EXPECT_THROW_MESSAGE("currently locked to a reader", stream->getReader());
  KJ_EXPECT_THROW_MESSAGE("currently locked to a reader", stream->cancel().wait(ws));

  reader->releaseLock();
  KJ_EXPECT(!stream->isLocked());
  KJ_EXPECT(reader->isReleased());
  KJ_EXPECT_THROW_MESSAGE("has been released", reader->read().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("has been released", reader->closed().wait(ws));

  // Releasing twice is fine, and the stream can be locked again.
  reader->releaseLock();
  auto second = stream->getReader();
}

KJ_TEST("releasing the lock rejects a pending read") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::create();
  auto reader = stream->getReader();
  auto read = reader->read();
  auto closed = reader->closed();
  KJ_EXPECT_THROW_MESSAGE("A read is already pending", reader->read().wait(ws));

  reader->releaseLock();
  KJ_EXPECT_THROW_MESSAGE("has been released", read.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("has been released", closed.wait(ws));
  KJ_EXPECT(stream->isReadable());
}

KJ_TEST("controller enqueue, close and error") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::create(kj::mv(source), countQueuingStrategy(2));
  auto& controller = KJ_ASSERT_NONNULL(maybeController);

  KJ_EXPECT(KJ_ASSERT_NONNULL(controller.getDesiredSize()) == 2);
  controller.enqueue(Chunk("a"));
  controller.enqueue(Chunk("b"));
  controller.enqueue(Chunk("c"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(controller.getDesiredSize()) == -1);

  controller.close();
  KJ_EXPECT(!controller.canCloseOrEnqueue());
  KJ_EXPECT_THROW_MESSAGE("closed or errored", controller.enqueue(Chunk("d")));
  KJ_EXPECT_THROW_MESSAGE("closed or errored", controller.close());

  // Queued chunks are still delivered after close().
  KJ_EXPECT(stream->isReadable());
  auto reader = stream->getReader();
  KJ_EXPECT(readAll(*reader, ws).size() == 3);
  KJ_EXPECT(stream->isClosed());
  KJ_EXPECT(KJ_ASSERT_NONNULL(controller.getDesiredSize()) == 0);
}

KJ_TEST("controller error drops queued chunks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::create(kj::mv(source));
  auto& controller = KJ_ASSERT_NONNULL(maybeController);
  controller.enqueue(Chunk(1));
  controller.error(KJ_EXCEPTION(FAILED, "broken"));
  KJ_EXPECT(controller.getDesiredSize() == kj::none);

  auto reader = stream->getReader();
  KJ_EXPECT_THROW_MESSAGE("broken", reader->read().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("broken", reader->closed().wait(ws));
}

KJ_TEST("a throwing size algorithm errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  QueuingStrategy strategy;
  strategy.size = [](const Chunk&) -> size_t { KJ_FAIL_REQUIRE("cannot size"); };
  auto stream = ReadableStream::create(kj::mv(source), kj::mv(strategy));
  auto& controller = KJ_ASSERT_NONNULL(maybeController);

  KJ_EXPECT_THROW_MESSAGE("cannot size", controller.enqueue(Chunk(1)));
  KJ_EXPECT(stream->getStoredError() != kj::none);
}

KJ_TEST("pull fills the queue up to the high water mark") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  uint pulls = 0;
  UnderlyingSource source;
  source.pull = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    c.enqueue(Chunk(++pulls));
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::create(kj::mv(source), countQueuingStrategy(2));
  ws.poll();
  KJ_EXPECT(pulls == 2);

  auto reader = stream->getReader();
  KJ_EXPECT(KJ_ASSERT_NONNULL(reader->read().wait(ws).value) == Chunk(1));
  ws.poll();
  KJ_EXPECT(pulls == 3);
}

KJ_TEST("a failing start errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  UnderlyingSource source;
  source.start = [](ReadableStreamDefaultController&) -> kj::Promise<void> {
    return KJ_EXCEPTION(FAILED, "no start");
  };
  auto stream = ReadableStream::create(kj::mv(source));
  auto reader = stream->getReader();
  KJ_EXPECT_THROW_MESSAGE("no start", reader->read().wait(ws));
}

KJ_TEST("cancel runs the cancel hook once") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  uint cancels = 0;
  UnderlyingSource source;
  source.cancel = [&](kj::Exception reason) -> kj::Promise<void> {
    ++cancels;
    KJ_EXPECT(reason.getDescription() == "bye");
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::create(kj::mv(source));
  stream->cancel(KJ_EXCEPTION(FAILED, "bye")).wait(ws);
  stream->cancel(KJ_EXCEPTION(FAILED, "again")).wait(ws);
  KJ_EXPECT(cancels == 1);
  KJ_EXPECT(stream->isClosed());
  KJ_EXPECT(stream->isDisturbed());
  KJ_EXPECT(stream->getReader()->read().wait(ws).done);
}

KJ_TEST("cancel through a reader resolves a pending read as done") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::create();
  auto reader = stream->getReader();
  auto read = reader->read();
  reader->cancel().wait(ws);
  KJ_EXPECT(read.wait(ws).done);
  reader->closed().wait(ws);
}

KJ_TEST("canceling an errored stream rejects") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  UnderlyingSource source;
  source.start = [](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    c.error(KJ_EXCEPTION(FAILED, "dead"));
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::create(kj::mv(source));
  KJ_EXPECT_THROW_MESSAGE("dead", stream->cancel().wait(ws));
}

// ======================================================================================
// Byte streams

KJ_TEST("BYOB reads honor min and keep leftovers queued") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  uint pulls = 0;
  UnderlyingByteSource source;
  source.pull = [&](ReadableByteStreamController& c) -> kj::Promise<void> {
    switch (pulls++) {
      case 0:
        c.enqueue(kj::heapArray("ab"_kjb));
        break;
      case 1:
        c.enqueue(kj::heapArray("cdefg"_kjb));
        c.close();
        break;
    }
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::createBytes(kj::mv(source));
  KJ_EXPECT(stream->isByteStream());
  auto reader = stream->getByobReader();

  kj::byte buffer[4];
  auto result = reader->read(kj::arrayPtr(buffer, 4), {.min = 4}).wait(ws);
  KJ_EXPECT(result.bytesRead == 4);
  KJ_EXPECT(!result.done);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 4) == "abcd"_kjb);

  result = reader->read(kj::arrayPtr(buffer, 4)).wait(ws);
  KJ_EXPECT(result.bytesRead == 3);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 3) == "efg"_kjb);

  result = reader->read(kj::arrayPtr(buffer, 4)).wait(ws);
  KJ_EXPECT(result.done);
  KJ_EXPECT(result.bytesRead == 0);
  KJ_EXPECT(pulls == 2);
}

KJ_TEST("BYOB read argument checks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::createBytes();
  auto reader = stream->getByobReader();
  kj::byte buffer[4];
  KJ_EXPECT_THROW_MESSAGE(
      "non-empty view", reader->read(kj::arrayPtr(buffer, 0)).wait(ws));
  KJ_EXPECT_THROW_MESSAGE(
      "options.min", reader->read(kj::arrayPtr(buffer, 4), {.min = 5}).wait(ws));

  KJ_EXPECT_THROW_MESSAGE(
      "not a byte stream", ReadableStream::create()->getByobReader());
}

KJ_TEST("byte sources can fill the reader's buffer directly") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  UnderlyingByteSource source;
  source.autoAllocateChunkSize = 8;
  source.pull = [](ReadableByteStreamController& c) -> kj::Promise<void> {
    auto request = KJ_ASSERT_NONNULL(c.getByobRequest());
    auto view = KJ_ASSERT_NONNULL(request->getView());
    KJ_EXPECT(view.size() == 8);
    view.first(3).copyFrom("abc"_kjb);
    KJ_EXPECT_THROW_MESSAGE("exceeds the size of the view", request->respond(9));
    request->respond(3);
    KJ_EXPECT(request->isInvalidated());
    KJ_EXPECT(request->getView() == kj::none);
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::createBytes(kj::mv(source));
  auto reader = stream->getReader();
  auto result = reader->read().wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.value).asBytes() == "abc"_kjb);
}

KJ_TEST("byte controllers reject empty chunks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableByteStreamController&> maybeController;
  UnderlyingByteSource source;
  source.start = [&](ReadableByteStreamController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto stream = ReadableStream::createBytes(kj::mv(source), 16);
  auto& controller = KJ_ASSERT_NONNULL(maybeController);
  KJ_EXPECT_THROW_MESSAGE(
      "zero-length chunk", controller.enqueue(kj::heapArray<kj::byte>(0)));
  KJ_EXPECT(controller.getByobRequest() == kj::none);

  controller.enqueue(kj::heapArray("xyz"_kjb));
  KJ_EXPECT(KJ_ASSERT_NONNULL(controller.getDesiredSize()) == 13);
}

// ======================================================================================
// Tee and async iteration

KJ_TEST("tee delivers every chunk to both branches") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::from(kj::arr(Chunk::copyOf("one"_kjb), Chunk::copyOf("two"_kjb)));
  auto tee = stream->tee();
  KJ_EXPECT(stream->isLocked());

  auto reader1 = tee.branch1->getReader();
  auto reader2 = tee.branch2->getReader();
  auto first = readAll(*reader1, ws);
  auto second = readAll(*reader2, ws);
  KJ_ASSERT(first.size() == 2);
  KJ_ASSERT(second.size() == 2);
  KJ_EXPECT(first[1] == Chunk::copyOf("two"_kjb));

  // Value streams share the chunk between branches.
  KJ_EXPECT(first[0].asBytes().begin() == second[0].asBytes().begin());
}

KJ_TEST("tee of a byte stream copies the bytes") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  bool pulled = false;
  UnderlyingByteSource source;
  source.pull = [&](ReadableByteStreamController& c) -> kj::Promise<void> {
    if (!pulled) {
      pulled = true;
      c.enqueue(kj::heapArray("data"_kjb));
    } else {
      c.close();
    }
    return kj::READY_NOW;
  };
  auto tee = ReadableStream::createBytes(kj::mv(source))->tee();
  KJ_EXPECT(tee.branch1->isByteStream());

  auto reader1 = tee.branch1->getReader();
  auto reader2 = tee.branch2->getReader();
  auto first = readAll(*reader1, ws);
  auto second = readAll(*reader2, ws);
  KJ_ASSERT(first.size() == 1);
  KJ_ASSERT(second.size() == 1);
  KJ_EXPECT(first[0].asBytes() == "data"_kjb);
  KJ_EXPECT(first[0].asBytes().begin() != second[0].asBytes().begin());
}

KJ_TEST("tee cancels the source once both branches are canceled") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<kj::String> canceledWith;
  UnderlyingSource source;
  source.cancel = [&](kj::Exception reason) -> kj::Promise<void> {
    canceledWith = kj::str(reason.getDescription());
    return kj::READY_NOW;
  };
  auto tee = ReadableStream::create(kj::mv(source))->tee();

  auto first = tee.branch1->cancel(KJ_EXCEPTION(FAILED, "left"));
  ws.poll();
  KJ_EXPECT(canceledWith == kj::none);

  tee.branch2->cancel(KJ_EXCEPTION(FAILED, "right")).wait(ws);
  first.wait(ws);
  auto& reason = KJ_ASSERT_NONNULL(canceledWith);
  KJ_EXPECT(reason.contains("left"), reason);
  KJ_EXPECT(reason.contains("right"), reason);
}

KJ_TEST("tee propagates source errors to both branches") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto tee = ReadableStream::create(kj::mv(source))->tee();
  ws.poll();
  KJ_ASSERT_NONNULL(maybeController).error(KJ_EXCEPTION(FAILED, "source broke"));

  KJ_EXPECT_THROW_MESSAGE("source broke", tee.branch1->getReader()->read().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("source broke", tee.branch2->getReader()->read().wait(ws));
}

KJ_TEST("tee reads the source once per chunk when both branches wait") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto tee = ReadableStream::create(kj::mv(source), countQueuingStrategy(0))->tee();
  ws.poll();
  auto& controller = KJ_ASSERT_NONNULL(maybeController);

  auto reader1 = tee.branch1->getReader();
  auto reader2 = tee.branch2->getReader();
  for (auto i: kj::range(1, 4)) {
    auto read1 = reader1->read();
    auto read2 = reader2->read();
    ws.poll();
    KJ_EXPECT(!read1.poll(ws));
    controller.enqueue(Chunk(i));

    auto result1 = read1.wait(ws);
    auto result2 = read2.wait(ws);
    KJ_EXPECT(KJ_ASSERT_NONNULL(result1.value) == Chunk(i));
    KJ_EXPECT(KJ_ASSERT_NONNULL(result2.value) == Chunk(i));
  }

  auto last1 = reader1->read();
  auto last2 = reader2->read();
  ws.poll();
  controller.close();
  KJ_EXPECT(last1.wait(ws).done);
  KJ_EXPECT(last2.wait(ws).done);
}

KJ_TEST("tee buffers for a branch that starts reading late") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ReadableStreamDefaultController&> maybeController;
  UnderlyingSource source;
  source.start = [&](ReadableStreamDefaultController& c) -> kj::Promise<void> {
    maybeController = c;
    return kj::READY_NOW;
  };
  auto tee = ReadableStream::create(kj::mv(source), countQueuingStrategy(0))->tee();
  ws.poll();
  auto& controller = KJ_ASSERT_NONNULL(maybeController);

  auto reader1 = tee.branch1->getReader();
  for (auto i: kj::range(1, 4)) {
    auto read = reader1->read();
    ws.poll();
    controller.enqueue(Chunk(i));
    KJ_EXPECT(KJ_ASSERT_NONNULL(read.wait(ws).value) == Chunk(i));
  }
  auto end = reader1->read();
  ws.poll();
  controller.close();
  KJ_EXPECT(end.wait(ws).done);

  auto reader2 = tee.branch2->getReader();
  auto rest = readAll(*reader2, ws);
  KJ_ASSERT(rest.size() == 3);
  KJ_EXPECT(rest[0] == Chunk(1));
  KJ_EXPECT(rest[1] == Chunk(2));
  KJ_EXPECT(rest[2] == Chunk(3));
}

KJ_TEST("values() iterates and unlocks at the end") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = ReadableStream::from(kj::arr(Chunk(1), Chunk(2)));
  auto iterator = stream->values();
  KJ_EXPECT(KJ_ASSERT_NONNULL(iterator->next().wait(ws)) == Chunk(1));
  KJ_EXPECT(KJ_ASSERT_NONNULL(iterator->next().wait(ws)) == Chunk(2));
  KJ_EXPECT(iterator->next().wait(ws) == kj::none);
  KJ_EXPECT(!stream->isLocked());
  KJ_EXPECT(iterator->next().wait(ws) == kj::none);
}

KJ_TEST("abandoning values() cancels the stream unless prevented") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  uint cancels = 0;
  auto makeStream = [&]() {
    UnderlyingSource source;
    source.pull = [](ReadableStreamDefaultController& c) -> kj::Promise<void> {
      c.enqueue(Chunk("tick"));
      return kj::READY_NOW;
    };
    source.cancel = [&](kj::Exception) -> kj::Promise<void> {
      ++cancels;
      return kj::READY_NOW;
    };
    return ReadableStream::create(kj::mv(source));
  };

  auto canceled = makeStream();
  {
    auto iterator = canceled->values();
    KJ_EXPECT(iterator->next().wait(ws) != kj::none);
  }
  ws.poll();
  KJ_EXPECT(cancels == 1);
  KJ_EXPECT(canceled->isClosed());

  auto kept = makeStream();
  {
    auto iterator = kept->values({.preventCancel = true});
    KJ_EXPECT(iterator->next().wait(ws) != kj::none);
  }
  ws.poll();
  KJ_EXPECT(cancels == 1);
  KJ_EXPECT(kept->isReadable());
  KJ_EXPECT(!kept->isLocked());
}

}  // namespace
}  // namespace rill
