// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "transform.h"

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

KJ_TEST("identity transform passes chunks through") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto transform = TransformStream::identity();
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto write = writer->write(Chunk("x"));
  auto result = reader->read().wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.value) == Chunk("x"));
  write.wait(ws);

  auto close = writer->close();
  KJ_EXPECT(reader->read().wait(ws).done);
  close.wait(ws);
  KJ_EXPECT(transform->getWritable().isClosed());
  KJ_EXPECT(transform->getReadable().isClosed());
}

KJ_TEST("writes wait for the readable side to pull") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto transform = TransformStream::identity();
  auto writer = transform->getWritable().getWriter();
  auto write = writer->write(Chunk(1));
  KJ_EXPECT(!write.poll(ws));

  auto reader = transform->getReadable().getReader();
  KJ_EXPECT(KJ_ASSERT_NONNULL(reader->read().wait(ws).value) == Chunk(1));
  write.wait(ws);
}

KJ_TEST("transform and flush hooks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  Transformer transformer;
  transformer.transform = [](Chunk chunk,
                              TransformStreamDefaultController& controller) -> kj::Promise<void> {
    auto n = chunk.get<int64_t>();
    controller.enqueue(Chunk(n));
    controller.enqueue(Chunk(n * 10));
    return kj::READY_NOW;
  };
  transformer.flush = [](TransformStreamDefaultController& controller) -> kj::Promise<void> {
    controller.enqueue(Chunk("end"));
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto first = writer->write(Chunk(1));
  auto second = writer->write(Chunk(2));
  auto close = writer->close();

  auto chunks = readAll(*reader, ws);
  KJ_ASSERT(chunks.size() == 5, chunks.size());
  KJ_EXPECT(chunks[0] == Chunk(1));
  KJ_EXPECT(chunks[1] == Chunk(10));
  KJ_EXPECT(chunks[2] == Chunk(2));
  KJ_EXPECT(chunks[3] == Chunk(20));
  KJ_EXPECT(chunks[4] == Chunk("end"));
  first.wait(ws);
  second.wait(ws);
  close.wait(ws);
}

KJ_TEST("start hook sees the readable side's desired size") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<ssize_t> seen;
  Transformer transformer;
  transformer.start = [&](TransformStreamDefaultController& controller) -> kj::Promise<void> {
    seen = controller.getDesiredSize();
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(
      kj::mv(transformer), QueuingStrategy(), countQueuingStrategy(2));
  KJ_EXPECT(KJ_ASSERT_NONNULL(seen) == 2);

  // The default readable high water mark is zero.
  Transformer other;
  other.start = [&](TransformStreamDefaultController& controller) -> kj::Promise<void> {
    seen = controller.getDesiredSize();
    return kj::READY_NOW;
  };
  auto defaulted = TransformStream::create(kj::mv(other));
  KJ_EXPECT(KJ_ASSERT_NONNULL(seen) == 0);
}

KJ_TEST("terminate closes the readable side and errors the writable side") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  Transformer transformer;
  transformer.transform = [](Chunk chunk,
                              TransformStreamDefaultController& controller) -> kj::Promise<void> {
    controller.enqueue(kj::mv(chunk));
    controller.terminate();
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto read = reader->read();
  writer->write(Chunk("last")).wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(read.wait(ws).value) == Chunk("last"));
  KJ_EXPECT(reader->read().wait(ws).done);

  KJ_EXPECT_THROW_MESSAGE("has been terminated", writer->closed().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("has been terminated", writer->write(Chunk("more")).wait(ws));
  KJ_EXPECT(errorTypeOf(KJ_ASSERT_NONNULL(transform->getWritable().getStoredError())) ==
      ErrorType::TYPE_ERROR);
}

KJ_TEST("a failing transform errors both sides") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  Transformer transformer;
  transformer.transform = [](Chunk, TransformStreamDefaultController&) -> kj::Promise<void> {
    return KJ_EXCEPTION(FAILED, "bad chunk");
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto read = reader->read();
  KJ_EXPECT_THROW_MESSAGE("bad chunk", writer->write(Chunk(1)).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("bad chunk", read.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("bad chunk", writer->closed().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("bad chunk", reader->closed().wait(ws));
}

KJ_TEST("a failing flush errors both sides") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  Transformer transformer;
  transformer.flush = [](TransformStreamDefaultController&) -> kj::Promise<void> {
    return KJ_EXCEPTION(FAILED, "incomplete");
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  KJ_EXPECT_THROW_MESSAGE("incomplete", writer->close().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("incomplete", reader->read().wait(ws));
}

KJ_TEST("canceling the readable side errors the writable side") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  uint cancels = 0;
  kj::Maybe<kj::String> reason;
  Transformer transformer;
  transformer.cancel = [&](kj::Exception exception) -> kj::Promise<void> {
    ++cancels;
    reason = kj::str(exception.getDescription());
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();

  transform->getReadable().cancel(KJ_EXCEPTION(FAILED, "not interested")).wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(reason) == "not interested");
  KJ_EXPECT_THROW_MESSAGE("not interested", writer->closed().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("not interested", writer->write(Chunk(1)).wait(ws));

  // The writable side erroring does not run the cancel hook a second time.
  writer->abort().wait(ws);
  KJ_EXPECT(cancels == 1);
}

KJ_TEST("aborting the writable side errors the readable side") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Maybe<kj::String> reason;
  Transformer transformer;
  transformer.cancel = [&](kj::Exception exception) -> kj::Promise<void> {
    reason = kj::str(exception.getDescription());
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();
  ws.poll();

  writer->abort(KJ_EXCEPTION(FAILED, "giving up")).wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(reason) == "giving up");
  KJ_EXPECT_THROW_MESSAGE("giving up", reader->read().wait(ws));
}

KJ_TEST("enqueue after the transform errored") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  Transformer transformer;
  transformer.transform = [](Chunk, TransformStreamDefaultController& controller)
      -> kj::Promise<void> {
    controller.error(KJ_EXCEPTION(FAILED, "stopped"));
    KJ_EXPECT_THROW_MESSAGE("no longer readable", controller.enqueue(Chunk(1)));
    KJ_EXPECT(controller.getDesiredSize() == kj::none);
    return kj::READY_NOW;
  };
  auto transform = TransformStream::create(kj::mv(transformer));
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto read = reader->read();
  writer->write(Chunk(1)).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("stopped", read.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("stopped", writer->closed().wait(ws));
}

}  // namespace
}  // namespace rill
