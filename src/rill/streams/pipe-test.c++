// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pipe.h"

#include "abort.h"
#include "readable.h"
#include "transform.h"
#include "writable.h"

#include <kj/test.h>

namespace rill {
namespace {

// A sink that accepts every write immediately and records what happened to it.
struct RecordingSink {
  kj::Vector<Chunk> written;
  uint closes = 0;
  kj::Maybe<kj::String> abortReason;
  bool failWrites = false;

  UnderlyingSink makeSink() {
    UnderlyingSink sink;
    sink.write = [this](Chunk chunk, WritableStreamDefaultController&) -> kj::Promise<void> {
      if (failWrites) {
        return KJ_EXCEPTION(FAILED, "sink failed");
      }
      written.add(kj::mv(chunk));
      return kj::READY_NOW;
    };
    sink.close = [this]() -> kj::Promise<void> {
      ++closes;
      return kj::READY_NOW;
    };
    sink.abort = [this](kj::Exception reason) -> kj::Promise<void> {
      abortReason = kj::str(reason.getDescription());
      return kj::READY_NOW;
    };
    return sink;
  }
};

// A source that never produces anything on its own. The test drives it through the controller.
struct ManualSource {
  kj::Maybe<ReadableStreamDefaultController&> controller;
  kj::Maybe<kj::String> cancelReason;

  UnderlyingSource makeSource() {
    UnderlyingSource source;
    source.start = [this](ReadableStreamDefaultController& c) -> kj::Promise<void> {
      controller = c;
      return kj::READY_NOW;
    };
    source.cancel = [this](kj::Exception reason) -> kj::Promise<void> {
      cancelReason = kj::str(reason.getDescription());
      return kj::READY_NOW;
    };
    return source;
  }
};

kj::Vector<Chunk> readAll(ReadableStream& stream, kj::WaitScope& ws) {
  auto reader = stream.getReader();
  kj::Vector<Chunk> chunks;
  while (true) {
    auto result = reader->read().wait(ws);
    if (result.done) break;
    chunks.add(kj::mv(KJ_ASSERT_NONNULL(result.value)));
  }
  return kj::mv(chunks);
}

KJ_TEST("pipeTo() copies every chunk and closes the destination") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  RecordingSink sink;
  auto source = ReadableStream::from(kj::arr(Chunk("a"), Chunk("b"), Chunk(3)));
  auto dest = WritableStream::create(sink.makeSink());

  auto promise = pipeTo(*source, *dest);
  KJ_EXPECT(source->isLocked());
  KJ_EXPECT(dest->isLocked());
  promise.wait(ws);

  KJ_ASSERT(sink.written.size() == 3);
  KJ_EXPECT(sink.written[0] == Chunk("a"));
  KJ_EXPECT(sink.written[1] == Chunk("b"));
  KJ_EXPECT(sink.written[2] == Chunk(3));
  KJ_EXPECT(sink.closes == 1);
  KJ_EXPECT(dest->isClosed());
  KJ_EXPECT(!source->isLocked());
  KJ_EXPECT(!dest->isLocked());
}

KJ_TEST("pipeTo() with preventClose leaves the destination writable") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  RecordingSink sink;
  auto source = ReadableStream::from(kj::arr(Chunk("a")));
  auto dest = WritableStream::create(sink.makeSink());

  PipeToOptions options;
  options.preventClose = true;
  pipeTo(*source, *dest, kj::mv(options)).wait(ws);

  KJ_EXPECT(sink.written.size() == 1);
  KJ_EXPECT(sink.closes == 0);
  KJ_EXPECT(dest->isWritable());
  KJ_EXPECT(!dest->isLocked());

  dest->close().wait(ws);
  KJ_EXPECT(sink.closes == 1);
}

KJ_TEST("pipeTo() aborts the destination when the source errors") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  auto promise = pipeTo(*source, *dest);
  ws.poll();

  auto& controller = KJ_ASSERT_NONNULL(manual.controller);
  controller.enqueue(Chunk("first"));
  ws.poll();
  controller.error(KJ_EXCEPTION(FAILED, "bad source"));

  KJ_EXPECT_THROW_MESSAGE("bad source", promise.wait(ws));
  KJ_EXPECT(sink.written.size() == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(sink.abortReason) == "bad source");
  KJ_EXPECT(dest->getStoredError() != kj::none);
  KJ_EXPECT(!dest->isLocked());
}

KJ_TEST("pipeTo() with preventAbort leaves the destination alone when the source errors") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  PipeToOptions options;
  options.preventAbort = true;
  auto promise = pipeTo(*source, *dest, kj::mv(options));
  ws.poll();

  KJ_ASSERT_NONNULL(manual.controller).error(KJ_EXCEPTION(FAILED, "bad source"));

  KJ_EXPECT_THROW_MESSAGE("bad source", promise.wait(ws));
  KJ_EXPECT(sink.abortReason == kj::none);
  KJ_EXPECT(dest->isWritable());
  KJ_EXPECT(!dest->isLocked());
}

KJ_TEST("pipeTo() cancels the source when the destination errors") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  sink.failWrites = true;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  auto promise = pipeTo(*source, *dest);
  ws.poll();

  KJ_ASSERT_NONNULL(manual.controller).enqueue(Chunk("doomed"));

  KJ_EXPECT_THROW_MESSAGE("sink failed", promise.wait(ws));
  KJ_EXPECT(KJ_ASSERT_NONNULL(manual.cancelReason) == "sink failed");
  KJ_EXPECT(source->isClosed());
  KJ_EXPECT(!source->isLocked());
}

KJ_TEST("pipeTo() with preventCancel leaves the source readable when the destination errors") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  sink.failWrites = true;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  PipeToOptions options;
  options.preventCancel = true;
  auto promise = pipeTo(*source, *dest, kj::mv(options));
  ws.poll();

  KJ_ASSERT_NONNULL(manual.controller).enqueue(Chunk("doomed"));

  KJ_EXPECT_THROW_MESSAGE("sink failed", promise.wait(ws));
  KJ_EXPECT(manual.cancelReason == kj::none);
  KJ_EXPECT(source->isReadable());
  KJ_EXPECT(!source->isLocked());
}

KJ_TEST("pipeTo() into a closed destination cancels the source") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());
  dest->close().wait(ws);

  KJ_EXPECT_THROW_MESSAGE("destination writable stream is closed", pipeTo(*source, *dest).wait(ws));
  KJ_EXPECT(manual.cancelReason != kj::none);
  KJ_EXPECT(source->isClosed());
}

KJ_TEST("aborting the signal stops the pipe") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  AbortController abortController;
  PipeToOptions options;
  options.signal = abortController.addSignalRef();
  auto promise = pipeTo(*source, *dest, kj::mv(options));
  ws.poll();

  abortController.abort();

  KJ_EXPECT_THROW_MESSAGE("The operation was aborted.", promise.wait(ws));
  KJ_EXPECT(KJ_ASSERT_NONNULL(sink.abortReason) == "The operation was aborted.");
  KJ_EXPECT(KJ_ASSERT_NONNULL(manual.cancelReason) == "The operation was aborted.");
  KJ_EXPECT(!source->isLocked());
  KJ_EXPECT(!dest->isLocked());
}

KJ_TEST("pipeTo() with an already aborted signal does not copy anything") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  RecordingSink sink;
  auto source = ReadableStream::from(kj::arr(Chunk("a")));
  auto dest = WritableStream::create(sink.makeSink());

  PipeToOptions options;
  options.signal = AbortSignal::abort(KJ_EXCEPTION(FAILED, "never mind"));

  KJ_EXPECT_THROW_MESSAGE("never mind", pipeTo(*source, *dest, kj::mv(options)).wait(ws));
  KJ_EXPECT(sink.written.size() == 0);
  KJ_EXPECT(source->isClosed());
  KJ_EXPECT(dest->getStoredError() != kj::none);
}

KJ_TEST("pipeTo() rejects locked streams") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  RecordingSink sink;
  auto source = ReadableStream::from(kj::arr(Chunk("a")));
  auto dest = WritableStream::create(sink.makeSink());

  {
    auto reader = source->getReader();
    KJ_EXPECT_THROW_MESSAGE("locked to a reader", pipeTo(*source, *dest).wait(ws));
  }
  {
    auto writer = dest->getWriter();
    KJ_EXPECT_THROW_MESSAGE("locked to a writer", pipeTo(*source, *dest).wait(ws));
  }
  KJ_EXPECT(!source->isDisturbed());
}

KJ_TEST("dropping the pipe promise releases both locks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  RecordingSink sink;
  auto source = ReadableStream::create(manual.makeSource());
  auto dest = WritableStream::create(sink.makeSink());

  {
    auto promise = pipeTo(*source, *dest);
    ws.poll();
  }

  KJ_EXPECT(!source->isLocked());
  KJ_EXPECT(!dest->isLocked());
  KJ_EXPECT(source->isReadable());
  KJ_EXPECT(dest->isWritable());
}

KJ_TEST("pipeThrough() returns the readable side of the transform") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto source = ReadableStream::from(kj::arr(Chunk("a"), Chunk("b")));
  auto transform = TransformStream::identity();
  auto output = source->pipeThrough(*transform);
  KJ_EXPECT(source->isLocked());
  KJ_EXPECT(transform->getWritable().isLocked());

  auto chunks = readAll(*output, ws);
  KJ_ASSERT(chunks.size() == 2);
  KJ_EXPECT(chunks[0] == Chunk("a"));
  KJ_EXPECT(chunks[1] == Chunk("b"));

  ws.poll();
  KJ_EXPECT(!source->isLocked());
  KJ_EXPECT(transform->getWritable().isClosed());
}

KJ_TEST("pipeThrough() surfaces a source error on the returned stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSource manual;
  auto source = ReadableStream::create(manual.makeSource());
  auto transform = TransformStream::identity();
  auto output = source->pipeThrough(*transform);
  auto reader = output->getReader();

  auto read = reader->read();
  ws.poll();
  KJ_ASSERT_NONNULL(manual.controller).error(KJ_EXCEPTION(FAILED, "bad source"));

  KJ_EXPECT_THROW_MESSAGE("bad source", read.wait(ws));
}

KJ_TEST("pipeThrough() throws if the source is locked") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto source = ReadableStream::from(kj::arr(Chunk("a")));
  auto transform = TransformStream::identity();
  auto reader = source->getReader();

  KJ_EXPECT_THROW_MESSAGE("locked to a reader", source->pipeThrough(*transform));
  KJ_EXPECT(!transform->getWritable().isLocked());
}

}  // namespace
}  // namespace rill
