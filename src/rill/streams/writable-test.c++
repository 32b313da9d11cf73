// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "writable.h"

#include "abort.h"

#include <kj/test.h>

namespace rill {
namespace {

// A sink whose writes stay in flight until the test completes them.
struct ManualSink {
  kj::Vector<Chunk> written;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> pending;
  uint closes = 0;
  kj::Maybe<kj::String> abortReason;
  kj::Maybe<WritableStreamDefaultController&> controller;

  UnderlyingSink makeSink() {
    UnderlyingSink sink;
    sink.start = [this](WritableStreamDefaultController& c) -> kj::Promise<void> {
      controller = c;
      return kj::READY_NOW;
    };
    sink.write = [this](Chunk chunk, WritableStreamDefaultController&) -> kj::Promise<void> {
      written.add(kj::mv(chunk));
      auto paf = kj::newPromiseAndFulfiller<void>();
      pending.add(kj::mv(paf.fulfiller));
      return kj::mv(paf.promise);
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

  // Completes the index-th write the sink received.
  void completeNext(size_t index) {
    KJ_ASSERT(index < pending.size());
    pending[index]->fulfill();
  }
};

KJ_TEST("writes reach the sink in order, then close") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  auto writer = stream->getWriter();
  KJ_EXPECT(stream->isLocked());

  auto first = writer->write(Chunk("a"));
  auto second = writer->write(Chunk("b"));
  ws.poll();
  // One write at a time.
  KJ_EXPECT(sink.written.size() == 1);

  sink.completeNext(0);
  first.wait(ws);
  KJ_EXPECT(sink.written.size() == 2);
  KJ_EXPECT(!second.poll(ws));

  auto close = writer->close();
  KJ_EXPECT(stream->isCloseQueuedOrInFlight());
  KJ_EXPECT_THROW_MESSAGE("already being closed", writer->close().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("is closed", writer->write(Chunk("c")).wait(ws));
  KJ_EXPECT(sink.closes == 0);

  sink.completeNext(1);
  second.wait(ws);
  close.wait(ws);
  writer->closed().wait(ws);
  KJ_EXPECT(sink.closes == 1);
  KJ_EXPECT(stream->isClosed());
  KJ_EXPECT(sink.written[0] == Chunk("a"));
  KJ_EXPECT(sink.written[1] == Chunk("b"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 0);
}

KJ_TEST("ready() and desired size track backpressure") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink(), countQueuingStrategy(2));
  auto writer = stream->getWriter();
  ws.poll();
  writer->ready().wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 2);

  auto first = writer->write(Chunk(1));
  auto second = writer->write(Chunk(2));
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 0);
  auto ready = writer->ready();
  KJ_EXPECT(!ready.poll(ws));

  sink.completeNext(0);
  ready.wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 1);

  sink.completeNext(1);
  second.wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 2);
  first.wait(ws);
}

KJ_TEST("a size algorithm weighs each chunk") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink(), byteLengthQueuingStrategy(10));
  auto writer = stream->getWriter();
  ws.poll();
  auto write = writer->write(Chunk("abcd"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(writer->getDesiredSize()) == 6);
  sink.completeNext(0);
  write.wait(ws);
}

KJ_TEST("a throwing size algorithm errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  QueuingStrategy strategy;
  strategy.size = [](const Chunk&) -> size_t { KJ_FAIL_REQUIRE("unsizable"); };
  auto stream = WritableStream::create(sink.makeSink(), kj::mv(strategy));
  auto writer = stream->getWriter();
  ws.poll();
  KJ_EXPECT_THROW_MESSAGE("unsizable", writer->write(Chunk(1)).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("unsizable", writer->closed().wait(ws));
  KJ_EXPECT(sink.written.size() == 0);
}

KJ_TEST("a failed write errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  auto writer = stream->getWriter();
  auto first = writer->write(Chunk(1));
  auto second = writer->write(Chunk(2));
  ws.poll();

  sink.pending[0]->reject(KJ_EXCEPTION(FAILED, "disk full"));
  KJ_EXPECT_THROW_MESSAGE("disk full", first.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("disk full", second.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("disk full", writer->closed().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("disk full", writer->ready().wait(ws));
  KJ_EXPECT(writer->getDesiredSize() == kj::none);
  KJ_EXPECT(KJ_ASSERT_NONNULL(stream->getStoredError()).getDescription() == "disk full");

  // The sink's abort hook is not involved in a sink failure.
  KJ_EXPECT(sink.abortReason == kj::none);
  KJ_EXPECT(sink.written.size() == 1);
}

KJ_TEST("abort waits for the write in flight") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  auto writer = stream->getWriter();
  auto first = writer->write(Chunk(1));
  auto second = writer->write(Chunk(2));
  ws.poll();
  auto& signal = KJ_ASSERT_NONNULL(sink.controller).getSignal();

  auto abort = writer->abort(KJ_EXCEPTION(FAILED, "stop"));
  KJ_EXPECT(signal.isAborted());
  KJ_EXPECT(stream->isErroring());
  KJ_EXPECT(!abort.poll(ws));
  KJ_EXPECT(sink.abortReason == kj::none);

  // A second abort settles together with the first.
  auto again = writer->abort(KJ_EXCEPTION(FAILED, "ignored"));

  sink.completeNext(0);
  first.wait(ws);
  abort.wait(ws);
  again.wait(ws);
  KJ_EXPECT_THROW_MESSAGE("stop", second.wait(ws));
  KJ_EXPECT(KJ_ASSERT_NONNULL(sink.abortReason) == "stop");
  KJ_EXPECT(!stream->isErroring());
  KJ_EXPECT_THROW_MESSAGE("stop", writer->closed().wait(ws));
  KJ_EXPECT(sink.written.size() == 1);
}

KJ_TEST("abort without a reason uses an AbortError") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  ws.poll();
  stream->abort().wait(ws);
  KJ_EXPECT(errorTypeOf(KJ_ASSERT_NONNULL(stream->getStoredError())) == ErrorType::ABORT_ERROR);
  KJ_EXPECT(sink.abortReason != kj::none);

  // Aborting an errored stream does nothing.
  stream->abort().wait(ws);
  KJ_EXPECT_THROW_MESSAGE("closed or errored", stream->close().wait(ws));
}

KJ_TEST("abort after close has no effect") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  stream->close().wait(ws);
  stream->abort(KJ_EXCEPTION(FAILED, "late")).wait(ws);
  KJ_EXPECT(stream->isClosed());
  KJ_EXPECT(sink.abortReason == kj::none);
}

KJ_TEST("controller error skips the abort hook") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  ManualSink sink;
  auto stream = WritableStream::create(sink.makeSink());
  ws.poll();
  KJ_ASSERT_NONNULL(sink.controller).error(KJ_EXCEPTION(FAILED, "sink gave up"));
  KJ_EXPECT(!stream->isWritable());

  auto writer = stream->getWriter();
  KJ_EXPECT_THROW_MESSAGE("sink gave up", writer->write(Chunk(1)).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("sink gave up", writer->closed().wait(ws));
  KJ_EXPECT(sink.abortReason == kj::none);
}

KJ_TEST("a failing close hook errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  UnderlyingSink sink;
  sink.close = []() -> kj::Promise<void> { return KJ_EXCEPTION(FAILED, "flush failed"); };
  auto stream = WritableStream::create(kj::mv(sink));
  auto writer = stream->getWriter();
  KJ_EXPECT_THROW_MESSAGE("flush failed", writer->close().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("flush failed", writer->closed().wait(ws));
  KJ_EXPECT(!stream->isClosed());
}

KJ_TEST("a failing start errors the stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  UnderlyingSink sink;
  sink.start = [](WritableStreamDefaultController&) -> kj::Promise<void> {
    return KJ_EXCEPTION(FAILED, "cannot open");
  };
  auto stream = WritableStream::create(kj::mv(sink));
  auto writer = stream->getWriter();
  KJ_EXPECT_THROW_MESSAGE("cannot open", writer->write(Chunk(1)).wait(ws));
}

KJ_TEST("writer locking") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = WritableStream::create();
  auto writer = stream->getWriter();
  KJ_EXPECT_THROW_MESSAGE("currently locked to a writer", stream->getWriter());
  KJ_EXPECT_THROW_MESSAGE("currently locked to a writer", stream->close().wait(ws));
  KJ_EXPECT_THROW_MESSAGE("currently locked to a writer", stream->abort().wait(ws));

  auto closed = writer->closed();
  writer->releaseLock();
  KJ_EXPECT(writer->isReleased());
  KJ_EXPECT(!stream->isLocked());
  KJ_EXPECT_THROW_MESSAGE("has been released", closed.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("has been released", writer->write(Chunk(1)).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("has been released", writer->getDesiredSize());
  writer->releaseLock();

  // The stream itself is unaffected.
  stream->getWriter()->write(Chunk(1)).wait(ws);
  stream->close().wait(ws);
}

}  // namespace
}  // namespace rill
