// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pipe.h"

#include "abort.h"
#include "readable.h"
#include "transform.h"
#include "writable.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace rill {

namespace {

class Pipe final {
 public:
  Pipe(ReadableStream& source, WritableStream& destination, PipeToOptions options)
      : source(kj::addRef(source)),
        destination(kj::addRef(destination)),
        reader(source.getReader()),
        writer(destination.getWriter()),
        preventClose(options.preventClose),
        preventAbort(options.preventAbort),
        preventCancel(options.preventCancel),
        signal(kj::mv(options.signal)),
        watcher(makeWatcher(*writer, signal)) {}
  KJ_DISALLOW_COPY_AND_MOVE(Pipe);

  kj::Promise<void> run() {
    return kj::evalNow([&]() { return loop(); });
  }

 private:
  using Action = kj::Function<kj::Promise<void>()>;

  kj::Own<ReadableStream> source;
  kj::Own<WritableStream> destination;
  kj::Own<ReadableStreamDefaultReader> reader;
  kj::Own<WritableStreamDefaultWriter> writer;
  bool preventClose;
  bool preventAbort;
  bool preventCancel;
  kj::Maybe<kj::Own<AbortSignal>> signal;

  // Resolves once the destination closes or errors, or the signal is aborted. A read that is
  // waiting on the source is abandoned when this fires so the new state is acted on promptly.
  kj::ForkedPromise<void> watcher;

  // The most recent write handed to the destination.
  kj::Maybe<kj::ForkedPromise<void>> lastWrite;

  static kj::ForkedPromise<void> makeWatcher(
      WritableStreamDefaultWriter& writer, kj::Maybe<kj::Own<AbortSignal>>& signal) {
    auto promise = writer.closed().then([]() {}, [](kj::Exception&&) {});
    KJ_IF_SOME(s, signal) {
      promise = promise.exclusiveJoin(s->whenAborted().ignoreResult());
    }
    return promise.fork();
  }

  kj::Promise<void> loop() {
    KJ_IF_SOME(promise, checkState()) {
      return kj::mv(promise);
    }

    auto step = writer->ready()
                    .then([this]() { return reader->read(); })
                    .then([](ReadResult result) -> kj::Maybe<ReadResult> {
      return kj::mv(result);
    });
    auto interrupted = watcher.addBranch().then([]() -> kj::Maybe<ReadResult> { return kj::none; });

    return step.exclusiveJoin(kj::mv(interrupted))
        .then([this](kj::Maybe<ReadResult> maybeResult) -> kj::Promise<void> {
      KJ_IF_SOME(result, maybeResult) {
        KJ_IF_SOME(chunk, result.value) {
          // Not awaited: its outcome is reflected in the destination's state, which the next
          // iteration inspects.
          lastWrite = writer->write(kj::mv(chunk)).fork();
        }
      }
      return loop();
    }, [this](kj::Exception&&) -> kj::Promise<void> {
      // A failed read or ready() means one of the streams has errored; the next iteration
      // propagates it.
      return loop();
    });
  }

  // Decides whether the pipe is finished, in the order: the signal, errors of either stream, the
  // source closing, the destination closing.
  kj::Maybe<kj::Promise<void>> checkState() {
    KJ_IF_SOME(s, signal) {
      KJ_IF_SOME(r, s->getReason()) {
        auto reason = kj::cp(r);
        bool abortDestination = !preventAbort && destination->isWritable();
        bool cancelSource = !preventCancel && source->isReadable();
        return shutdown(Action([this, reason = kj::cp(reason), abortDestination, cancelSource]() {
          kj::Vector<kj::Promise<void>> promises;
          if (abortDestination) {
            promises.add(writer->abort(kj::cp(reason)));
          }
          if (cancelSource) {
            promises.add(reader->cancel(kj::cp(reason)));
          }
          return kj::joinPromises(promises.releaseAsArray());
        }), kj::mv(reason));
      }
    }

    KJ_IF_SOME(error, source->getStoredError()) {
      auto reason = kj::cp(error);
      if (!preventAbort) {
        return shutdown(Action([this, reason = kj::cp(reason)]() {
          return writer->abort(kj::cp(reason));
        }), kj::mv(reason));
      }
      return shutdown(kj::none, kj::mv(reason));
    }

    KJ_IF_SOME(error, destination->getStoredError()) {
      auto reason = kj::cp(error);
      if (!preventCancel) {
        return shutdown(Action([this, reason = kj::cp(reason)]() {
          return reader->cancel(kj::cp(reason));
        }), kj::mv(reason));
      }
      return shutdown(kj::none, kj::mv(reason));
    }

    if (source->isClosed()) {
      if (!preventClose) {
        return shutdown(Action([this]() { return writer->close(); }), kj::none);
      }
      return shutdown(kj::none, kj::none);
    }

    if (destination->isClosed() || destination->isCloseQueuedOrInFlight()) {
      auto reason =
          RILL_KJ_EXCEPTION(FAILED, TypeError, "This destination writable stream is closed.");
      if (!preventCancel) {
        return shutdown(Action([this, reason = kj::cp(reason)]() {
          return reader->cancel(kj::cp(reason));
        }), kj::mv(reason));
      }
      return shutdown(kj::none, kj::mv(reason));
    }

    return kj::none;
  }

  // Waits for the last write, runs the action, releases both locks, and settles the pipe. The
  // pipe fails with the action's error if it has one, otherwise with the given error.
  kj::Promise<void> shutdown(kj::Maybe<Action> action, kj::Maybe<kj::Exception> error) {
    return waitForLastWrite()
        .then([action = kj::mv(action)]() mutable -> kj::Promise<void> {
      KJ_IF_SOME(a, action) {
        return a();
      }
      return kj::READY_NOW;
    }).then([this, error = kj::mv(error)]() mutable -> kj::Promise<void> {
      finalize();
      KJ_IF_SOME(e, error) {
        return kj::mv(e);
      }
      return kj::READY_NOW;
    }, [this](kj::Exception&& exception) -> kj::Promise<void> {
      finalize();
      return kj::mv(exception);
    });
  }

  kj::Promise<void> waitForLastWrite() {
    KJ_IF_SOME(write, lastWrite) {
      if (destination->isWritable() && !destination->isCloseQueuedOrInFlight()) {
        return write.addBranch().then([]() {}, [](kj::Exception&&) {});
      }
    }
    return kj::READY_NOW;
  }

  void finalize() {
    writer->releaseLock();
    reader->releaseLock();
  }
};

}  // namespace

kj::Promise<void> pipeTo(
    ReadableStream& source, WritableStream& destination, PipeToOptions options) {
  if (source.isLocked()) {
    return RILL_KJ_EXCEPTION(
        FAILED, TypeError, "This ReadableStream is currently locked to a reader.");
  }
  if (destination.isLocked()) {
    return RILL_KJ_EXCEPTION(
        FAILED, TypeError, "This WritableStream is currently locked to a writer.");
  }

  auto pipe = kj::heap<Pipe>(source, destination, kj::mv(options));
  auto promise = pipe->run();
  return promise.attach(kj::mv(pipe));
}

kj::Own<ReadableStream> pipeThrough(
    ReadableStream& source, TransformStream& transform, PipeToOptions options) {
  RILL_REQUIRE(
      !source.isLocked(), TypeError, "This ReadableStream is currently locked to a reader.");
  RILL_REQUIRE(!transform.getWritable().isLocked(), TypeError,
      "This WritableStream is currently locked to a writer.");

  pipeTo(source, transform.getWritable(), kj::mv(options))
      .detach([](kj::Exception&& exception) {
    KJ_LOG(INFO, "pipeThrough() failed; the error is surfaced through the returned stream",
        exception);
  });
  return kj::addRef(transform.getReadable());
}

}  // namespace rill
