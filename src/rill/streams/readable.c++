// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "readable.h"

#include "pipe.h"

#include <kj/debug.h>

namespace rill {

namespace {

kj::Exception releasedError() {
  return RILL_KJ_EXCEPTION(FAILED, TypeError, "This ReadableStream reader has been released.");
}

kj::Exception lockedError() {
  return RILL_KJ_EXCEPTION(
      FAILED, TypeError, "This ReadableStream is currently locked to a reader.");
}

kj::Own<ReadableStream> requireByteStream(kj::Own<ReadableStream> stream) {
  RILL_REQUIRE(stream->isByteStream(), TypeError,
      "This ReadableStream does not support BYOB reads; it is not a byte stream.");
  return kj::mv(stream);
}

}  // namespace

// ======================================================================================
// ReadableImpl

template <typename Self, typename Queue>
ReadableImpl<Self, Queue>::ReadableImpl(Self& self,
    ReadableStream& stream,
    kj::Maybe<kj::Function<StartAlgorithm>> start,
    kj::Maybe<kj::Function<PullAlgorithm>> pull,
    kj::Maybe<kj::Function<CancelAlgorithm>> cancel,
    kj::Maybe<kj::Function<QueuingStrategy::SizeAlgorithm>> size,
    size_t highWaterMark)
    : queue(highWaterMark),
      self(self),
      stream(stream) {
  auto algs = kj::refcounted<Algorithms>();
  algs->start = kj::mv(start);
  algs->pull = kj::mv(pull);
  algs->cancel = kj::mv(cancel);
  algs->size = kj::mv(size);
  algorithms = kj::mv(algs);
}

template <typename Self, typename Queue>
void ReadableImpl<Self, Queue>::start() {
  KJ_ASSERT(!started);
  maybeRunAlgorithm(algorithms, &Algorithms::start, self)
      .then([this, ref = kj::addRef(stream)]() {
    started = true;
    pullIfNeeded();
  }, [this, ref = kj::addRef(stream)](kj::Exception&& exception) {
    doError(kj::mv(exception));
  }).detach(logDetachedFailure);
}

template <typename Self, typename Queue>
kj::Promise<void> ReadableImpl<Self, Queue>::cancel(kj::Exception reason) {
  queue.reset();
  queue.close();
  // The algorithms stay alive until the cancel algorithm settles; maybeRunAlgorithm() holds a
  // reference of its own.
  auto promise = maybeRunAlgorithm(algorithms, &Algorithms::cancel, kj::mv(reason));
  algorithms = kj::none;
  return kj::mv(promise);
}

template <typename Self, typename Queue>
bool ReadableImpl<Self, Queue>::canCloseOrEnqueue() {
  return !closeRequested && stream.isReadable();
}

template <typename Self, typename Queue>
bool ReadableImpl<Self, Queue>::shouldCallPull() {
  if (!canCloseOrEnqueue() || !started) {
    return false;
  }
  if (stream.hasPendingRead()) {
    return true;
  }
  KJ_IF_SOME(size, getDesiredSize()) {
    return size > 0;
  }
  return false;
}

template <typename Self, typename Queue>
void ReadableImpl<Self, Queue>::pullIfNeeded() {
  if (!shouldCallPull()) return;

  if (pulling) {
    pullAgain = true;
    return;
  }

  pulling = true;
  maybeRunAlgorithm(algorithms, &Algorithms::pull, self)
      .then([this, ref = kj::addRef(stream)]() {
    pulling = false;
    if (pullAgain) {
      pullAgain = false;
      pullIfNeeded();
    }
  }, [this, ref = kj::addRef(stream)](kj::Exception&& exception) {
    pulling = false;
    doError(kj::mv(exception));
  }).detach(logDetachedFailure);
}

template <typename Self, typename Queue>
void ReadableImpl<Self, Queue>::afterDequeue() {
  if (closeRequested && queue.empty()) {
    doClose();
  } else {
    pullIfNeeded();
  }
}

template <typename Self, typename Queue>
void ReadableImpl<Self, Queue>::doClose() {
  if (!stream.isReadable()) return;
  algorithms = kj::none;
  queue.close();
  stream.finishClose();
}

template <typename Self, typename Queue>
void ReadableImpl<Self, Queue>::doError(kj::Exception reason) {
  if (!stream.isReadable()) return;
  algorithms = kj::none;
  queue.error(kj::cp(reason));
  stream.finishError(kj::mv(reason));
}

template <typename Self, typename Queue>
kj::Maybe<ssize_t> ReadableImpl<Self, Queue>::getDesiredSize() {
  if (stream.getStoredError() != kj::none) {
    return kj::none;
  }
  if (stream.isClosed()) {
    return ssize_t(0);
  }
  return queue.desiredSize();
}

template <typename Self, typename Queue>
size_t ReadableImpl<Self, Queue>::sizeOf(const Chunk& chunk) {
  KJ_IF_SOME(algs, algorithms) {
    KJ_IF_SOME(size, algs->size) {
      return size(chunk);
    }
  }
  return 1;
}

// ======================================================================================
// ReadableStreamDefaultController

ReadableStreamDefaultController::ReadableStreamDefaultController(
    ReadableStream& stream, UnderlyingSource source, QueuingStrategy strategy)
    : stream(stream),
      impl(*this,
          stream,
          kj::mv(source.start),
          kj::mv(source.pull),
          kj::mv(source.cancel),
          kj::mv(strategy.size),
          strategy.highWaterMark.orDefault(1)) {}

void ReadableStreamDefaultController::enqueue(Chunk chunk) {
  RILL_REQUIRE(impl.canCloseOrEnqueue(), TypeError,
      "Unable to enqueue into a ReadableStream that is closed or errored.");

  KJ_IF_SOME(pending, stream.getPendingRead()) {
    KJ_ASSERT(impl.queue.empty());
    auto fulfiller = kj::mv(pending.get<ReadableStream::ReadRequest>().fulfiller);
    stream.pendingRead = kj::none;
    fulfiller->fulfill(ReadResult{.value = kj::mv(chunk)});
  } else {
    size_t size = 1;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { size = impl.sizeOf(chunk); })) {
      impl.doError(kj::cp(exception));
      kj::throwFatalException(kj::mv(exception));
    }
    impl.queue.push(kj::mv(chunk), size);
  }

  impl.pullIfNeeded();
}

void ReadableStreamDefaultController::close() {
  RILL_REQUIRE(impl.canCloseOrEnqueue(), TypeError,
      "Unable to close a ReadableStream that is closed or errored.");
  impl.closeRequested = true;
  if (impl.queue.empty()) {
    impl.doClose();
  }
}

void ReadableStreamDefaultController::error(kj::Exception reason) {
  impl.doError(kj::mv(reason));
}

kj::Maybe<ssize_t> ReadableStreamDefaultController::getDesiredSize() {
  return impl.getDesiredSize();
}

bool ReadableStreamDefaultController::canCloseOrEnqueue() {
  return impl.canCloseOrEnqueue();
}

void ReadableStreamDefaultController::start() {
  impl.start();
}

kj::Promise<void> ReadableStreamDefaultController::cancel(kj::Exception reason) {
  return impl.cancel(kj::mv(reason));
}

kj::Promise<ReadResult> ReadableStreamDefaultController::read() {
  if (!impl.queue.empty()) {
    auto entry = impl.queue.pop();
    impl.afterDequeue();
    return ReadResult{.value = kj::mv(entry.value)};
  }

  auto paf = kj::newPromiseAndFulfiller<ReadResult>();
  stream.pendingRead = ReadableStream::PendingRead(ReadableStream::ReadRequest{
    .fulfiller = kj::mv(paf.fulfiller),
  });
  impl.pullIfNeeded();
  return kj::mv(paf.promise);
}

// ======================================================================================
// ReadableByteStreamController

ReadableByteStreamController::ReadableByteStreamController(
    ReadableStream& stream, UnderlyingByteSource source, size_t highWaterMark)
    : stream(stream),
      impl(*this,
          stream,
          kj::mv(source.start),
          kj::mv(source.pull),
          kj::mv(source.cancel),
          kj::none,
          highWaterMark),
      autoAllocateChunkSize(source.autoAllocateChunkSize) {
  KJ_IF_SOME(size, autoAllocateChunkSize) {
    RILL_REQUIRE(size > 0, TypeError, "The autoAllocateChunkSize option cannot be zero.");
  }
}

ReadableByteStreamController::~ReadableByteStreamController() noexcept(false) {
  invalidateByobRequest();
}

void ReadableByteStreamController::enqueue(kj::Array<kj::byte> bytes) {
  RILL_REQUIRE(bytes.size() > 0, TypeError, "Cannot enqueue a zero-length chunk.");
  RILL_REQUIRE(impl.canCloseOrEnqueue(), TypeError,
      "Unable to enqueue into a ReadableStream that is closed or errored.");

  invalidateByobRequest();

  KJ_IF_SOME(pending, stream.getPendingRead()) {
    KJ_ASSERT(impl.queue.empty());
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadableStream::ReadRequest) {
        // Any auto-allocated buffer is unused; the enqueued bytes are delivered as they are.
        auto fulfiller = kj::mv(request.fulfiller);
        stream.pendingRead = kj::none;
        fulfiller->fulfill(ReadResult{.value = Chunk(kj::mv(bytes))});
      }
      KJ_CASE_ONEOF(request, ReadableStream::ByobReadRequest) {
        auto dest = request.view.slice(request.filled, request.view.size());
        auto amount = kj::min(dest.size(), bytes.size());
        dest.first(amount).copyFrom(bytes.first(amount));
        request.filled += amount;
        if (amount < bytes.size()) {
          impl.queue.push(bytes.slice(amount, bytes.size()).attach(kj::mv(bytes)));
        }
        if (request.filled >= request.min) {
          auto fulfiller = kj::mv(request.fulfiller);
          auto filled = request.filled;
          stream.pendingRead = kj::none;
          fulfiller->fulfill(ByobReadResult{.bytesRead = filled});
        }
      }
    }
  } else {
    impl.queue.push(kj::mv(bytes));
  }

  impl.pullIfNeeded();
}

void ReadableByteStreamController::close() {
  RILL_REQUIRE(impl.canCloseOrEnqueue(), TypeError,
      "Unable to close a ReadableStream that is closed or errored.");
  impl.closeRequested = true;
  if (impl.queue.empty()) {
    impl.doClose();
  }
}

void ReadableByteStreamController::error(kj::Exception reason) {
  impl.doError(kj::mv(reason));
}

kj::Maybe<ssize_t> ReadableByteStreamController::getDesiredSize() {
  return impl.getDesiredSize();
}

bool ReadableByteStreamController::canCloseOrEnqueue() {
  return impl.canCloseOrEnqueue();
}

kj::Maybe<kj::Own<ReadableStreamBYOBRequest>> ReadableByteStreamController::getByobRequest() {
  KJ_IF_SOME(request, maybeByobRequest) {
    return kj::addRef(*request);
  }
  if (pendingView() == kj::none) {
    return kj::none;
  }
  auto request = kj::refcounted<ReadableStreamBYOBRequest>(*this);
  maybeByobRequest = kj::addRef(*request);
  return kj::mv(request);
}

void ReadableByteStreamController::start() {
  impl.start();
}

kj::Promise<void> ReadableByteStreamController::cancel(kj::Exception reason) {
  invalidateByobRequest();
  return impl.cancel(kj::mv(reason));
}

kj::Promise<ReadResult> ReadableByteStreamController::read() {
  if (!impl.queue.empty()) {
    auto bytes = impl.queue.popEntry();
    impl.afterDequeue();
    return ReadResult{.value = Chunk(kj::mv(bytes))};
  }

  auto paf = kj::newPromiseAndFulfiller<ReadResult>();
  ReadableStream::ReadRequest request{.fulfiller = kj::mv(paf.fulfiller)};
  KJ_IF_SOME(size, autoAllocateChunkSize) {
    request.buffer = kj::heapArray<kj::byte>(size);
  }
  stream.pendingRead = ReadableStream::PendingRead(kj::mv(request));
  impl.pullIfNeeded();
  return kj::mv(paf.promise);
}

kj::Promise<ByobReadResult> ReadableByteStreamController::readInto(
    kj::ArrayPtr<kj::byte> view, size_t min) {
  size_t filled = 0;
  if (!impl.queue.empty()) {
    filled = impl.queue.consumeInto(view);
    if (filled >= min) {
      impl.afterDequeue();
      return ByobReadResult{.bytesRead = filled};
    }
    if (impl.closeRequested) {
      // The queue is drained and nothing more is coming.
      impl.doClose();
      return ByobReadResult{.bytesRead = filled, .done = true};
    }
  }

  auto paf = kj::newPromiseAndFulfiller<ByobReadResult>();
  stream.pendingRead = ReadableStream::PendingRead(ReadableStream::ByobReadRequest{
    .fulfiller = kj::mv(paf.fulfiller),
    .view = view,
    .filled = filled,
    .min = min,
  });
  impl.pullIfNeeded();
  return kj::mv(paf.promise);
}

void ReadableByteStreamController::respond(size_t bytesWritten) {
  auto& pending = RILL_REQUIRE_NONNULL(
      stream.getPendingRead(), TypeError, "There is no pending read to respond to.");
  RILL_REQUIRE(bytesWritten > 0, TypeError,
      "bytesWritten must be greater than zero while the stream is readable.");

  KJ_SWITCH_ONEOF(pending) {
    KJ_CASE_ONEOF(request, ReadableStream::ReadRequest) {
      auto& buffer = KJ_ASSERT_NONNULL(request.buffer);
      RILL_REQUIRE(request.filled + bytesWritten <= buffer.size(), RangeError,
          "bytesWritten exceeds the size of the view.");
      invalidateByobRequest();
      auto filled = request.filled + bytesWritten;
      auto bytes = kj::mv(buffer);
      auto fulfiller = kj::mv(request.fulfiller);
      stream.pendingRead = kj::none;
      fulfiller->fulfill(ReadResult{.value = Chunk(bytes.first(filled).attach(kj::mv(bytes)))});
    }
    KJ_CASE_ONEOF(request, ReadableStream::ByobReadRequest) {
      RILL_REQUIRE(request.filled + bytesWritten <= request.view.size(), RangeError,
          "bytesWritten exceeds the size of the view.");
      invalidateByobRequest();
      request.filled += bytesWritten;
      if (request.filled >= request.min) {
        auto fulfiller = kj::mv(request.fulfiller);
        auto filled = request.filled;
        stream.pendingRead = kj::none;
        fulfiller->fulfill(ByobReadResult{.bytesRead = filled});
      }
    }
  }

  impl.pullIfNeeded();
}

void ReadableByteStreamController::invalidateByobRequest() {
  KJ_IF_SOME(request, maybeByobRequest) {
    request->invalidate();
  }
  maybeByobRequest = kj::none;
}

kj::Maybe<kj::ArrayPtr<kj::byte>> ReadableByteStreamController::pendingView() {
  KJ_IF_SOME(pending, stream.getPendingRead()) {
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadableStream::ReadRequest) {
        KJ_IF_SOME(buffer, request.buffer) {
          return buffer.slice(request.filled, buffer.size());
        }
        return kj::none;
      }
      KJ_CASE_ONEOF(request, ReadableStream::ByobReadRequest) {
        return request.view.slice(request.filled, request.view.size());
      }
    }
  }
  return kj::none;
}

// ======================================================================================
// ReadableStreamBYOBRequest

kj::Maybe<kj::ArrayPtr<kj::byte>> ReadableStreamBYOBRequest::getView() {
  KJ_IF_SOME(c, controller) {
    return c.pendingView();
  }
  return kj::none;
}

void ReadableStreamBYOBRequest::respond(size_t bytesWritten) {
  auto& c = RILL_REQUIRE_NONNULL(
      controller, TypeError, "This ReadableStreamBYOBRequest has been invalidated.");
  c.respond(bytesWritten);
}

// ======================================================================================
// Tee

struct TeeState final: public kj::Refcounted {
  TeeState(kj::Own<ReadableStreamDefaultReader> reader,
      bool bytes,
      kj::PromiseFulfillerPair<void> paf = kj::newPromiseAndFulfiller<void>())
      : reader(kj::mv(reader)),
        bytes(bytes),
        cancelFulfiller(kj::mv(paf.fulfiller)),
        cancelPromise(paf.promise.fork()) {}

  kj::Own<ReadableStreamDefaultReader> reader;
  bool bytes;
  bool reading = false;
  bool readAgain = false;

  // A branch is referenced only while it holds its hooks (see BranchRef), so abandoned branches are
  // not kept alive.
  kj::Maybe<ReadableStream&> branches[2];
  bool canceled[2] = {false, false};
  kj::Maybe<kj::Exception> reasons[2];

  // Settles when the source has finished, errored, or been canceled on behalf of both branches.
  kj::Own<kj::PromiseFulfiller<void>> cancelFulfiller;
  kj::ForkedPromise<void> cancelPromise;

  kj::Promise<void> pull() {
    if (reading) {
      readAgain = true;
    } else {
      startRead();
    }
    return kj::READY_NOW;
  }

  void startRead() {
    reading = true;
    readAgain = false;
    reader->read().then([this, self = kj::addRef(*this)](ReadResult result) {
      reading = false;
      if (result.done) {
        for (auto i: kj::zeroTo(2)) {
          closeBranch(i);
        }
        finishCancel();
        return;
      }

      auto chunk = kj::mv(KJ_ASSERT_NONNULL(result.value));
      // Enqueueing can satisfy a waiting read and pull synchronously, which starts the next read
      // of the source itself.
      for (auto i: kj::zeroTo(2)) {
        enqueue(i, chunk);
      }
      if (readAgain && !reading) {
        startRead();
      }
    }, [this, self = kj::addRef(*this)](kj::Exception&& exception) {
      reading = false;
      errorBranches(kj::mv(exception));
    }).detach(logDetachedFailure);
  }

  kj::Promise<void> cancelBranch(uint i, kj::Exception reason) {
    canceled[i] = true;
    branches[i] = kj::none;
    reasons[i] = kj::mv(reason);
    if (canceled[1 - i]) {
      auto& first = KJ_ASSERT_NONNULL(reasons[0]);
      auto& second = KJ_ASSERT_NONNULL(reasons[1]);
      auto combined = kj::Exception(first.getType(), __FILE__, __LINE__,
          kj::str(RILL_EXCEPTION(Error) ": Both branches of the tee were canceled (",
              first.getDescription(), "; ", second.getDescription(), ")"));
      reader->cancel(kj::mv(combined))
          .then([this, self = kj::addRef(*this)]() { finishCancel(); },
              [this, self = kj::addRef(*this)](kj::Exception&& exception) {
        if (cancelFulfiller->isWaiting()) {
          cancelFulfiller->reject(kj::mv(exception));
        }
      }).detach(logDetachedFailure);
    }
    return cancelPromise.addBranch();
  }

  void enqueue(uint i, Chunk& chunk) {
    if (canceled[i]) return;
    KJ_IF_SOME(branch, branches[i]) {
      if (bytes) {
        auto& controller = branch.getByteController();
        if (controller.canCloseOrEnqueue()) {
          controller.enqueue(kj::heapArray<kj::byte>(chunk.asBytes()));
        }
      } else {
        auto& controller = branch.getDefaultController();
        if (controller.canCloseOrEnqueue()) {
          controller.enqueue(chunk.addRef());
        }
      }
    }
  }

  void closeBranch(uint i) {
    if (canceled[i]) return;
    KJ_IF_SOME(branch, branches[i]) {
      if (bytes) {
        auto& controller = branch.getByteController();
        if (controller.canCloseOrEnqueue()) controller.close();
      } else {
        auto& controller = branch.getDefaultController();
        if (controller.canCloseOrEnqueue()) controller.close();
      }
    }
  }

  void errorBranches(kj::Exception reason) {
    for (auto& maybeBranch: branches) {
      KJ_IF_SOME(branch, maybeBranch) {
        if (bytes) {
          branch.getByteController().error(kj::cp(reason));
        } else {
          branch.getDefaultController().error(kj::cp(reason));
        }
      }
    }
    finishCancel();
  }

  void finishCancel() {
    if (cancelFulfiller->isWaiting()) {
      cancelFulfiller->fulfill();
    }
  }
};

// Owns a reference to the tee state on behalf of one branch's hooks. The state forgets the branch
// once the branch releases its hooks.
class BranchRef final {
 public:
  BranchRef(kj::Own<TeeState> state, uint index): state(kj::mv(state)), index(index) {}
  ~BranchRef() noexcept(false) {
    state->branches[index] = kj::none;
  }
  KJ_DISALLOW_COPY_AND_MOVE(BranchRef);

  kj::Promise<void> cancel(kj::Exception reason) {
    return state->cancelBranch(index, kj::mv(reason));
  }

 private:
  kj::Own<TeeState> state;
  uint index;
};

ReadableStream::Tee ReadableStream::tee() {
  auto bytes = isByteStream();
  auto state = kj::refcounted<TeeState>(getReader(), bytes);

  auto makeBranch = [&](uint i) -> kj::Own<ReadableStream> {
    if (bytes) {
      UnderlyingByteSource source;
      source.pull = [state = kj::addRef(*state)](ReadableByteStreamController&) mutable {
        return state->pull();
      };
      source.cancel = [ref = kj::heap<BranchRef>(kj::addRef(*state), i)](
                          kj::Exception reason) mutable { return ref->cancel(kj::mv(reason)); };
      return createBytes(kj::mv(source));
    } else {
      UnderlyingSource source;
      source.pull = [state = kj::addRef(*state)](ReadableStreamDefaultController&) mutable {
        return state->pull();
      };
      source.cancel = [ref = kj::heap<BranchRef>(kj::addRef(*state), i)](
                          kj::Exception reason) mutable { return ref->cancel(kj::mv(reason)); };
      return create(kj::mv(source));
    }
  };

  auto branch1 = makeBranch(0);
  auto branch2 = makeBranch(1);
  state->branches[0] = *branch1;
  state->branches[1] = *branch2;

  // Errors of the source reach the branches even when neither branch is currently pulling.
  state->reader->closed().catch_([state = kj::addRef(*state)](kj::Exception&& exception) mutable {
    state->errorBranches(kj::mv(exception));
  }).detach(logDetachedFailure);

  return Tee{
    .branch1 = kj::mv(branch1),
    .branch2 = kj::mv(branch2),
  };
}

// ======================================================================================
// ReadableStream

kj::Own<ReadableStream> ReadableStream::create(UnderlyingSource source, QueuingStrategy strategy) {
  auto stream = kj::refcounted<ReadableStream>();
  auto& controller = *stream->controller.init<kj::Own<ReadableStreamDefaultController>>(
      kj::refcounted<ReadableStreamDefaultController>(*stream, kj::mv(source), kj::mv(strategy)));
  controller.start();
  return kj::mv(stream);
}

kj::Own<ReadableStream> ReadableStream::createBytes(
    UnderlyingByteSource source, size_t highWaterMark) {
  auto stream = kj::refcounted<ReadableStream>();
  auto& controller = *stream->controller.init<kj::Own<ReadableByteStreamController>>(
      kj::refcounted<ReadableByteStreamController>(*stream, kj::mv(source), highWaterMark));
  controller.start();
  return kj::mv(stream);
}

kj::Own<ReadableStream> ReadableStream::from(kj::Array<Chunk> chunks) {
  UnderlyingSource source;
  source.pull = [chunks = kj::mv(chunks), index = size_t(0)](
                    ReadableStreamDefaultController& controller) mutable -> kj::Promise<void> {
    if (index < chunks.size()) {
      controller.enqueue(kj::mv(chunks[index++]));
    }
    if (index == chunks.size()) {
      controller.close();
    }
    return kj::READY_NOW;
  };
  return create(kj::mv(source));
}

kj::Own<ReadableStream> ReadableStream::from(kj::Function<NextFunction> next) {
  UnderlyingSource source;
  source.pull = [next = kj::mv(next)](
                    ReadableStreamDefaultController& controller) mutable -> kj::Promise<void> {
    return next().then([&controller](kj::Maybe<Chunk> maybeChunk) {
      // The stream may have been canceled while the function was producing the chunk.
      if (!controller.canCloseOrEnqueue()) return;
      KJ_IF_SOME(chunk, maybeChunk) {
        controller.enqueue(kj::mv(chunk));
      } else {
        controller.close();
      }
    });
  };
  return create(kj::mv(source));
}

kj::Promise<void> ReadableStream::cancel(kj::Maybe<kj::Exception> reason) {
  if (locked) {
    return lockedError();
  }
  return cancelInternal(reasonOrAbortError(kj::mv(reason)));
}

kj::Own<ReadableStreamDefaultReader> ReadableStream::getReader() {
  return kj::heap<ReadableStreamDefaultReader>(kj::addRef(*this));
}

kj::Own<ReadableStreamBYOBReader> ReadableStream::getByobReader() {
  return kj::heap<ReadableStreamBYOBReader>(kj::addRef(*this));
}

kj::Own<ReadableStreamAsyncIterator> ReadableStream::values(ValuesOptions options) {
  return kj::heap<ReadableStreamAsyncIterator>(kj::addRef(*this), options);
}

kj::Promise<void> ReadableStream::pipeTo(WritableStream& destination, PipeToOptions options) {
  return rill::pipeTo(*this, destination, kj::mv(options));
}

kj::Own<ReadableStream> ReadableStream::pipeThrough(
    TransformStream& transform, PipeToOptions options) {
  return rill::pipeThrough(*this, transform, kj::mv(options));
}

bool ReadableStream::hasPendingRead() {
  return getPendingRead() != kj::none;
}

kj::Maybe<ReadableStream::PendingRead&> ReadableStream::getPendingRead() {
  KJ_IF_SOME(pending, pendingRead) {
    bool waiting = false;
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadRequest) {
        waiting = request.fulfiller->isWaiting();
      }
      KJ_CASE_ONEOF(request, ByobReadRequest) {
        waiting = request.fulfiller->isWaiting();
      }
    }
    if (waiting) {
      return pending;
    }

    // The caller dropped the read promise.
    pendingRead = kj::none;
    KJ_IF_SOME(c, controller.tryGet<kj::Own<ReadableByteStreamController>>()) {
      c->invalidateByobRequest();
    }
  }
  return kj::none;
}

kj::Maybe<kj::Exception> ReadableStream::checkNoPendingRead() {
  if (hasPendingRead()) {
    return RILL_KJ_EXCEPTION(FAILED, TypeError, "A read is already pending on this reader.");
  }
  return kj::none;
}

kj::Promise<ReadResult> ReadableStream::read() {
  disturbed = true;
  if (isClosed()) {
    return ReadResult{.done = true};
  }
  KJ_IF_SOME(exception, getStoredError()) {
    return kj::cp(exception);
  }
  KJ_IF_SOME(exception, checkNoPendingRead()) {
    return kj::mv(exception);
  }

  KJ_SWITCH_ONEOF(controller) {
    KJ_CASE_ONEOF(c, kj::Own<ReadableStreamDefaultController>) {
      return c->read();
    }
    KJ_CASE_ONEOF(c, kj::Own<ReadableByteStreamController>) {
      return c->read();
    }
  }
  KJ_UNREACHABLE;
}

kj::Promise<ByobReadResult> ReadableStream::readInto(kj::ArrayPtr<kj::byte> view, size_t min) {
  disturbed = true;
  if (isClosed()) {
    return ByobReadResult{.done = true};
  }
  KJ_IF_SOME(exception, getStoredError()) {
    return kj::cp(exception);
  }
  KJ_IF_SOME(exception, checkNoPendingRead()) {
    return kj::mv(exception);
  }
  return getByteController().readInto(view, min);
}

kj::Promise<void> ReadableStream::cancelInternal(kj::Exception reason) {
  disturbed = true;
  if (isClosed()) {
    return kj::READY_NOW;
  }
  KJ_IF_SOME(exception, getStoredError()) {
    return kj::cp(exception);
  }

  finishClose();

  KJ_SWITCH_ONEOF(controller) {
    KJ_CASE_ONEOF(c, kj::Own<ReadableStreamDefaultController>) {
      return c->cancel(kj::mv(reason));
    }
    KJ_CASE_ONEOF(c, kj::Own<ReadableByteStreamController>) {
      return c->cancel(kj::mv(reason));
    }
  }
  KJ_UNREACHABLE;
}

kj::Promise<void> ReadableStream::whenClosed() {
  if (isClosed()) {
    return kj::READY_NOW;
  }
  KJ_IF_SOME(exception, getStoredError()) {
    return kj::cp(exception);
  }
  auto paf = kj::newPromiseAndFulfiller<void>();
  closedWaiters.add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

void ReadableStream::lock() {
  RILL_REQUIRE(!locked, TypeError, "This ReadableStream is currently locked to a reader.");
  locked = true;
}

void ReadableStream::releaseLock() {
  KJ_IF_SOME(pending, pendingRead) {
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadRequest) {
        request.fulfiller->reject(releasedError());
      }
      KJ_CASE_ONEOF(request, ByobReadRequest) {
        request.fulfiller->reject(releasedError());
      }
    }
    pendingRead = kj::none;
    KJ_IF_SOME(c, controller.tryGet<kj::Own<ReadableByteStreamController>>()) {
      c->invalidateByobRequest();
    }
  }

  for (auto& waiter: closedWaiters) {
    waiter->reject(releasedError());
  }
  closedWaiters.clear();
  locked = false;
}

void ReadableStream::finishClose() {
  state.init<StreamStates::Closed>();

  KJ_IF_SOME(pending, pendingRead) {
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadRequest) {
        request.fulfiller->fulfill(ReadResult{.done = true});
      }
      KJ_CASE_ONEOF(request, ByobReadRequest) {
        request.fulfiller->fulfill(ByobReadResult{.bytesRead = request.filled, .done = true});
      }
    }
    pendingRead = kj::none;
  }
  KJ_IF_SOME(c, controller.tryGet<kj::Own<ReadableByteStreamController>>()) {
    c->invalidateByobRequest();
  }

  for (auto& waiter: closedWaiters) {
    waiter->fulfill();
  }
  closedWaiters.clear();
}

void ReadableStream::finishError(kj::Exception reason) {
  state.init<StreamStates::Errored>(kj::cp(reason));

  KJ_IF_SOME(pending, pendingRead) {
    KJ_SWITCH_ONEOF(pending) {
      KJ_CASE_ONEOF(request, ReadRequest) {
        request.fulfiller->reject(kj::cp(reason));
      }
      KJ_CASE_ONEOF(request, ByobReadRequest) {
        request.fulfiller->reject(kj::cp(reason));
      }
    }
    pendingRead = kj::none;
  }
  KJ_IF_SOME(c, controller.tryGet<kj::Own<ReadableByteStreamController>>()) {
    c->invalidateByobRequest();
  }

  for (auto& waiter: closedWaiters) {
    waiter->reject(kj::cp(reason));
  }
  closedWaiters.clear();
}

ReadableStreamDefaultController& ReadableStream::getDefaultController() {
  return *controller.get<kj::Own<ReadableStreamDefaultController>>();
}

ReadableByteStreamController& ReadableStream::getByteController() {
  return *controller.get<kj::Own<ReadableByteStreamController>>();
}

// ======================================================================================
// Readers

ReaderImpl::ReaderImpl(kj::Own<ReadableStream> stream) {
  stream->lock();
  this->stream = kj::mv(stream);
}

ReaderImpl::~ReaderImpl() noexcept(false) {
  releaseLock();
}

kj::Maybe<ReadableStream&> ReaderImpl::getStream() {
  KJ_IF_SOME(s, stream) {
    return *s;
  }
  return kj::none;
}

kj::Promise<void> ReaderImpl::cancel(kj::Maybe<kj::Exception> reason) {
  KJ_IF_SOME(s, stream) {
    return s->cancelInternal(reasonOrAbortError(kj::mv(reason)));
  }
  return releasedError();
}

kj::Promise<void> ReaderImpl::closed() {
  KJ_IF_SOME(s, stream) {
    return s->whenClosed();
  }
  return releasedError();
}

void ReaderImpl::releaseLock() {
  KJ_IF_SOME(s, stream) {
    s->releaseLock();
    stream = kj::none;
  }
}

kj::Promise<ReadResult> ReadableStreamDefaultReader::read() {
  KJ_IF_SOME(stream, impl.getStream()) {
    return stream.read();
  }
  return releasedError();
}

ReadableStreamBYOBReader::ReadableStreamBYOBReader(kj::Own<ReadableStream> stream)
    : impl(requireByteStream(kj::mv(stream))) {}

kj::Promise<ByobReadResult> ReadableStreamBYOBReader::read(
    kj::ArrayPtr<kj::byte> view, ByobReadOptions options) {
  KJ_IF_SOME(stream, impl.getStream()) {
    if (view.size() == 0) {
      return RILL_KJ_EXCEPTION(
          FAILED, TypeError, "You must call read() on a BYOB reader with a non-empty view.");
    }
    if (options.min == 0 || options.min > view.size()) {
      return RILL_KJ_EXCEPTION(
          FAILED, RangeError, "options.min must be between 1 and the size of the view.");
    }
    return stream.readInto(view, options.min);
  }
  return releasedError();
}

// ======================================================================================
// ReadableStreamAsyncIterator

ReadableStreamAsyncIterator::ReadableStreamAsyncIterator(
    kj::Own<ReadableStream> stream, ValuesOptions options)
    : reader(kj::heap<ReadableStreamDefaultReader>(kj::mv(stream))),
      preventCancel(options.preventCancel) {}

ReadableStreamAsyncIterator::~ReadableStreamAsyncIterator() noexcept(false) {
  KJ_IF_SOME(r, reader) {
    if (!preventCancel) {
      r->cancel(abortError("The async iterator was abandoned."))
          .detach([](kj::Exception&& exception) {
        KJ_LOG(INFO, "canceling the stream of an abandoned async iterator failed", exception);
      });
    }
  }
}

kj::Promise<kj::Maybe<Chunk>> ReadableStreamAsyncIterator::next() {
  KJ_IF_SOME(r, reader) {
    return r->read().then([this](ReadResult result) -> kj::Maybe<Chunk> {
      if (result.done) {
        reader = kj::none;
        return kj::none;
      }
      return kj::mv(result.value);
    }, [this](kj::Exception&& exception) -> kj::Maybe<Chunk> {
      reader = kj::none;
      kj::throwFatalException(kj::mv(exception));
    });
  }
  return kj::Maybe<Chunk>(kj::none);
}

kj::Promise<void> ReadableStreamAsyncIterator::cancel(kj::Maybe<kj::Exception> reason) {
  KJ_IF_SOME(r, reader) {
    kj::Promise<void> promise = kj::READY_NOW;
    if (!preventCancel) {
      promise = r->cancel(kj::mv(reason));
    }
    reader = kj::none;
    return kj::mv(promise);
  }
  return kj::READY_NOW;
}

}  // namespace rill
