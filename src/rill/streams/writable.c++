// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "writable.h"

#include <kj/debug.h>

namespace rill {

namespace {

kj::Exception releasedError() {
  return RILL_KJ_EXCEPTION(FAILED, TypeError, "This WritableStream writer has been released.");
}

kj::Exception lockedError() {
  return RILL_KJ_EXCEPTION(
      FAILED, TypeError, "This WritableStream is currently locked to a writer.");
}

}  // namespace

// ======================================================================================
// WritableStreamDefaultController

WritableStreamDefaultController::WritableStreamDefaultController(
    WritableStream& stream, UnderlyingSink sink, QueuingStrategy strategy)
    : stream(stream),
      highWaterMark(strategy.highWaterMark.orDefault(1)) {
  auto algs = kj::refcounted<Algorithms>();
  algs->start = kj::mv(sink.start);
  algs->write = kj::mv(sink.write);
  algs->close = kj::mv(sink.close);
  algs->abort = kj::mv(sink.abort);
  algs->size = kj::mv(strategy.size);
  algorithms = kj::mv(algs);
}

void WritableStreamDefaultController::error(kj::Exception reason) {
  if (isWritable()) {
    algorithms = kj::none;
    startErroring(kj::mv(reason));
  }
}

void WritableStreamDefaultController::start() {
  KJ_ASSERT(!started);
  backpressure = getDesiredSize() <= 0;

  maybeRunAlgorithm(algorithms, &Algorithms::start, *this)
      .then([this, ref = kj::addRef(stream)]() {
    KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());
    started = true;
    advanceQueueIfNeeded();
  }, [this, ref = kj::addRef(stream)](kj::Exception&& exception) {
    KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());
    started = true;
    dealWithRejection(kj::mv(exception));
  }).detach(logDetachedFailure);
}

kj::Promise<void> WritableStreamDefaultController::write(Chunk value) {
  size_t size = 1;
  KJ_IF_SOME(algs, algorithms) {
    KJ_IF_SOME(sizeFunc, algs->size) {
      KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { size = sizeFunc(value); })) {
        if (isWritable()) {
          startErroring(kj::cp(exception));
        }
        return kj::mv(exception);
      }
    }
  }

  KJ_IF_SOME(error, state.tryGet<StreamStates::Errored>()) {
    return kj::cp(error);
  }

  if (isCloseQueuedOrInFlight() || state.is<StreamStates::Closed>()) {
    return RILL_KJ_EXCEPTION(FAILED, TypeError, "This WritableStream is closed.");
  }

  KJ_IF_SOME(erroring, state.tryGet<StreamStates::Erroring>()) {
    return kj::cp(erroring.reason);
  }

  KJ_ASSERT(isWritable());

  auto paf = kj::newPromiseAndFulfiller<void>();
  writeRequests.push_back(WriteRequest{
    .fulfiller = kj::mv(paf.fulfiller),
    .value = kj::mv(value),
    .size = size,
  });
  amountBuffered += size;

  updateBackpressure();
  advanceQueueIfNeeded();
  return kj::mv(paf.promise);
}

kj::Promise<void> WritableStreamDefaultController::close() {
  KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());
  if (isCloseQueuedOrInFlight()) {
    return RILL_KJ_EXCEPTION(
        FAILED, TypeError, "Cannot close a WritableStream that is already being closed.");
  }

  auto paf = kj::newPromiseAndFulfiller<void>();
  closeRequest = kj::mv(paf.fulfiller);

  if (backpressure && isWritable()) {
    stream.resolveReadyWaiters();
  }

  advanceQueueIfNeeded();
  return kj::mv(paf.promise);
}

kj::Promise<void> WritableStreamDefaultController::abort(kj::Exception reason) {
  abortController.abort(kj::cp(reason));

  // The signal's listeners may have errored the stream.
  if (state.is<StreamStates::Closed>() || state.is<StreamStates::Errored>()) {
    return kj::READY_NOW;
  }

  KJ_IF_SOME(pendingAbort, maybePendingAbort) {
    // The reason given to a second abort is ignored; it settles with the first one.
    return pendingAbort.promise.addBranch();
  }

  bool wasAlreadyErroring = state.is<StreamStates::Erroring>();

  auto paf = kj::newPromiseAndFulfiller<void>();
  auto promise = paf.promise.fork();
  auto result = promise.addBranch();
  maybePendingAbort = PendingAbort{
    .fulfiller = kj::mv(paf.fulfiller),
    .promise = kj::mv(promise),
    .reject = wasAlreadyErroring,
  };

  if (!wasAlreadyErroring) {
    startErroring(kj::mv(reason));
  }
  return kj::mv(result);
}

void WritableStreamDefaultController::advanceQueueIfNeeded() {
  if (!started || inFlightWrite != kj::none) {
    return;
  }
  KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());

  if (state.is<StreamStates::Erroring>()) {
    return finishErroring();
  }

  if (writeRequests.empty()) {
    if (closeRequest != kj::none) {
      KJ_ASSERT(inFlightClose == kj::none);
      inFlightClose = kj::mv(closeRequest);
      closeRequest = kj::none;

      maybeRunAlgorithm(algorithms, &Algorithms::close)
          .then([this, ref = kj::addRef(stream)]() { finishInFlightClose(); },
              [this, ref = kj::addRef(stream)](kj::Exception&& exception) {
        finishInFlightClose(kj::mv(exception));
      }).detach(logDetachedFailure);
    }
    return;
  }

  auto request = kj::mv(writeRequests.front());
  writeRequests.pop_front();
  auto value = request.value.addRef();
  auto size = request.size;
  inFlightWrite = kj::mv(request);

  maybeRunAlgorithm(algorithms, &Algorithms::write, kj::mv(value), *this)
      .then([this, ref = kj::addRef(stream), size]() {
    amountBuffered -= size;
    finishInFlightWrite();
    KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());
    if (!isCloseQueuedOrInFlight() && isWritable()) {
      updateBackpressure();
    }
    advanceQueueIfNeeded();
  }, [this, ref = kj::addRef(stream), size](kj::Exception&& exception) {
    amountBuffered -= size;
    finishInFlightWrite(kj::mv(exception));
  }).detach(logDetachedFailure);
}

void WritableStreamDefaultController::dealWithRejection(kj::Exception reason) {
  if (isWritable()) {
    return startErroring(kj::mv(reason));
  }
  KJ_ASSERT(state.is<StreamStates::Erroring>());
  finishErroring();
}

void WritableStreamDefaultController::doClose() {
  KJ_ASSERT(closeRequest == kj::none);
  KJ_ASSERT(inFlightClose == kj::none);
  KJ_ASSERT(inFlightWrite == kj::none);
  KJ_ASSERT(maybePendingAbort == kj::none);
  KJ_ASSERT(writeRequests.empty());
  state.init<StreamStates::Closed>();
  algorithms = kj::none;
  stream.finishClose();
}

void WritableStreamDefaultController::finishErroring() {
  auto erroring = kj::mv(KJ_ASSERT_NONNULL(state.tryGet<StreamStates::Erroring>()));
  KJ_ASSERT(inFlightWrite == kj::none);
  KJ_ASSERT(inFlightClose == kj::none);
  auto reason = kj::cp(erroring.reason);
  state.init<StreamStates::Errored>(kj::mv(erroring.reason));

  while (!writeRequests.empty()) {
    auto request = kj::mv(writeRequests.front());
    writeRequests.pop_front();
    request.fulfiller->reject(kj::cp(reason));
  }
  amountBuffered = 0;

  KJ_IF_SOME(pendingAbort, maybePendingAbort) {
    if (pendingAbort.reject) {
      pendingAbort.fulfiller->reject(kj::cp(reason));
      return rejectCloseAndClosedPromiseIfNeeded();
    }

    maybeRunAlgorithm(algorithms, &Algorithms::abort, kj::cp(reason))
        .then([this, ref = kj::addRef(stream)]() {
      auto& pendingAbort = KJ_ASSERT_NONNULL(maybePendingAbort);
      pendingAbort.fulfiller->fulfill();
      rejectCloseAndClosedPromiseIfNeeded();
    }, [this, ref = kj::addRef(stream)](kj::Exception&& exception) {
      auto& pendingAbort = KJ_ASSERT_NONNULL(maybePendingAbort);
      pendingAbort.fulfiller->reject(kj::mv(exception));
      rejectCloseAndClosedPromiseIfNeeded();
    }).detach(logDetachedFailure);
    return;
  }
  rejectCloseAndClosedPromiseIfNeeded();
}

void WritableStreamDefaultController::finishInFlightClose(kj::Maybe<kj::Exception> maybeReason) {
  algorithms = kj::none;
  auto fulfiller = kj::mv(KJ_ASSERT_NONNULL(inFlightClose));
  inFlightClose = kj::none;
  KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());

  KJ_IF_SOME(reason, maybeReason) {
    fulfiller->reject(kj::cp(reason));

    KJ_IF_SOME(pendingAbort, maybePendingAbort) {
      pendingAbort.fulfiller->reject(kj::cp(reason));
      maybePendingAbort = kj::none;
    }

    return dealWithRejection(kj::mv(reason));
  }

  fulfiller->fulfill();

  if (state.is<StreamStates::Erroring>()) {
    KJ_IF_SOME(pendingAbort, maybePendingAbort) {
      pendingAbort.fulfiller->fulfill();
      maybePendingAbort = kj::none;
    }
  }

  doClose();
}

void WritableStreamDefaultController::finishInFlightWrite(kj::Maybe<kj::Exception> maybeReason) {
  auto request = kj::mv(KJ_ASSERT_NONNULL(inFlightWrite));
  inFlightWrite = kj::none;

  KJ_IF_SOME(reason, maybeReason) {
    request.fulfiller->reject(kj::cp(reason));
    KJ_ASSERT(isWritable() || state.is<StreamStates::Erroring>());
    return dealWithRejection(kj::mv(reason));
  }

  request.fulfiller->fulfill();
}

void WritableStreamDefaultController::rejectCloseAndClosedPromiseIfNeeded() {
  algorithms = kj::none;
  auto& reason = KJ_ASSERT_NONNULL(state.tryGet<StreamStates::Errored>());
  KJ_IF_SOME(request, closeRequest) {
    request->reject(kj::cp(reason));
  }
  closeRequest = kj::none;
  maybePendingAbort = kj::none;
  stream.finishError(reason);
}

void WritableStreamDefaultController::startErroring(kj::Exception reason) {
  KJ_ASSERT(isWritable());
  stream.rejectReadyWaiters(reason);
  state.init<StreamStates::Erroring>(kj::mv(reason));
  if (inFlightWrite == kj::none && inFlightClose == kj::none && started) {
    finishErroring();
  }
}

void WritableStreamDefaultController::updateBackpressure() {
  KJ_ASSERT(isWritable());
  KJ_ASSERT(!isCloseQueuedOrInFlight());
  bool bp = getDesiredSize() <= 0;

  // Warn once per episode when writers keep writing well past the high water mark. The
  // multiplier keeps the default high water mark of 1 from producing a warning on every write.
  size_t warningMultiplier = highWaterMark <= 10 ? 10 : 2;
  if (warnAboutExcessiveBackpressure && highWaterMark > 0 &&
      amountBuffered >= warningMultiplier * highWaterMark) {
    KJ_LOG(WARNING, "A WritableStream is experiencing excessive backpressure.", amountBuffered,
        highWaterMark);
    warnAboutExcessiveBackpressure = false;
  }
  if (!bp) warnAboutExcessiveBackpressure = true;

  if (bp != backpressure) {
    backpressure = bp;
    if (!backpressure) {
      stream.resolveReadyWaiters();
    }
  }
}

// ======================================================================================
// WritableStream

kj::Own<WritableStream> WritableStream::create(UnderlyingSink sink, QueuingStrategy strategy) {
  auto stream = kj::refcounted<WritableStream>();
  stream->controller =
      kj::refcounted<WritableStreamDefaultController>(*stream, kj::mv(sink), kj::mv(strategy));
  stream->controller->start();
  return kj::mv(stream);
}

kj::Maybe<const kj::Exception&> WritableStream::getStoredError() const {
  KJ_IF_SOME(erroring, controller->state.tryGet<StreamStates::Erroring>()) {
    return erroring.reason;
  }
  return controller->state.tryGet<StreamStates::Errored>();
}

kj::Promise<void> WritableStream::abort(kj::Maybe<kj::Exception> reason) {
  if (locked) {
    return lockedError();
  }
  return abortInternal(reasonOrAbortError(kj::mv(reason)));
}

kj::Promise<void> WritableStream::close() {
  if (locked) {
    return lockedError();
  }
  return closeInternal();
}

kj::Own<WritableStreamDefaultWriter> WritableStream::getWriter() {
  return kj::heap<WritableStreamDefaultWriter>(kj::addRef(*this));
}

kj::Promise<void> WritableStream::write(Chunk value) {
  return controller->write(kj::mv(value));
}

kj::Promise<void> WritableStream::abortInternal(kj::Exception reason) {
  if (isClosed() || controller->state.is<StreamStates::Errored>()) {
    return kj::READY_NOW;
  }
  return controller->abort(kj::mv(reason));
}

kj::Promise<void> WritableStream::closeInternal() {
  if (isClosed() || controller->state.is<StreamStates::Errored>()) {
    return RILL_KJ_EXCEPTION(
        FAILED, TypeError, "Cannot close a WritableStream that is closed or errored.");
  }
  return controller->close();
}

kj::Promise<void> WritableStream::whenReady() {
  KJ_IF_SOME(reason, getStoredError()) {
    return kj::cp(reason);
  }
  if (isClosed() || !controller->backpressure || isCloseQueuedOrInFlight()) {
    return kj::READY_NOW;
  }
  auto paf = kj::newPromiseAndFulfiller<void>();
  readyWaiters.add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

kj::Promise<void> WritableStream::whenClosed() {
  if (isClosed()) {
    return kj::READY_NOW;
  }
  KJ_IF_SOME(error, controller->state.tryGet<StreamStates::Errored>()) {
    return kj::cp(error);
  }
  auto paf = kj::newPromiseAndFulfiller<void>();
  closedWaiters.add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

kj::Maybe<ssize_t> WritableStream::getDesiredSize() {
  if (getStoredError() != kj::none) {
    return kj::none;
  }
  if (isClosed()) {
    return ssize_t(0);
  }
  return controller->getDesiredSize();
}

void WritableStream::lock() {
  RILL_REQUIRE(!locked, TypeError, "This WritableStream is currently locked to a writer.");
  locked = true;
}

void WritableStream::releaseLock() {
  for (auto& waiter: readyWaiters) {
    waiter->reject(releasedError());
  }
  readyWaiters.clear();
  for (auto& waiter: closedWaiters) {
    waiter->reject(releasedError());
  }
  closedWaiters.clear();
  locked = false;
}

void WritableStream::resolveReadyWaiters() {
  for (auto& waiter: readyWaiters) {
    waiter->fulfill();
  }
  readyWaiters.clear();
}

void WritableStream::rejectReadyWaiters(const kj::Exception& reason) {
  for (auto& waiter: readyWaiters) {
    waiter->reject(kj::cp(reason));
  }
  readyWaiters.clear();
}

void WritableStream::finishClose() {
  for (auto& waiter: closedWaiters) {
    waiter->fulfill();
  }
  closedWaiters.clear();
}

void WritableStream::finishError(const kj::Exception& reason) {
  for (auto& waiter: closedWaiters) {
    waiter->reject(kj::cp(reason));
  }
  closedWaiters.clear();
}

// ======================================================================================
// WritableStreamDefaultWriter

WritableStreamDefaultWriter::WritableStreamDefaultWriter(kj::Own<WritableStream> stream) {
  stream->lock();
  this->stream = kj::mv(stream);
}

WritableStreamDefaultWriter::~WritableStreamDefaultWriter() noexcept(false) {
  releaseLock();
}

kj::Promise<void> WritableStreamDefaultWriter::write(Chunk chunk) {
  KJ_IF_SOME(s, stream) {
    return s->write(kj::mv(chunk));
  }
  return releasedError();
}

kj::Promise<void> WritableStreamDefaultWriter::close() {
  KJ_IF_SOME(s, stream) {
    if (s->isCloseQueuedOrInFlight()) {
      return RILL_KJ_EXCEPTION(
          FAILED, TypeError, "Cannot close a WritableStream that is already being closed.");
    }
    return s->closeInternal();
  }
  return releasedError();
}

kj::Promise<void> WritableStreamDefaultWriter::abort(kj::Maybe<kj::Exception> reason) {
  KJ_IF_SOME(s, stream) {
    return s->abortInternal(reasonOrAbortError(kj::mv(reason)));
  }
  return releasedError();
}

void WritableStreamDefaultWriter::releaseLock() {
  KJ_IF_SOME(s, stream) {
    s->releaseLock();
    stream = kj::none;
  }
}

kj::Maybe<ssize_t> WritableStreamDefaultWriter::getDesiredSize() {
  auto& s = RILL_REQUIRE_NONNULL(
      stream, TypeError, "This WritableStream writer has been released.");
  return s->getDesiredSize();
}

kj::Promise<void> WritableStreamDefaultWriter::ready() {
  KJ_IF_SOME(s, stream) {
    return s->whenReady();
  }
  return releasedError();
}

kj::Promise<void> WritableStreamDefaultWriter::closed() {
  KJ_IF_SOME(s, stream) {
    return s->whenClosed();
  }
  return releasedError();
}

}  // namespace rill
