// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "abort.h"
#include "common.h"

#include <kj/vector.h>

#include <deque>

namespace rill {

// The capability handed to the hooks of an underlying sink. It also owns the writable state
// machine: writes are queued here and handed to the sink one at a time, in order.
//
// States:
//   writable -> closed              (close() once every queued write has been processed)
//   writable -> erroring -> errored (abort(), error(), or a failed sink hook)
//
// A stream stays in the erroring state until the write or close that is in flight has settled.
// Only then are queued writes rejected and the sink's abort hook run.
class WritableStreamDefaultController final: public kj::Refcounted {
 public:
  using StartAlgorithm = UnderlyingSink::StartAlgorithm;
  using WriteAlgorithm = UnderlyingSink::WriteAlgorithm;
  using CloseAlgorithm = UnderlyingSink::CloseAlgorithm;
  using AbortAlgorithm = UnderlyingSink::AbortAlgorithm;

  WritableStreamDefaultController(
      WritableStream& stream, UnderlyingSink sink, QueuingStrategy strategy);
  KJ_DISALLOW_COPY_AND_MOVE(WritableStreamDefaultController);

  // Errors the stream unless it is already erroring, errored or closed. The sink's abort hook is
  // not called.
  void error(kj::Exception reason);

  // Aborted when the stream is aborted, with the abort reason. Sinks can use it to interrupt a
  // write that is in progress.
  AbortSignal& getSignal() {
    return abortController.getSignal();
  }

 private:
  struct Algorithms: public kj::Refcounted {
    kj::Maybe<kj::Function<StartAlgorithm>> start;
    kj::Maybe<kj::Function<WriteAlgorithm>> write;
    kj::Maybe<kj::Function<CloseAlgorithm>> close;
    kj::Maybe<kj::Function<AbortAlgorithm>> abort;
    kj::Maybe<kj::Function<QueuingStrategy::SizeAlgorithm>> size;
  };

  struct WriteRequest {
    kj::Own<kj::PromiseFulfiller<void>> fulfiller;
    Chunk value;
    size_t size;
  };

  struct PendingAbort {
    kj::Own<kj::PromiseFulfiller<void>> fulfiller;
    kj::ForkedPromise<void> promise;
    // When the stream was already erroring at the time of the abort, the abort hook is not run
    // and the abort promise rejects with the stored error.
    bool reject;
  };

  struct Writable {};

  WritableStream& stream;
  AbortController abortController;
  kj::OneOf<StreamStates::Closed, StreamStates::Errored, StreamStates::Erroring, Writable> state =
      Writable();
  kj::Maybe<kj::Own<Algorithms>> algorithms;
  bool started = false;
  bool backpressure = false;
  bool warnAboutExcessiveBackpressure = true;
  size_t highWaterMark;

  std::deque<WriteRequest> writeRequests;
  size_t amountBuffered = 0;

  kj::Maybe<WriteRequest> inFlightWrite;
  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> inFlightClose;
  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> closeRequest;
  kj::Maybe<PendingAbort> maybePendingAbort;

  void start();
  kj::Promise<void> write(Chunk value);
  kj::Promise<void> close();
  kj::Promise<void> abort(kj::Exception reason);

  void advanceQueueIfNeeded();
  void dealWithRejection(kj::Exception reason);
  void doClose();
  void finishErroring();
  void finishInFlightClose(kj::Maybe<kj::Exception> maybeReason = kj::none);
  void finishInFlightWrite(kj::Maybe<kj::Exception> maybeReason = kj::none);
  void rejectCloseAndClosedPromiseIfNeeded();

  // Puts the stream into the erroring state. Any in-flight write or close is allowed to settle
  // before the stream is actually errored.
  void startErroring(kj::Exception reason);

  // Recomputes backpressure after the amount of buffered data changed. Writers waiting on ready()
  // are released once backpressure is relieved.
  void updateBackpressure();

  ssize_t getDesiredSize() {
    return static_cast<ssize_t>(highWaterMark) - static_cast<ssize_t>(amountBuffered);
  }

  bool isCloseQueuedOrInFlight() const {
    return closeRequest != kj::none || inFlightClose != kj::none;
  }

  bool isWritable() const {
    return state.is<Writable>();
  }

  friend class WritableStream;
};

class WritableStream final: public kj::Refcounted {
 public:
  // Use create().
  WritableStream() = default;
  KJ_DISALLOW_COPY_AND_MOVE(WritableStream);

  // The high water mark defaults to 1 and every chunk counts as 1 unless the strategy supplies a
  // size algorithm.
  static kj::Own<WritableStream> create(
      UnderlyingSink sink = UnderlyingSink(), QueuingStrategy strategy = QueuingStrategy());

  bool isLocked() const {
    return locked;
  }

  bool isWritable() const {
    return controller->isWritable();
  }

  bool isErroring() const {
    return controller->state.is<StreamStates::Erroring>();
  }

  bool isClosed() const {
    return controller->state.is<StreamStates::Closed>();
  }

  bool isCloseQueuedOrInFlight() const {
    return controller->isCloseQueuedOrInFlight();
  }

  // The reason the stream is erroring or has errored.
  kj::Maybe<const kj::Exception&> getStoredError() const;

  // Aborts the stream. Rejects with a TypeError if the stream is locked.
  kj::Promise<void> abort(kj::Maybe<kj::Exception> reason = kj::none);

  // Closes the stream once every queued write has been processed. Rejects with a TypeError if the
  // stream is locked, closed or closing.
  kj::Promise<void> close();

  // Throws a TypeError if the stream is already locked.
  kj::Own<WritableStreamDefaultWriter> getWriter();

 private:
  kj::Own<WritableStreamDefaultController> controller;
  bool locked = false;

  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> readyWaiters;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> closedWaiters;

  kj::Promise<void> write(Chunk value);
  kj::Promise<void> abortInternal(kj::Exception reason);
  kj::Promise<void> closeInternal();
  kj::Promise<void> whenReady();
  kj::Promise<void> whenClosed();
  kj::Maybe<ssize_t> getDesiredSize();

  void lock();
  void releaseLock();

  void resolveReadyWaiters();
  void rejectReadyWaiters(const kj::Exception& reason);
  void finishClose();
  void finishError(const kj::Exception& reason);

  friend class WritableStreamDefaultController;
  friend class WritableStreamDefaultWriter;
};

class WritableStreamDefaultWriter final {
 public:
  // Locks the stream. Throws a TypeError if it is already locked.
  explicit WritableStreamDefaultWriter(kj::Own<WritableStream> stream);
  ~WritableStreamDefaultWriter() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(WritableStreamDefaultWriter);

  // Queues a chunk. The promise settles once the sink has processed the chunk. Backpressure is
  // signaled through ready() and getDesiredSize(), not through this promise.
  kj::Promise<void> write(Chunk chunk);

  kj::Promise<void> close();

  kj::Promise<void> abort(kj::Maybe<kj::Exception> reason = kj::none);

  // Unlocks the stream. Writes already queued still go to the sink. Releasing twice is a no-op.
  void releaseLock();

  // kj::none while the stream is erroring or errored, 0 once closed. Throws a TypeError once the
  // lock has been released.
  kj::Maybe<ssize_t> getDesiredSize();

  // Resolves when the stream is not applying backpressure. Rejects if the stream is erroring or
  // errored.
  kj::Promise<void> ready();

  // Resolves when the stream closes and rejects when it errors.
  kj::Promise<void> closed();

  bool isReleased() const {
    return stream == kj::none;
  }

 private:
  kj::Maybe<kj::Own<WritableStream>> stream;
};

}  // namespace rill
