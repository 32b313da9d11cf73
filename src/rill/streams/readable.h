// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "common.h"
#include "queue.h"

#include <kj/vector.h>

namespace rill {

class ReadableStreamBYOBRequest;
class ReadableStreamAsyncIterator;
class ReaderImpl;
struct TeeState;

struct ByobReadOptions {
  // The read does not settle until at least this many bytes have been written into the view, or
  // the stream closes. Must be at least 1 and no larger than the view.
  size_t min = 1;
};

struct ValuesOptions {
  // When true, abandoning the iterator early releases the lock without canceling the stream.
  bool preventCancel = false;
};

// ======================================================================================
// ReadableImpl
//
// The parts of the readable stream controller state machine that are shared by the default
// (value-oriented) and the byte-oriented controllers: the start/pull/cancel algorithms, the
// pull loop, and the close/error bookkeeping. Self is the owning controller, Queue the queue type
// it buffers into.
template <typename Self, typename Queue>
class ReadableImpl {
 public:
  using StartAlgorithm = kj::Promise<void>(Self&);
  using PullAlgorithm = kj::Promise<void>(Self&);
  using CancelAlgorithm = kj::Promise<void>(kj::Exception reason);

  ReadableImpl(Self& self,
      ReadableStream& stream,
      kj::Maybe<kj::Function<StartAlgorithm>> start,
      kj::Maybe<kj::Function<PullAlgorithm>> pull,
      kj::Maybe<kj::Function<CancelAlgorithm>> cancel,
      kj::Maybe<kj::Function<QueuingStrategy::SizeAlgorithm>> size,
      size_t highWaterMark);

  // Invokes the start algorithm. The pull algorithm is not invoked until start settles.
  void start();

  // Runs the cancel algorithm exactly once. The stream itself has already been closed.
  kj::Promise<void> cancel(kj::Exception reason);

  // True if the stream is readable and close has not already been requested.
  bool canCloseOrEnqueue();

  // Invokes the pull algorithm if the stream needs data and no pull is already in flight. A pull
  // requested while one is in flight is remembered and issued once the current one settles.
  void pullIfNeeded();

  bool shouldCallPull();

  // Called after a read took data out of the queue. Finishes a requested close once the queue is
  // drained, otherwise asks the source for more.
  void afterDequeue();

  // Seals the queue and closes the stream. Pending reads resolve as done.
  void doClose();

  // If the stream is still readable, errors it. All pending and future reads reject with reason.
  void doError(kj::Exception reason);

  // A negative value means the queue is above the high water mark. kj::none once errored.
  kj::Maybe<ssize_t> getDesiredSize();

  size_t sizeOf(const Chunk& chunk);

  Queue queue;

 private:
  struct Algorithms: public kj::Refcounted {
    kj::Maybe<kj::Function<StartAlgorithm>> start;
    kj::Maybe<kj::Function<PullAlgorithm>> pull;
    kj::Maybe<kj::Function<CancelAlgorithm>> cancel;
    kj::Maybe<kj::Function<QueuingStrategy::SizeAlgorithm>> size;
  };

  Self& self;
  ReadableStream& stream;

  // Cleared once the stream reaches a terminal state. Anything the source captured (including
  // references back to this stream) is released at that point.
  kj::Maybe<kj::Own<Algorithms>> algorithms;

  bool started = false;
  bool pulling = false;
  bool pullAgain = false;
  bool closeRequested = false;

  friend Self;
};

// ======================================================================================
// Controllers

// The capability handed to the hooks of a value-oriented underlying source.
class ReadableStreamDefaultController final: public kj::Refcounted {
 public:
  ReadableStreamDefaultController(
      ReadableStream& stream, UnderlyingSource source, QueuingStrategy strategy);
  KJ_DISALLOW_COPY_AND_MOVE(ReadableStreamDefaultController);

  // Queues a chunk, or hands it directly to a pending read. Throws a TypeError if the stream is
  // closed, errored, or close has already been requested. If the size algorithm throws, the
  // stream is errored and the exception rethrown.
  void enqueue(Chunk chunk);

  // Requests that the stream close once every queued chunk has been read.
  void close();

  void error(kj::Exception reason);

  kj::Maybe<ssize_t> getDesiredSize();

  bool canCloseOrEnqueue();

 private:
  ReadableStream& stream;
  ReadableImpl<ReadableStreamDefaultController, ValueQueue> impl;

  void start();
  kj::Promise<void> cancel(kj::Exception reason);
  kj::Promise<ReadResult> read();

  friend class ReadableStream;
  friend class ReadableImpl<ReadableStreamDefaultController, ValueQueue>;
};

// The capability handed to the hooks of a byte-oriented underlying source.
class ReadableByteStreamController final: public kj::Refcounted {
 public:
  ReadableByteStreamController(
      ReadableStream& stream, UnderlyingByteSource source, size_t highWaterMark);
  ~ReadableByteStreamController() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(ReadableByteStreamController);

  // Queues bytes, or copies them into a pending read. Zero-length chunks are a TypeError.
  void enqueue(kj::Array<kj::byte> bytes);

  void close();

  void error(kj::Exception reason);

  kj::Maybe<ssize_t> getDesiredSize();

  bool canCloseOrEnqueue();

  // When a read is waiting for data and the source can write into the reader's buffer directly,
  // returns a request that exposes that buffer. The same request is returned until it is
  // responded to, or until enqueue(), close() or error() invalidate it.
  kj::Maybe<kj::Own<ReadableStreamBYOBRequest>> getByobRequest();

 private:
  ReadableStream& stream;
  ReadableImpl<ReadableByteStreamController, ByteQueue> impl;
  kj::Maybe<size_t> autoAllocateChunkSize;
  kj::Maybe<kj::Own<ReadableStreamBYOBRequest>> maybeByobRequest;

  void start();
  kj::Promise<void> cancel(kj::Exception reason);
  kj::Promise<ReadResult> read();
  kj::Promise<ByobReadResult> readInto(kj::ArrayPtr<kj::byte> view, size_t min);
  void respond(size_t bytesWritten);
  void invalidateByobRequest();

  // The unfilled part of the pending read's buffer, when the source can write into it directly.
  kj::Maybe<kj::ArrayPtr<kj::byte>> pendingView();

  friend class ReadableStream;
  friend class ReadableStreamBYOBRequest;
  friend class ReadableImpl<ReadableByteStreamController, ByteQueue>;
};

// A view onto the buffer of a read that is waiting on a byte source. The source writes into
// getView() and then calls respond() with the number of bytes written.
class ReadableStreamBYOBRequest final: public kj::Refcounted {
 public:
  explicit ReadableStreamBYOBRequest(ReadableByteStreamController& controller)
      : controller(controller) {}

  // kj::none once the request has been invalidated.
  kj::Maybe<kj::ArrayPtr<kj::byte>> getView();

  // Throws a TypeError if the request was invalidated or bytesWritten is zero, and a RangeError if
  // bytesWritten exceeds the view.
  void respond(size_t bytesWritten);

  bool isInvalidated() const {
    return controller == kj::none;
  }

 private:
  kj::Maybe<ReadableByteStreamController&> controller;

  void invalidate() {
    controller = kj::none;
  }

  friend class ReadableByteStreamController;
};

// ======================================================================================
// ReadableStream

class ReadableStream final: public kj::Refcounted {
 public:
  using NextFunction = kj::Promise<kj::Maybe<Chunk>>();

  struct Tee {
    kj::Own<ReadableStream> branch1;
    kj::Own<ReadableStream> branch2;
  };

  // Use create(), createBytes() or from().
  ReadableStream() = default;
  KJ_DISALLOW_COPY_AND_MOVE(ReadableStream);

  // A value-oriented stream. The high water mark defaults to 1 and every chunk counts as 1
  // unless the strategy supplies a size algorithm.
  static kj::Own<ReadableStream> create(
      UnderlyingSource source = UnderlyingSource(), QueuingStrategy strategy = QueuingStrategy());

  // A byte-oriented stream. The high water mark is a byte count.
  static kj::Own<ReadableStream> createBytes(
      UnderlyingByteSource source = UnderlyingByteSource(), size_t highWaterMark = 0);

  // A stream that yields the given chunks, in order, then closes.
  static kj::Own<ReadableStream> from(kj::Array<Chunk> chunks);

  // A stream that pulls each chunk from the given function. The stream closes when the function
  // produces kj::none, and errors if the function fails.
  static kj::Own<ReadableStream> from(kj::Function<NextFunction> next);

  bool isLocked() const {
    return locked;
  }

  // True once anything has read from or canceled the stream.
  bool isDisturbed() const {
    return disturbed;
  }

  bool isByteStream() const {
    return controller.is<kj::Own<ReadableByteStreamController>>();
  }

  bool isReadable() const {
    return state.is<Readable>();
  }

  bool isClosed() const {
    return state.is<StreamStates::Closed>();
  }

  kj::Maybe<const kj::Exception&> getStoredError() const {
    return state.tryGet<StreamStates::Errored>();
  }

  // Cancels the stream. Rejects with a TypeError if the stream is locked. The underlying source's
  // cancel hook runs at most once no matter how many times the stream is canceled.
  kj::Promise<void> cancel(kj::Maybe<kj::Exception> reason = kj::none);

  // Throws a TypeError if the stream is already locked.
  kj::Own<ReadableStreamDefaultReader> getReader();

  // Throws a TypeError if the stream is locked or is not a byte stream.
  kj::Own<ReadableStreamBYOBReader> getByobReader();

  // Locks this stream and returns two branches that each yield every chunk. Canceling both
  // branches cancels this stream.
  Tee tee();

  // Locks this stream and returns an iterator over its chunks.
  kj::Own<ReadableStreamAsyncIterator> values(ValuesOptions options = ValuesOptions());

  kj::Promise<void> pipeTo(WritableStream& destination, PipeToOptions options = PipeToOptions());

  kj::Own<ReadableStream> pipeThrough(
      TransformStream& transform, PipeToOptions options = PipeToOptions());

 private:
  struct Readable {};

  struct ReadRequest {
    kj::Own<kj::PromiseFulfiller<ReadResult>> fulfiller;
    // For byte streams with an autoAllocateChunkSize, the buffer the source fills.
    kj::Maybe<kj::Array<kj::byte>> buffer;
    size_t filled = 0;
  };

  struct ByobReadRequest {
    kj::Own<kj::PromiseFulfiller<ByobReadResult>> fulfiller;
    kj::ArrayPtr<kj::byte> view;
    size_t filled = 0;
    size_t min = 1;
  };

  using PendingRead = kj::OneOf<ReadRequest, ByobReadRequest>;

  kj::OneOf<Readable, StreamStates::Closed, StreamStates::Errored> state = Readable();
  kj::OneOf<kj::Own<ReadableStreamDefaultController>, kj::Own<ReadableByteStreamController>>
      controller;

  bool locked = false;
  bool disturbed = false;

  // At most one read is pending at a time.
  kj::Maybe<PendingRead> pendingRead;

  // Fulfillers for the current reader's closed() promises.
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> closedWaiters;

  // True if a read is pending and its caller is still waiting for it.
  bool hasPendingRead();

  kj::Maybe<PendingRead&> getPendingRead();

  kj::Promise<ReadResult> read();
  kj::Promise<ByobReadResult> readInto(kj::ArrayPtr<kj::byte> view, size_t min);
  kj::Promise<void> cancelInternal(kj::Exception reason);
  kj::Promise<void> whenClosed();

  // Takes a new single-slot read request, or rejects if one is already pending.
  kj::Maybe<kj::Exception> checkNoPendingRead();

  void lock();
  void releaseLock();

  // Transitions to closed: pending reads resolve as done, closed() promises resolve.
  void finishClose();

  // Transitions to errored: pending reads and closed() promises reject with reason.
  void finishError(kj::Exception reason);

  ReadableStreamDefaultController& getDefaultController();
  ReadableByteStreamController& getByteController();

  friend class ReaderImpl;
  friend class ReadableStreamDefaultController;
  friend class ReadableByteStreamController;
  friend class ReadableStreamDefaultReader;
  friend class ReadableStreamBYOBReader;
  friend class ReadableImpl<ReadableStreamDefaultController, ValueQueue>;
  friend class ReadableImpl<ReadableByteStreamController, ByteQueue>;
  friend struct TeeState;
};

// ======================================================================================
// Readers

// The lock shared by both reader kinds. Holds a reference to the stream until released.
class ReaderImpl final {
 public:
  explicit ReaderImpl(kj::Own<ReadableStream> stream);
  ~ReaderImpl() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(ReaderImpl);

  // kj::none once the lock has been released.
  kj::Maybe<ReadableStream&> getStream();

  kj::Promise<void> cancel(kj::Maybe<kj::Exception> reason);

  // Resolves when the stream closes and rejects when it errors. Rejects with a TypeError once the
  // lock has been released.
  kj::Promise<void> closed();

  // Unlocks the stream. A read that is still pending rejects with a TypeError. Releasing twice is
  // a no-op.
  void releaseLock();

 private:
  kj::Maybe<kj::Own<ReadableStream>> stream;
};

class ReadableStreamDefaultReader final {
 public:
  // Locks the stream. Throws a TypeError if it is already locked.
  explicit ReadableStreamDefaultReader(kj::Own<ReadableStream> stream): impl(kj::mv(stream)) {}

  // Resolves with the next chunk, or with done once the stream is closed. At most one read may
  // be pending at a time; a second concurrent read rejects with a TypeError.
  kj::Promise<ReadResult> read();

  kj::Promise<void> cancel(kj::Maybe<kj::Exception> reason = kj::none) {
    return impl.cancel(kj::mv(reason));
  }

  kj::Promise<void> closed() {
    return impl.closed();
  }

  void releaseLock() {
    impl.releaseLock();
  }

  bool isReleased() {
    return impl.getStream() == kj::none;
  }

 private:
  ReaderImpl impl;
};

class ReadableStreamBYOBReader final {
 public:
  // Locks the stream. Throws a TypeError if it is already locked or not a byte stream.
  explicit ReadableStreamBYOBReader(kj::Own<ReadableStream> stream);

  // Fills view with bytes from the stream. The view must stay valid until the returned promise
  // settles or is dropped. Resolves once at least options.min bytes were written, or once the
  // stream closes (with whatever was written so far and done set).
  kj::Promise<ByobReadResult> read(
      kj::ArrayPtr<kj::byte> view, ByobReadOptions options = ByobReadOptions());

  kj::Promise<void> cancel(kj::Maybe<kj::Exception> reason = kj::none) {
    return impl.cancel(kj::mv(reason));
  }

  kj::Promise<void> closed() {
    return impl.closed();
  }

  void releaseLock() {
    impl.releaseLock();
  }

 private:
  ReaderImpl impl;
};

// ======================================================================================
// Async iteration

// A single-pass sequence over the chunks of a stream. The iterator holds the stream's lock until
// it is exhausted, canceled or destroyed. Destroying an unfinished iterator cancels the stream
// unless preventCancel was requested.
class ReadableStreamAsyncIterator final {
 public:
  ReadableStreamAsyncIterator(kj::Own<ReadableStream> stream, ValuesOptions options);
  ~ReadableStreamAsyncIterator() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(ReadableStreamAsyncIterator);

  // The next chunk, or kj::none once the stream is done. If the stream errors the promise rejects
  // and the iterator is finished.
  kj::Promise<kj::Maybe<Chunk>> next();

  // Finishes the iterator early, canceling the stream unless preventCancel was requested.
  kj::Promise<void> cancel(kj::Maybe<kj::Exception> reason = kj::none);

 private:
  kj::Maybe<kj::Own<ReadableStreamDefaultReader>> reader;
  bool preventCancel;
};

}  // namespace rill
