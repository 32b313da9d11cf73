// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "readable.h"
#include "writable.h"

namespace rill {

// The capability handed to the hooks of a Transformer. It also couples the two sides of a
// TransformStream: every chunk written to the writable side is handed to the transform hook,
// whose output is enqueued on the readable side through this controller.
//
// The writable side only accepts its next chunk once the transform hook for the previous one has
// settled and the readable side has asked for more data. An error on either side errors both.
class TransformStreamDefaultController final: public kj::Refcounted {
 public:
  explicit TransformStreamDefaultController(Transformer transformer,
      kj::PromiseFulfillerPair<void> paf = kj::newPromiseAndFulfiller<void>());
  KJ_DISALLOW_COPY_AND_MOVE(TransformStreamDefaultController);

  // The desired size of the readable side, or kj::none once it has closed or errored.
  kj::Maybe<ssize_t> getDesiredSize();

  // Enqueues a chunk on the readable side. Throws a TypeError if the readable side is closed or
  // errored.
  void enqueue(Chunk chunk);

  // Errors both sides.
  void error(kj::Exception reason);

  // Closes the readable side and errors the writable side.
  void terminate();

 private:
  struct Algorithms: public kj::Refcounted {
    kj::Maybe<kj::Function<Transformer::StartAlgorithm>> start;
    kj::Maybe<kj::Function<Transformer::TransformAlgorithm>> transform;
    kj::Maybe<kj::Function<Transformer::FlushAlgorithm>> flush;
    kj::Maybe<kj::Function<Transformer::CancelAlgorithm>> cancel;
  };

  kj::Maybe<kj::Own<Algorithms>> algorithms;

  // Both sides wait on this before becoming active.
  kj::Own<kj::PromiseFulfiller<void>> startFulfiller;
  kj::ForkedPromise<void> startPromise;

  // Owns a reference to this controller on behalf of one side's hooks, and detaches that side
  // once the side releases its hooks.
  class SideRef;

  // Each side is referenced only while it holds its hooks, so neither side is kept alive by this
  // controller.
  kj::Maybe<ReadableStream&> readable;
  kj::Maybe<ReadableStreamDefaultController&> readableController;
  kj::Maybe<WritableStream&> writable;
  kj::Maybe<WritableStreamDefaultController&> writableController;

  // While true, writes wait for the readable side to pull before running the transform hook.
  bool backpressure = false;
  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> backpressureChangeFulfiller;
  kj::Maybe<kj::ForkedPromise<void>> backpressureChange;

  // The outcome of the cancel hook, shared by readable cancel and writable abort.
  kj::Maybe<kj::ForkedPromise<void>> maybeFinish;

  // Set once the writable side has been errored through this controller.
  kj::Maybe<kj::Exception> storedError;

  void start();
  kj::Promise<void> write(Chunk chunk);
  kj::Promise<void> abort(kj::Exception reason);
  kj::Promise<void> close();
  kj::Promise<void> pull();
  kj::Promise<void> cancel(kj::Exception reason);

  kj::Promise<void> performTransform(Chunk chunk);
  void setBackpressure(bool newBackpressure);
  void errorWritableAndUnblockWrite(kj::Exception reason);
  void detachReadable();
  void detachWritable();

  // The reason the readable side errored, if it did.
  kj::Maybe<kj::Exception> readableError();

  friend class TransformStream;
};

class TransformStream final: public kj::Refcounted {
 public:
  TransformStream(kj::Own<ReadableStream> readable, kj::Own<WritableStream> writable)
      : readable(kj::mv(readable)),
        writable(kj::mv(writable)) {}
  KJ_DISALLOW_COPY_AND_MOVE(TransformStream);

  // A transform stream driven by the given transformer. Without a transform hook every chunk is
  // passed through unchanged. The writable side's high water mark defaults to 1, the readable
  // side's to 0.
  static kj::Own<TransformStream> create(Transformer transformer = Transformer(),
      QueuingStrategy writableStrategy = QueuingStrategy(),
      QueuingStrategy readableStrategy = QueuingStrategy());

  // Passes every chunk through unchanged.
  static kj::Own<TransformStream> identity();

  ReadableStream& getReadable() {
    return *readable;
  }

  WritableStream& getWritable() {
    return *writable;
  }

 private:
  kj::Own<ReadableStream> readable;
  kj::Own<WritableStream> writable;
};

}  // namespace rill
