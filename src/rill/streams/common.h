// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <rill/util/errors.h>

#include <kj/async.h>
#include <kj/function.h>
#include <kj/one-of.h>
#include <kj/refcount.h>
#include <kj/string.h>

#include <sys/types.h>
#include <type_traits>

namespace rill {

class ReadableStream;
class ReadableStreamDefaultController;
class ReadableByteStreamController;
class ReadableStreamDefaultReader;
class ReadableStreamBYOBReader;

class WritableStream;
class WritableStreamDefaultController;
class WritableStreamDefaultWriter;

class TransformStream;
class TransformStreamDefaultController;

class AbortSignal;

// =======================================================================================
// Chunk
//
// A Chunk is the unit of data carried by a stream. Value streams may carry any kind of Chunk;
// byte streams carry only byte chunks. A Chunk is an immutable, reference counted value:
// addRef() hands out another reference to the same underlying data (this is how tee() delivers
// a single chunk to both branches without copying it), while clone() makes a deep copy.
class Chunk final {
 public:
  struct Undefined {};
  using Bytes = kj::Array<kj::byte>;
  using Value = kj::OneOf<Undefined, bool, int64_t, double, kj::String, Bytes>;

  Chunk(): Chunk(Value(Undefined())) {}
  explicit Chunk(Value value);
  explicit Chunk(bool value): Chunk(Value(value)) {}
  template <typename T,
      typename = kj::EnableIf<std::is_integral<T>::value && !kj::isSameType<T, bool>()>>
  Chunk(T value): Chunk(Value(static_cast<int64_t>(value))) {}
  Chunk(double value): Chunk(Value(value)) {}
  Chunk(kj::String value): Chunk(Value(kj::mv(value))) {}
  Chunk(kj::StringPtr value): Chunk(Value(kj::str(value))) {}
  Chunk(const char* value): Chunk(kj::StringPtr(value)) {}
  Chunk(Bytes value): Chunk(Value(kj::mv(value))) {}

  Chunk(Chunk&&) = default;
  Chunk& operator=(Chunk&&) = default;
  KJ_DISALLOW_COPY(Chunk);

  // Makes a byte chunk holding a copy of the given bytes.
  static Chunk copyOf(kj::ArrayPtr<const kj::byte> bytes);

  // Another reference to the same value.
  Chunk addRef();

  // A deep copy of the value.
  Chunk clone() const;

  template <typename T>
  bool is() const {
    return payload->value.is<T>();
  }

  template <typename T>
  const T& get() const {
    return payload->value.get<T>();
  }

  template <typename T>
  kj::Maybe<const T&> tryGet() const {
    return payload->value.tryGet<T>();
  }

  bool isUndefined() const {
    return is<Undefined>();
  }
  bool isBytes() const {
    return is<Bytes>();
  }

  // The chunk's bytes. Strings are viewed as their UTF-8 bytes. Any other kind of chunk is a
  // TypeError.
  kj::ArrayPtr<const kj::byte> asBytes() const;

  // The number of bytes asBytes() would return. Used by the byte length queuing strategy.
  size_t byteLength() const;

  bool operator==(const Chunk& other) const;

  const Value& getValue() const {
    return payload->value;
  }

 private:
  struct Payload final: public kj::Refcounted {
    explicit Payload(Value value): value(kj::mv(value)) {}
    Value value;
  };

  explicit Chunk(kj::Own<Payload> payload): payload(kj::mv(payload)) {}

  kj::Own<Payload> payload;
};

kj::String KJ_STRINGIFY(const Chunk& chunk);

// =======================================================================================

struct ReadResult {
  kj::Maybe<Chunk> value;
  bool done = false;
};

struct ByobReadResult {
  // The number of bytes that were written into the caller's buffer.
  size_t bytesRead = 0;
  bool done = false;
};

struct QueuingStrategy {
  using SizeAlgorithm = size_t(const Chunk&);

  kj::Maybe<size_t> highWaterMark;
  kj::Maybe<kj::Function<SizeAlgorithm>> size;
};

// Every chunk counts as exactly one against the high water mark.
QueuingStrategy countQueuingStrategy(size_t highWaterMark);

// Every chunk counts as its length in bytes against the high water mark.
QueuingStrategy byteLengthQueuingStrategy(size_t highWaterMark);

// The algorithms that a ReadableStream calls to initialize, pull from, and cancel a
// value-oriented underlying source. Every algorithm is optional; a missing algorithm behaves as
// one that immediately succeeds. An algorithm that throws is treated exactly like one that
// returns a rejected promise: the stream is errored with the exception.
struct UnderlyingSource {
  using StartAlgorithm = kj::Promise<void>(ReadableStreamDefaultController&);
  using PullAlgorithm = kj::Promise<void>(ReadableStreamDefaultController&);
  using CancelAlgorithm = kj::Promise<void>(kj::Exception reason);

  kj::Maybe<kj::Function<StartAlgorithm>> start;
  kj::Maybe<kj::Function<PullAlgorithm>> pull;
  kj::Maybe<kj::Function<CancelAlgorithm>> cancel;
};

// The byte-oriented variant of UnderlyingSource.
struct UnderlyingByteSource {
  using StartAlgorithm = kj::Promise<void>(ReadableByteStreamController&);
  using PullAlgorithm = kj::Promise<void>(ReadableByteStreamController&);
  using CancelAlgorithm = kj::Promise<void>(kj::Exception reason);

  // When set, a default-mode read() on the byte stream allocates a buffer of this size and
  // exposes it to the source as a BYOB request so that the source can fill it directly. Must be
  // greater than zero.
  kj::Maybe<size_t> autoAllocateChunkSize;

  kj::Maybe<kj::Function<StartAlgorithm>> start;
  kj::Maybe<kj::Function<PullAlgorithm>> pull;
  kj::Maybe<kj::Function<CancelAlgorithm>> cancel;
};

struct UnderlyingSink {
  using StartAlgorithm = kj::Promise<void>(WritableStreamDefaultController&);
  using WriteAlgorithm = kj::Promise<void>(Chunk chunk, WritableStreamDefaultController&);
  using CloseAlgorithm = kj::Promise<void>();
  using AbortAlgorithm = kj::Promise<void>(kj::Exception reason);

  kj::Maybe<kj::Function<StartAlgorithm>> start;
  kj::Maybe<kj::Function<WriteAlgorithm>> write;
  kj::Maybe<kj::Function<CloseAlgorithm>> close;
  kj::Maybe<kj::Function<AbortAlgorithm>> abort;
};

struct Transformer {
  using StartAlgorithm = kj::Promise<void>(TransformStreamDefaultController&);
  using TransformAlgorithm = kj::Promise<void>(Chunk chunk, TransformStreamDefaultController&);
  using FlushAlgorithm = kj::Promise<void>(TransformStreamDefaultController&);
  using CancelAlgorithm = kj::Promise<void>(kj::Exception reason);

  kj::Maybe<kj::Function<StartAlgorithm>> start;
  kj::Maybe<kj::Function<TransformAlgorithm>> transform;
  kj::Maybe<kj::Function<FlushAlgorithm>> flush;
  kj::Maybe<kj::Function<CancelAlgorithm>> cancel;
};

struct PipeToOptions {
  bool preventClose = false;
  bool preventAbort = false;
  bool preventCancel = false;
  // Aborting the signal shuts the pipe down: the source is canceled and the destination aborted
  // (unless prevented), and the pipe fails with the signal's reason.
  kj::Maybe<kj::Own<AbortSignal>> signal;
};

namespace StreamStates {
struct Closed {};
using Errored = kj::Exception;
struct Erroring {
  kj::Exception reason;

  explicit Erroring(kj::Exception reason): reason(kj::mv(reason)) {}
};
}  // namespace StreamStates

// Runs the named algorithm if it is present, converting a synchronous throw into a rejected
// promise. The algorithms object is kept alive until the returned promise settles so that an
// algorithm which clears the stream's algorithms (for instance by erroring the stream from
// inside pull()) does not destroy the function, or the state it captured, while it is running.
template <typename Algorithms, typename Func, typename... Params>
kj::Promise<void> maybeRunAlgorithm(kj::Maybe<kj::Own<Algorithms>>& maybeAlgorithms,
    kj::Maybe<kj::Function<Func>> Algorithms::*member,
    Params&&... params) {
  KJ_IF_SOME(algorithms, maybeAlgorithms) {
    auto ref = kj::addRef(*algorithms);
    KJ_IF_SOME(algorithm, (*ref).*member) {
      return kj::evalNow([&]() -> kj::Promise<void> {
        return algorithm(kj::fwd<Params>(params)...);
      }).attach(kj::mv(ref));
    }
  }
  return kj::READY_NOW;
}

// Error handler for promises detached by the engine. Every engine continuation routes expected
// failures into stream state, so anything arriving here is a bug.
void logDetachedFailure(kj::Exception&& exception);

}  // namespace rill
