// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "system-streams.h"

#include <kj/debug.h>

namespace rill {

namespace {

// State shared by the hooks of a system readable stream.
class SystemInput final: public kj::Refcounted {
 public:
  SystemInput(kj::Own<kj::AsyncInputStream> inner, size_t chunkSize)
      : inner(kj::mv(inner)),
        chunkSize(chunkSize) {}

  kj::Promise<void> pull(ReadableByteStreamController& controller) {
    auto& stream = KJ_UNWRAP_OR(inner, return kj::READY_NOW);

    // Reads land in a buffer we own rather than in the reader's view. A reader may abandon its
    // read while ours is still in flight, and the view goes away with it.
    auto buffer = kj::heapArray<kj::byte>(chunkSize);
    auto ptr = buffer.asPtr();
    return canceler.wrap(stream->tryRead(ptr.begin(), 1, ptr.size()))
        .then([&controller, buffer = kj::mv(buffer)](size_t amount) mutable {
      if (!controller.canCloseOrEnqueue()) return;
      if (amount == 0) {
        controller.close();
        return;
      }
      auto bytes = buffer.first(amount).attach(kj::mv(buffer));
      controller.enqueue(kj::mv(bytes));
    });
  }

  void cancel(kj::Exception reason) {
    canceler.cancel(kj::mv(reason));
    inner = kj::none;
  }

 private:
  kj::Maybe<kj::Own<kj::AsyncInputStream>> inner;
  size_t chunkSize;
  kj::Canceler canceler;
};

class SystemOutput final: public kj::Refcounted {
 public:
  explicit SystemOutput(kj::Own<kj::AsyncOutputStream> inner): inner(kj::mv(inner)) {}

  kj::Promise<void> write(Chunk chunk) {
    auto& stream = KJ_UNWRAP_OR(inner, {
      return RILL_KJ_EXCEPTION(FAILED, TypeError, "This output stream has already been closed.");
    });
    auto bytes = chunk.asBytes();
    if (bytes.size() == 0) return kj::READY_NOW;
    return canceler.wrap(stream->write(bytes)).attach(kj::mv(chunk));
  }

  kj::Promise<void> end() {
    KJ_IF_SOME(stream, inner) {
      if (auto casted = dynamic_cast<kj::AsyncIoStream*>(stream.get())) {
        casted->shutdownWrite();
      }
    }
    inner = kj::none;
    return kj::READY_NOW;
  }

  void abort(kj::Exception reason) {
    canceler.cancel(kj::mv(reason));
    inner = kj::none;
  }

 private:
  kj::Maybe<kj::Own<kj::AsyncOutputStream>> inner;
  kj::Canceler canceler;
};

}  // namespace

kj::Own<ReadableStream> newSystemReadableStream(
    kj::Own<kj::AsyncInputStream> inner, size_t chunkSize) {
  KJ_REQUIRE(chunkSize > 0);
  auto input = kj::refcounted<SystemInput>(kj::mv(inner), chunkSize);

  UnderlyingByteSource source;
  source.pull = [input = kj::addRef(*input)](ReadableByteStreamController& controller) mutable {
    return input->pull(controller);
  };
  source.cancel = [input = kj::mv(input)](kj::Exception reason) mutable -> kj::Promise<void> {
    input->cancel(kj::mv(reason));
    return kj::READY_NOW;
  };
  return ReadableStream::createBytes(kj::mv(source));
}

kj::Own<WritableStream> newSystemWritableStream(
    kj::Own<kj::AsyncOutputStream> inner, QueuingStrategy strategy) {
  auto output = kj::refcounted<SystemOutput>(kj::mv(inner));

  UnderlyingSink sink;
  sink.write = [output = kj::addRef(*output)](
                   Chunk chunk, WritableStreamDefaultController&) mutable {
    return output->write(kj::mv(chunk));
  };
  sink.close = [output = kj::addRef(*output)]() mutable { return output->end(); };
  sink.abort = [output = kj::mv(output)](kj::Exception reason) mutable -> kj::Promise<void> {
    output->abort(kj::mv(reason));
    return kj::READY_NOW;
  };
  return WritableStream::create(kj::mv(sink), kj::mv(strategy));
}

}  // namespace rill
