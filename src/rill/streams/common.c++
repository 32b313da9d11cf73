// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "common.h"

#include <kj/debug.h>
#include <kj/encoding.h>

namespace rill {

Chunk::Chunk(Value value): payload(kj::refcounted<Payload>(kj::mv(value))) {}

Chunk Chunk::copyOf(kj::ArrayPtr<const kj::byte> bytes) {
  return Chunk(kj::heapArray<kj::byte>(bytes));
}

Chunk Chunk::addRef() {
  return Chunk(kj::addRef(*payload));
}

Chunk Chunk::clone() const {
  KJ_SWITCH_ONEOF(payload->value) {
    KJ_CASE_ONEOF(undefined, Undefined) {
      return Chunk();
    }
    KJ_CASE_ONEOF(b, bool) {
      return Chunk(b);
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return Chunk(i);
    }
    KJ_CASE_ONEOF(d, double) {
      return Chunk(d);
    }
    KJ_CASE_ONEOF(str, kj::String) {
      return Chunk(kj::str(str));
    }
    KJ_CASE_ONEOF(bytes, Bytes) {
      return copyOf(bytes);
    }
  }
  KJ_UNREACHABLE;
}

kj::ArrayPtr<const kj::byte> Chunk::asBytes() const {
  KJ_IF_SOME(bytes, tryGet<Bytes>()) {
    return bytes;
  }
  KJ_IF_SOME(str, tryGet<kj::String>()) {
    return str.asBytes();
  }
  RILL_FAIL_REQUIRE(TypeError, "This chunk is not a byte sequence.");
}

size_t Chunk::byteLength() const {
  return asBytes().size();
}

bool Chunk::operator==(const Chunk& other) const {
  if (payload.get() == other.payload.get()) return true;

  KJ_SWITCH_ONEOF(payload->value) {
    KJ_CASE_ONEOF(undefined, Undefined) {
      return other.isUndefined();
    }
    KJ_CASE_ONEOF(b, bool) {
      KJ_IF_SOME(o, other.tryGet<bool>()) {
        return b == o;
      }
      return false;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      KJ_IF_SOME(o, other.tryGet<int64_t>()) {
        return i == o;
      }
      return false;
    }
    KJ_CASE_ONEOF(d, double) {
      KJ_IF_SOME(o, other.tryGet<double>()) {
        return d == o;
      }
      return false;
    }
    KJ_CASE_ONEOF(str, kj::String) {
      KJ_IF_SOME(o, other.tryGet<kj::String>()) {
        return str == o;
      }
      return false;
    }
    KJ_CASE_ONEOF(bytes, Bytes) {
      KJ_IF_SOME(o, other.tryGet<Bytes>()) {
        return bytes.asPtr() == o.asPtr();
      }
      return false;
    }
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const Chunk& chunk) {
  KJ_SWITCH_ONEOF(chunk.getValue()) {
    KJ_CASE_ONEOF(undefined, Chunk::Undefined) {
      return kj::str("undefined");
    }
    KJ_CASE_ONEOF(b, bool) {
      return kj::str(b);
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return kj::str(i);
    }
    KJ_CASE_ONEOF(d, double) {
      return kj::str(d);
    }
    KJ_CASE_ONEOF(str, kj::String) {
      return kj::str('"', str, '"');
    }
    KJ_CASE_ONEOF(bytes, Chunk::Bytes) {
      return kj::str("bytes(", kj::encodeHex(bytes), ")");
    }
  }
  KJ_UNREACHABLE;
}

QueuingStrategy countQueuingStrategy(size_t highWaterMark) {
  return QueuingStrategy{
    .highWaterMark = highWaterMark,
    .size = kj::Function<QueuingStrategy::SizeAlgorithm>([](const Chunk&) -> size_t { return 1; }),
  };
}

QueuingStrategy byteLengthQueuingStrategy(size_t highWaterMark) {
  return QueuingStrategy{
    .highWaterMark = highWaterMark,
    .size = kj::Function<QueuingStrategy::SizeAlgorithm>(
        [](const Chunk& chunk) -> size_t { return chunk.byteLength(); }),
  };
}

void logDetachedFailure(kj::Exception&& exception) {
  KJ_LOG(ERROR, "unexpected failure in a detached stream continuation", exception);
}

}  // namespace rill
