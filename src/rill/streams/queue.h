// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "common.h"

#include <deque>

namespace rill {

// ============================================================================
// Queues
//
// There are two kinds of queues used internally by ReadableStream and WritableStream: value
// queues and byte queues. Both operate in generally the same way:
//
//  - Every queue has a high water mark. This is the maximum amount of data that should be stored
//    in the queue pending consumption before backpressure is signaled. Additional data can always
//    be pushed into the queue beyond the high water mark, but producers are expected to stop
//    producing once it is reached.
//
//  - Every entry has a calculated size. For value queues the size is computed by the stream's
//    size algorithm when the entry is pushed (1 when there is none). For byte queues the size is
//    the number of unconsumed bytes in the entry.
//
//  - The queue size is the sum of the sizes of all entries still in the queue. The desired size
//    is the high water mark minus the queue size, and backpressure is signaled when the desired
//    size is zero or negative.
//
//  - A queue is open until it is closed or errored. Pushing into a closed or errored queue is a
//    contract violation and throws. Entries pushed before close() remain readable; error() drops
//    them.
//
// A queue knows nothing about readers or pending reads; the stream controllers that own the
// queues are responsible for those.

class QueueBase {
 public:
  // The sum of the sizes of all queued entries.
  size_t size() const {
    return totalSize;
  }

  size_t highWaterMark() const {
    return hwm;
  }

  // The amount of data the queue needs until it is considered full. The value can be zero or
  // negative, in which case backpressure is signaled. A closed or errored queue reports 0.
  ssize_t desiredSize() const {
    return isOpen() ? static_cast<ssize_t>(hwm) - static_cast<ssize_t>(totalSize) : 0;
  }

  bool isOpen() const {
    return state.is<Open>();
  }

  bool isClosed() const {
    return state.is<StreamStates::Closed>();
  }

  kj::Maybe<const kj::Exception&> getError() const {
    return state.tryGet<StreamStates::Errored>();
  }

 protected:
  explicit QueueBase(size_t highWaterMark): hwm(highWaterMark) {}

  void requireOpen() const {
    KJ_REQUIRE(isOpen(), "The queue is closed or errored.");
  }

  struct Open {};

  size_t hwm;
  size_t totalSize = 0;
  kj::OneOf<Open, StreamStates::Closed, StreamStates::Errored> state = Open();
};

class ValueQueue final: public QueueBase {
 public:
  struct Entry {
    Chunk value;
    size_t size;
  };

  explicit ValueQueue(size_t highWaterMark): QueueBase(highWaterMark) {}
  ValueQueue(ValueQueue&&) = default;
  ValueQueue& operator=(ValueQueue&&) = default;

  void push(Chunk value, size_t size);

  // Removes and returns the entry at the head of the queue. The queue must not be empty.
  Entry pop();

  kj::Maybe<const Entry&> peek() const;

  bool empty() const {
    return entries.empty();
  }

  size_t entryCount() const {
    return entries.size();
  }

  // Seals the queue. Entries already queued remain available to pop().
  void close();

  // Seals the queue and drops all queued entries.
  void error(kj::Exception reason);

  // Drops all queued entries without sealing the queue.
  void reset();

 private:
  std::deque<Entry> entries;
};

class ByteQueue final: public QueueBase {
 public:
  explicit ByteQueue(size_t highWaterMark): QueueBase(highWaterMark) {}
  ByteQueue(ByteQueue&&) = default;
  ByteQueue& operator=(ByteQueue&&) = default;

  // Appends a run of bytes. Empty runs are ignored.
  void push(kj::Array<kj::byte> bytes);

  // Copies as many bytes as fit into dest, consuming entries (partially, if necessary) in order.
  // Returns the number of bytes copied.
  size_t consumeInto(kj::ArrayPtr<kj::byte> dest);

  // Removes and returns whatever remains of the entry at the head of the queue. The queue must
  // not be empty.
  kj::Array<kj::byte> popEntry();

  bool empty() const {
    return entries.empty();
  }

  void close();
  void error(kj::Exception reason);
  void reset();

 private:
  struct Entry {
    kj::Array<kj::byte> data;
    // Number of bytes at the front of data that have already been consumed.
    size_t offset = 0;

    size_t remaining() const {
      return data.size() - offset;
    }
  };

  std::deque<Entry> entries;
};

}  // namespace rill
