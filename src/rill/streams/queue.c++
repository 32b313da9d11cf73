// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "queue.h"

#include <kj/debug.h>

namespace rill {

// ======================================================================================
// ValueQueue

void ValueQueue::push(Chunk value, size_t size) {
  requireOpen();
  totalSize += size;
  entries.push_back(Entry{
    .value = kj::mv(value),
    .size = size,
  });
}

ValueQueue::Entry ValueQueue::pop() {
  KJ_REQUIRE(!entries.empty(), "The queue is empty.");
  auto entry = kj::mv(entries.front());
  entries.pop_front();
  KJ_ASSERT(totalSize >= entry.size);
  totalSize -= entry.size;
  return kj::mv(entry);
}

kj::Maybe<const ValueQueue::Entry&> ValueQueue::peek() const {
  if (entries.empty()) return kj::none;
  return entries.front();
}

void ValueQueue::close() {
  if (isOpen()) {
    state.init<StreamStates::Closed>();
  }
}

void ValueQueue::error(kj::Exception reason) {
  if (isOpen()) {
    reset();
    state = kj::mv(reason);
  }
}

void ValueQueue::reset() {
  entries.clear();
  totalSize = 0;
}

// ======================================================================================
// ByteQueue

void ByteQueue::push(kj::Array<kj::byte> bytes) {
  requireOpen();
  if (bytes.size() == 0) return;
  totalSize += bytes.size();
  entries.push_back(Entry{.data = kj::mv(bytes)});
}

size_t ByteQueue::consumeInto(kj::ArrayPtr<kj::byte> dest) {
  size_t copied = 0;
  while (!entries.empty() && copied < dest.size()) {
    auto& entry = entries.front();
    auto amount = kj::min(entry.remaining(), dest.size() - copied);
    dest.slice(copied, copied + amount)
        .copyFrom(entry.data.slice(entry.offset, entry.offset + amount));
    entry.offset += amount;
    copied += amount;
    if (entry.remaining() == 0) {
      entries.pop_front();
    }
  }
  KJ_ASSERT(totalSize >= copied);
  totalSize -= copied;
  return copied;
}

kj::Array<kj::byte> ByteQueue::popEntry() {
  KJ_REQUIRE(!entries.empty(), "The queue is empty.");
  auto entry = kj::mv(entries.front());
  entries.pop_front();
  totalSize -= entry.remaining();
  if (entry.offset == 0) {
    return kj::mv(entry.data);
  }
  // Part of this entry was consumed by an earlier BYOB read. Hand out the rest without copying.
  auto rest = entry.data.slice(entry.offset, entry.data.size());
  return rest.attach(kj::mv(entry.data));
}

void ByteQueue::close() {
  if (isOpen()) {
    state.init<StreamStates::Closed>();
  }
}

void ByteQueue::error(kj::Exception reason) {
  if (isOpen()) {
    reset();
    state = kj::mv(reason);
  }
}

void ByteQueue::reset() {
  entries.clear();
  totalSize = 0;
}

}  // namespace rill
