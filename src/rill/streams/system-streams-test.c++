// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "system-streams.h"

#include <kj/test.h>

namespace rill {
namespace {

class MemoryAsyncInputStream final: public kj::AsyncInputStream {
 public:
  MemoryAsyncInputStream(kj::ArrayPtr<const kj::byte> data, bool& destroyed)
      : data(data),
        destroyed(destroyed) {}
  ~MemoryAsyncInputStream() noexcept(false) {
    destroyed = true;
  }

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    if (shouldFailRead) {
      return KJ_EXCEPTION(DISCONNECTED, "Mock read failure");
    }
    auto dest = kj::arrayPtr(static_cast<kj::byte*>(buffer), maxBytes);
    size_t amount = kj::min(dest.size(), data.size());
    dest.first(amount).copyFrom(data.first(amount));
    data = data.slice(amount);
    ++readCallCount;
    return amount;
  }

  uint32_t readCallCount = 0;
  bool shouldFailRead = false;

 private:
  kj::ArrayPtr<const kj::byte> data;
  bool& destroyed;
};

// An input stream whose reads never complete.
class StalledAsyncInputStream final: public kj::AsyncInputStream {
 public:
  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    return kj::NEVER_DONE;
  }
};

class MemoryAsyncOutputStream final: public kj::AsyncOutputStream {
 public:
  explicit MemoryAsyncOutputStream(kj::Vector<kj::byte>& data): data(data) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override {
    if (shouldFailWrite) {
      return KJ_EXCEPTION(DISCONNECTED, "Mock write failure");
    }
    data.addAll(buffer);
    return kj::READY_NOW;
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto piece: pieces) {
      data.addAll(piece);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return kj::NEVER_DONE;
  }

  bool shouldFailWrite = false;

 private:
  kj::Vector<kj::byte>& data;
};

KJ_TEST("system readable stream yields the input in chunks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  bool destroyed = false;
  auto stream = newSystemReadableStream(
      kj::heap<MemoryAsyncInputStream>("hello world"_kjb, destroyed), 4);
  KJ_EXPECT(stream->isByteStream());

  auto reader = stream->getReader();
  kj::Vector<kj::String> chunks;
  while (true) {
    auto result = reader->read().wait(ws);
    if (result.done) break;
    auto& chunk = KJ_ASSERT_NONNULL(result.value);
    KJ_EXPECT(chunk.isBytes());
    chunks.add(kj::str(chunk.asBytes().asChars()));
  }

  KJ_ASSERT(chunks.size() == 3);
  KJ_EXPECT(chunks[0] == "hell");
  KJ_EXPECT(chunks[1] == "o wo");
  KJ_EXPECT(chunks[2] == "rld");
  KJ_EXPECT(stream->isClosed());
}

KJ_TEST("system readable stream fills BYOB reads") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  bool destroyed = false;
  auto stream =
      newSystemReadableStream(kj::heap<MemoryAsyncInputStream>("abcdef"_kjb, destroyed));
  auto reader = stream->getByobReader();

  kj::byte buffer[4];
  auto result = reader->read(kj::arrayPtr(buffer, 4)).wait(ws);
  KJ_EXPECT(!result.done);
  KJ_EXPECT(result.bytesRead == 4);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 4) == "abcd"_kjb);

  result = reader->read(kj::arrayPtr(buffer, 4)).wait(ws);
  KJ_EXPECT(result.bytesRead == 2);
  KJ_EXPECT(kj::ArrayPtr<kj::byte>(buffer, 2) == "ef"_kjb);

  result = reader->read(kj::arrayPtr(buffer, 4)).wait(ws);
  KJ_EXPECT(result.done);
  KJ_EXPECT(result.bytesRead == 0);
}

KJ_TEST("system readable stream errors when a read fails") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  bool destroyed = false;
  auto input = kj::heap<MemoryAsyncInputStream>("data"_kjb, destroyed);
  input->shouldFailRead = true;
  auto stream = newSystemReadableStream(kj::mv(input));
  auto reader = stream->getReader();

  KJ_EXPECT_THROW_MESSAGE("Mock read failure", reader->read().wait(ws));
  KJ_EXPECT(stream->getStoredError() != kj::none);
}

KJ_TEST("canceling a system readable stream drops the input") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  bool destroyed = false;
  auto stream =
      newSystemReadableStream(kj::heap<MemoryAsyncInputStream>("data"_kjb, destroyed));
  KJ_EXPECT(!destroyed);

  stream->cancel().wait(ws);
  KJ_EXPECT(destroyed);
  KJ_EXPECT(stream->isClosed());
}

KJ_TEST("canceling a system readable stream interrupts a pending read") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto stream = newSystemReadableStream(kj::heap<StalledAsyncInputStream>());
  auto reader = stream->getReader();
  auto read = reader->read();
  ws.poll();
  KJ_EXPECT(!read.poll(ws));

  reader->cancel().wait(ws);
  auto result = read.wait(ws);
  KJ_EXPECT(result.done);
}

KJ_TEST("system writable stream writes bytes and strings") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Vector<kj::byte> data;
  auto stream = newSystemWritableStream(kj::heap<MemoryAsyncOutputStream>(data));
  auto writer = stream->getWriter();

  writer->write(Chunk::copyOf("ab"_kjb)).wait(ws);
  writer->write(Chunk("cd")).wait(ws);
  writer->write(Chunk::copyOf(nullptr)).wait(ws);
  writer->close().wait(ws);

  KJ_EXPECT(data.asPtr() == "abcd"_kjb);
  KJ_EXPECT(stream->isClosed());
}

KJ_TEST("system writable stream rejects chunks that are not bytes") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Vector<kj::byte> data;
  auto stream = newSystemWritableStream(kj::heap<MemoryAsyncOutputStream>(data));
  auto writer = stream->getWriter();

  KJ_EXPECT_THROW_MESSAGE("rill.TypeError", writer->write(Chunk(42)).wait(ws));
  KJ_EXPECT(stream->getStoredError() != kj::none);
  KJ_EXPECT(data.size() == 0);
}

KJ_TEST("system writable stream errors when a write fails") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Vector<kj::byte> data;
  auto output = kj::heap<MemoryAsyncOutputStream>(data);
  output->shouldFailWrite = true;
  auto stream = newSystemWritableStream(kj::mv(output));
  auto writer = stream->getWriter();

  KJ_EXPECT_THROW_MESSAGE("Mock write failure", writer->write(Chunk("x")).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("Mock write failure", writer->closed().wait(ws));
}

KJ_TEST("piping between system streams over a KJ pipe") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto pipe = kj::newTwoWayPipe();
  auto dest = newSystemWritableStream(kj::mv(pipe.ends[0]));
  auto source = newSystemReadableStream(kj::mv(pipe.ends[1]));

  auto chunks = ReadableStream::from(kj::arr(Chunk("ping"), Chunk::copyOf("pong"_kjb)));
  auto pumped = chunks->pipeTo(*dest);

  auto reader = source->getReader();
  kj::Vector<kj::byte> received;
  while (true) {
    auto result = reader->read().wait(ws);
    if (result.done) break;
    received.addAll(KJ_ASSERT_NONNULL(result.value).asBytes());
  }

  pumped.wait(ws);
  KJ_EXPECT(received.asPtr() == "pingpong"_kjb);
  KJ_EXPECT(dest->isClosed());
}

KJ_TEST("teeing a system readable stream fed by a pipe") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto pipe = kj::newOneWayPipe();
  auto stream = newSystemReadableStream(kj::mv(pipe.in));
  auto tee = stream->tee();
  auto reader1 = tee.branch1->getReader();
  auto reader2 = tee.branch2->getReader();

  for (auto word: {"one"_kj, "two"_kj, "three"_kj}) {
    auto read1 = reader1->read();
    auto read2 = reader2->read();
    ws.poll();
    KJ_EXPECT(!read1.poll(ws));
    KJ_EXPECT(!read2.poll(ws));

    pipe.out->write(word.asBytes()).wait(ws);
    auto result1 = read1.wait(ws);
    auto result2 = read2.wait(ws);
    KJ_EXPECT(KJ_ASSERT_NONNULL(result1.value).asBytes() == word.asBytes());
    KJ_EXPECT(KJ_ASSERT_NONNULL(result2.value).asBytes() == word.asBytes());
  }

  pipe.out = nullptr;
  KJ_EXPECT(reader1->read().wait(ws).done);
  KJ_EXPECT(reader2->read().wait(ws).done);
}

}  // namespace
}  // namespace rill
