// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "compression.h"

#include "readable.h"
#include "writable.h"

#include <kj/test.h>

namespace rill {
namespace {

// "hello rill" in each of the supported formats.
const kj::byte DEFLATE_HELLO[] = {0x78, 0x9c, 0xcb, 0x48, 0xcd, 0xc9, 0xc9, 0x57, 0x28, 0xca, 0xcc,
  0xc9, 0x01, 0x00, 0x15, 0x7c, 0x03, 0xe8};
const kj::byte GZIP_HELLO[] = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x03, 0xcb,
  0x48, 0xcd, 0xc9, 0xc9, 0x57, 0x28, 0xca, 0xcc, 0xc9, 0x01, 0x00, 0x97, 0x78, 0x03, 0xcf, 0x0a,
  0x00, 0x00, 0x00};
const kj::byte RAW_HELLO[] = {
  0xcb, 0x48, 0xcd, 0xc9, 0xc9, 0x57, 0x28, 0xca, 0xcc, 0xc9, 0x01, 0x00};

template <size_t size>
kj::ArrayPtr<const kj::byte> bytesOf(const kj::byte (&data)[size]) {
  return kj::arrayPtr(data, size);
}

// Pipes the chunks through the transform and collects everything the readable side produces.
kj::Array<kj::byte> runThrough(
    kj::Own<TransformStream> transform, kj::Array<Chunk> input, kj::WaitScope& ws) {
  auto source = ReadableStream::from(kj::mv(input));
  auto output = source->pipeThrough(*transform);
  auto reader = output->getReader();
  kj::Vector<kj::byte> bytes;
  while (true) {
    auto result = reader->read().wait(ws);
    if (result.done) break;
    bytes.addAll(KJ_ASSERT_NONNULL(result.value).asBytes());
  }
  return bytes.releaseAsArray();
}

kj::Array<kj::byte> runThrough(
    kj::Own<TransformStream> transform, kj::ArrayPtr<const kj::byte> input, kj::WaitScope& ws) {
  return runThrough(kj::mv(transform), kj::arr(Chunk::copyOf(input)), ws);
}

KJ_TEST("decompression of known data") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto deflated = runThrough(newDecompressionStream("deflate"), bytesOf(DEFLATE_HELLO), ws);
  KJ_EXPECT(deflated.asPtr() == "hello rill"_kjb);
  auto gzipped = runThrough(newDecompressionStream("gzip"), bytesOf(GZIP_HELLO), ws);
  KJ_EXPECT(gzipped.asPtr() == "hello rill"_kjb);
  auto raw = runThrough(newDecompressionStream("deflate-raw"), bytesOf(RAW_HELLO), ws);
  KJ_EXPECT(raw.asPtr() == "hello rill"_kjb);
}

KJ_TEST("decompression accepts input split into single bytes") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto chunks = KJ_MAP(b, bytesOf(GZIP_HELLO)) { return Chunk::copyOf(kj::arrayPtr(&b, 1)); };
  auto output = runThrough(newDecompressionStream("gzip"), kj::mv(chunks), ws);
  KJ_EXPECT(output.asPtr() == "hello rill"_kjb);
}

KJ_TEST("compression round trips in every format") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Vector<kj::byte> text;
  for (auto i = 0; i < 2000; ++i) {
    text.addAll(kj::str("line ", i, " of some compressible text\n").asBytes());
  }

  for (auto format: {"gzip"_kj, "deflate"_kj, "deflate-raw"_kj}) {
    KJ_CONTEXT(format);
    auto compressed = runThrough(newCompressionStream(format), text.asPtr(), ws);
    KJ_EXPECT(compressed.size() > 0);
    KJ_EXPECT(compressed.size() < text.size());

    auto restored = runThrough(newDecompressionStream(format), compressed.asPtr(), ws);
    KJ_EXPECT(restored.asPtr() == text.asPtr());
  }
}

KJ_TEST("compressing nothing still produces a valid stream") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto compressed = runThrough(newCompressionStream("gzip"), kj::Array<Chunk>(), ws);
  KJ_EXPECT(compressed.size() > 0);
  auto restored = runThrough(newDecompressionStream("gzip"), compressed.asPtr(), ws);
  KJ_EXPECT(restored.size() == 0);
}

KJ_TEST("unknown formats are rejected") {
  KJ_EXPECT_THROW_MESSAGE("must be either 'deflate', 'deflate-raw' or 'gzip'",
      newCompressionStream("brotli"));
  KJ_EXPECT_THROW_MESSAGE("must be either 'deflate', 'deflate-raw' or 'gzip'",
      newDecompressionStream("zip"));
}

KJ_TEST("compression streams only accept byte chunks") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  KJ_EXPECT_THROW_MESSAGE("must be byte sequences",
      runThrough(newCompressionStream("gzip"), kj::arr(Chunk("text")), ws));
}

KJ_TEST("decompressing garbage fails") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  KJ_EXPECT_THROW_MESSAGE("Decompression failed.",
      runThrough(newDecompressionStream("deflate"), "definitely not compressed"_kjb, ws));
}

KJ_TEST("decompression rejects trailing bytes") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  kj::Vector<kj::byte> input;
  input.addAll(bytesOf(DEFLATE_HELLO));
  input.addAll("xyz"_kjb);

  KJ_EXPECT_THROW_MESSAGE("Trailing bytes after end of compressed data",
      runThrough(newDecompressionStream("deflate"), input.asPtr(), ws));
}

KJ_TEST("decompression rejects truncated input") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  KJ_EXPECT_THROW_MESSAGE("incomplete data",
      runThrough(newDecompressionStream("deflate"), kj::arrayPtr(DEFLATE_HELLO, 8), ws));
}

KJ_TEST("a failed decompression errors the writable side too") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  auto transform = newDecompressionStream("deflate");
  auto writer = transform->getWritable().getWriter();
  auto reader = transform->getReadable().getReader();

  auto read = reader->read();
  auto write = writer->write(Chunk::copyOf("garbage!"_kjb));

  KJ_EXPECT_THROW_MESSAGE("Decompression failed.", write.wait(ws));
  KJ_EXPECT_THROW_MESSAGE("Decompression failed.", read.wait(ws));
  KJ_EXPECT(transform->getWritable().getStoredError() != kj::none);
}

}  // namespace
}  // namespace rill
