// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pipe-tool.h"

#include <kj/test.h>

namespace rill {
namespace {

// Turns usage errors into exceptions so the test can inspect them.
class TestProcessContext final: public kj::ProcessContext {
 public:
  kj::StringPtr getProgramName() override {
    return "rill-pipe";
  }
  [[noreturn]] void exit() override {
    KJ_FAIL_ASSERT("unexpected exit()");
  }
  void warning(kj::StringPtr message) const override {}
  void error(kj::StringPtr message) const override {}
  [[noreturn]] void exitError(kj::StringPtr message) override {
    kj::throwFatalException(
        kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__, kj::str(message)));
  }
  [[noreturn]] void exitInfo(kj::StringPtr message) override {
    KJ_FAIL_ASSERT("unexpected exitInfo()", message);
  }
  void increaseLoggingVerbosity() override {}
};

class MemoryAsyncInputStream final: public kj::AsyncInputStream {
 public:
  explicit MemoryAsyncInputStream(kj::ArrayPtr<const kj::byte> data): data(data) {}

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    auto dest = kj::arrayPtr(static_cast<kj::byte*>(buffer), maxBytes);
    size_t amount = kj::min(dest.size(), data.size());
    dest.first(amount).copyFrom(data.first(amount));
    data = data.slice(amount);
    return amount;
  }

 private:
  kj::ArrayPtr<const kj::byte> data;
};

class MemoryAsyncOutputStream final: public kj::AsyncOutputStream {
 public:
  explicit MemoryAsyncOutputStream(kj::Vector<kj::byte>& data): data(data) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override {
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

 private:
  kj::Vector<kj::byte>& data;
};

// Parses the flags into a tool without running it.
kj::Own<PipeTool> configure(kj::ProcessContext& context, kj::Array<kj::StringPtr> args) {
  auto tool = kj::heap<PipeTool>(context);
  kj::MainBuilder builder(context, "rill-pipe test", "Parses rill-pipe flags.");
  auto parse = tool->addOptions(builder)
                   .callAfterParsing([]() -> kj::MainBuilder::Validity { return true; })
                   .build();
  parse("rill-pipe", args);
  return kj::mv(tool);
}

KJ_TEST("flags configure the pipeline") {
  TestProcessContext context;

  auto defaults = configure(context, nullptr);
  KJ_EXPECT(defaults->getMode() == PipeTool::Mode::COPY);
  KJ_EXPECT(defaults->getChunkSize() == 4096);
  KJ_EXPECT(defaults->getHighWaterMark() == kj::none);

  auto tool = configure(context,
      kj::arr("--decompress=deflate-raw"_kj, "--chunk-size=16"_kj, "--high-water-mark=0"_kj));
  KJ_EXPECT(tool->getMode() == PipeTool::Mode::DECOMPRESS);
  KJ_EXPECT(tool->getFormat() == "deflate-raw");
  KJ_EXPECT(tool->getChunkSize() == 16);
  KJ_EXPECT(KJ_ASSERT_NONNULL(tool->getHighWaterMark()) == 0);
}

KJ_TEST("invalid flags are usage errors") {
  TestProcessContext context;

  KJ_EXPECT_THROW_MESSAGE("unknown format 'brotli'", configure(context, kj::arr("-cbrotli"_kj)));
  KJ_EXPECT_THROW_MESSAGE("may be given only once",
      configure(context, kj::arr("--compress=gzip"_kj, "--decompress=gzip"_kj)));
  KJ_EXPECT_THROW_MESSAGE(
      "must be a positive integer", configure(context, kj::arr("--chunk-size=0"_kj)));
  KJ_EXPECT_THROW_MESSAGE(
      "must be a positive integer", configure(context, kj::arr("--chunk-size=lots"_kj)));
  KJ_EXPECT_THROW_MESSAGE("must be a non-negative integer",
      configure(context, kj::arr("--high-water-mark=-1"_kj)));
}

KJ_TEST("compressing then decompressing restores the input") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);
  TestProcessContext context;

  kj::Vector<kj::byte> text;
  for (auto i = 0; i < 500; ++i) {
    text.addAll(kj::str("record ", i, "\n").asBytes());
  }

  auto compressor = configure(context, kj::arr("--compress=gzip"_kj, "--chunk-size=7"_kj));
  kj::Vector<kj::byte> compressed;
  compressor
      ->pump(kj::heap<MemoryAsyncInputStream>(text.asPtr()),
          kj::heap<MemoryAsyncOutputStream>(compressed))
      .wait(ws);
  KJ_ASSERT(compressed.size() > 2);
  KJ_EXPECT(compressed[0] == 0x1f);
  KJ_EXPECT(compressed[1] == 0x8b);
  KJ_EXPECT(compressed.size() < text.size());

  auto decompressor = configure(context, kj::arr("-dgzip"_kj, "--high-water-mark=64"_kj));
  kj::Vector<kj::byte> restored;
  decompressor
      ->pump(kj::heap<MemoryAsyncInputStream>(compressed.asPtr()),
          kj::heap<MemoryAsyncOutputStream>(restored))
      .wait(ws);
  KJ_EXPECT(restored.asPtr() == text.asPtr());
}

KJ_TEST("copy mode passes the input through unchanged") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);
  TestProcessContext context;

  auto tool = configure(context, kj::arr("--chunk-size=3"_kj));
  kj::Vector<kj::byte> output;
  tool->pump(kj::heap<MemoryAsyncInputStream>("just some bytes"_kjb),
          kj::heap<MemoryAsyncOutputStream>(output))
      .wait(ws);
  KJ_EXPECT(output.asPtr() == "just some bytes"_kjb);
}

KJ_TEST("a decompression failure fails the pump") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);
  TestProcessContext context;

  auto tool = configure(context, kj::arr("--decompress=deflate"_kj));
  kj::Vector<kj::byte> output;
  KJ_EXPECT_THROW_MESSAGE("Decompression failed.",
      tool->pump(kj::heap<MemoryAsyncInputStream>("not deflate data"_kjb),
              kj::heap<MemoryAsyncOutputStream>(output))
          .wait(ws));
}

}  // namespace
}  // namespace rill
