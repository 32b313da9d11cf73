// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pipe-tool.h"

#include <rill/streams/compression.h>
#include <rill/streams/pipe.h>
#include <rill/streams/system-streams.h>
#include <rill/util/errors.h>

#include <kj/debug.h>

#include <unistd.h>

namespace rill {

kj::MainFunc PipeTool::getMain() {
  kj::MainBuilder builder(context, "rill-pipe 0.1",
      "Copies standard input to standard output through a rill stream pipeline, optionally "
      "compressing or decompressing the data on the way through.");
  return addOptions(builder).callAfterParsing(KJ_BIND_METHOD(*this, run)).build();
}

kj::MainBuilder& PipeTool::addOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'c', "compress"}, KJ_BIND_METHOD(*this, setCompress), "<format>",
          "Compress the data with <format>, one of gzip, deflate or deflate-raw.")
      .addOptionWithArg({'d', "decompress"}, KJ_BIND_METHOD(*this, setDecompress), "<format>",
          "Decompress the data with <format>, one of gzip, deflate or deflate-raw.")
      .addOptionWithArg({"chunk-size"}, KJ_BIND_METHOD(*this, setChunkSize), "<bytes>",
          "Read standard input in chunks of at most <bytes> bytes. Defaults to 4096.")
      .addOptionWithArg({"high-water-mark"}, KJ_BIND_METHOD(*this, setHighWaterMark), "<bytes>",
          "Buffer up to <bytes> bytes ahead of standard output before applying backpressure.")
      .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
          "Log informational messages to standard error.");
}

kj::Promise<void> PipeTool::pump(
    kj::Own<kj::AsyncInputStream> input, kj::Own<kj::AsyncOutputStream> output) {
  auto source = newSystemReadableStream(kj::mv(input), chunkSize);
  QueuingStrategy strategy;
  KJ_IF_SOME(hwm, highWaterMark) {
    strategy = byteLengthQueuingStrategy(hwm);
  }
  auto destination = newSystemWritableStream(kj::mv(output), kj::mv(strategy));

  kj::Maybe<kj::Own<TransformStream>> transform;
  switch (mode) {
    case Mode::COPY:
      break;
    case Mode::COMPRESS:
      transform = newCompressionStream(format);
      break;
    case Mode::DECOMPRESS:
      transform = newDecompressionStream(format);
      break;
  }
  KJ_IF_SOME(t, transform) {
    source = pipeThrough(*source, *t);
  }
  KJ_LOG(INFO, "starting pipe", mode == Mode::COPY ? "copy"_kj : format, chunkSize);

  auto promise = pipeTo(*source, *destination);
  return promise.attach(kj::mv(source), kj::mv(destination), kj::mv(transform));
}

kj::MainBuilder::Validity PipeTool::setCompress(kj::StringPtr arg) {
  return setMode(Mode::COMPRESS, arg);
}

kj::MainBuilder::Validity PipeTool::setDecompress(kj::StringPtr arg) {
  return setMode(Mode::DECOMPRESS, arg);
}

kj::MainBuilder::Validity PipeTool::setMode(Mode newMode, kj::StringPtr arg) {
  if (mode != Mode::COPY) {
    return kj::str("--compress and --decompress may be given only once, and not together");
  }
  if (arg != "gzip" && arg != "deflate" && arg != "deflate-raw") {
    return kj::str("unknown format '", arg, "'; expected gzip, deflate or deflate-raw");
  }
  mode = newMode;
  format = arg;
  return true;
}

kj::MainBuilder::Validity PipeTool::setChunkSize(kj::StringPtr arg) {
  KJ_IF_SOME(size, arg.tryParseAs<uint64_t>()) {
    if (size > 0 && !arg.startsWith("-")) {
      chunkSize = size;
      return true;
    }
  }
  return kj::str("--chunk-size must be a positive integer");
}

kj::MainBuilder::Validity PipeTool::setHighWaterMark(kj::StringPtr arg) {
  if (arg.startsWith("-")) {
    return kj::str("--high-water-mark must be a non-negative integer");
  }
  KJ_IF_SOME(size, arg.tryParseAs<uint64_t>()) {
    highWaterMark = size;
    return true;
  }
  return kj::str("--high-water-mark must be a non-negative integer");
}

kj::MainBuilder::Validity PipeTool::setVerbose() {
  kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  return true;
}

kj::MainBuilder::Validity PipeTool::run() {
  auto io = kj::setupAsyncIo();

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    pump(io.lowLevelProvider->wrapInputFd(STDIN_FILENO),
        io.lowLevelProvider->wrapOutputFd(STDOUT_FILENO))
        .wait(io.waitScope);
  })) {
    KJ_LOG(INFO, "pipe failed", exception);
    context.exitError(kj::str("rill-pipe: ", stripErrorPrefix(exception.getDescription())));
  }

  KJ_LOG(INFO, "pipe finished");
  return true;
}

}  // namespace rill
