// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/async-io.h>
#include <kj/main.h>

namespace rill {

// The rill-pipe command: copies standard input to standard output through a rill stream pipeline,
// optionally compressing or decompressing the data on the way through.
class PipeTool {
 public:
  enum class Mode {
    COPY,
    COMPRESS,
    DECOMPRESS,
  };

  explicit PipeTool(kj::ProcessContext& context): context(context) {}
  KJ_DISALLOW_COPY_AND_MOVE(PipeTool);

  kj::MainFunc getMain();

  // Registers the command-line flags. Parsing them updates this object's settings.
  kj::MainBuilder& addOptions(kj::MainBuilder& builder);

  // Copies input to output through the pipeline the settings describe.
  kj::Promise<void> pump(
      kj::Own<kj::AsyncInputStream> input, kj::Own<kj::AsyncOutputStream> output);

  Mode getMode() const {
    return mode;
  }
  kj::StringPtr getFormat() const {
    return format;
  }
  size_t getChunkSize() const {
    return chunkSize;
  }
  kj::Maybe<size_t> getHighWaterMark() const {
    return highWaterMark;
  }

 private:
  kj::ProcessContext& context;
  Mode mode = Mode::COPY;
  kj::StringPtr format;
  size_t chunkSize = 4096;
  kj::Maybe<size_t> highWaterMark;

  kj::MainBuilder::Validity setCompress(kj::StringPtr arg);
  kj::MainBuilder::Validity setDecompress(kj::StringPtr arg);
  kj::MainBuilder::Validity setMode(Mode newMode, kj::StringPtr arg);
  kj::MainBuilder::Validity setChunkSize(kj::StringPtr arg);
  kj::MainBuilder::Validity setHighWaterMark(kj::StringPtr arg);
  kj::MainBuilder::Validity setVerbose();
  kj::MainBuilder::Validity run();
};

}  // namespace rill
