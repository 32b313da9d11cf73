// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "compression.h"

#include <kj/debug.h>
#include <kj/vector.h>

#include <zlib.h>

namespace rill {

namespace {

class Context final: public kj::Refcounted {
 public:
  enum class Mode {
    COMPRESS,
    DECOMPRESS,
  };

  struct Result {
    bool success = false;
    kj::ArrayPtr<const kj::byte> buffer;
  };

  Context(Mode mode, kj::StringPtr format): mode(mode) {
    int result = Z_OK;
    switch (mode) {
      case Mode::COMPRESS:
        result = deflateInit2(&ctx, Z_DEFAULT_COMPRESSION, Z_DEFLATED, getWindowBits(format),
            8,  // memLevel = 8 is the default
            Z_DEFAULT_STRATEGY);
        break;
      case Mode::DECOMPRESS:
        result = inflateInit2(&ctx, getWindowBits(format));
        break;
    }
    RILL_REQUIRE(result == Z_OK, Error, "Failed to initialize compression context.");
  }

  ~Context() noexcept(false) {
    switch (mode) {
      case Mode::COMPRESS:
        deflateEnd(&ctx);
        break;
      case Mode::DECOMPRESS:
        inflateEnd(&ctx);
        break;
    }
  }

  KJ_DISALLOW_COPY_AND_MOVE(Context);

  void setInput(kj::ArrayPtr<const kj::byte> in) {
    ctx.next_in = const_cast<kj::byte*>(in.begin());
    ctx.avail_in = in.size();
  }

  Result pumpOnce(int flush) {
    ctx.next_out = buffer;
    ctx.avail_out = sizeof(buffer);

    int result = Z_OK;

    switch (mode) {
      case Mode::COMPRESS:
        result = deflate(&ctx, flush);
        RILL_REQUIRE(result == Z_OK || result == Z_BUF_ERROR || result == Z_STREAM_END, TypeError,
            "Compression failed.");
        break;
      case Mode::DECOMPRESS:
        result = inflate(&ctx, flush);
        RILL_REQUIRE(result == Z_OK || result == Z_BUF_ERROR || result == Z_STREAM_END, TypeError,
            "Decompression failed.");
        RILL_REQUIRE(!(result == Z_STREAM_END && ctx.avail_in > 0), TypeError,
            "Trailing bytes after end of compressed data");
        RILL_REQUIRE(
            !(flush == Z_FINISH && result == Z_BUF_ERROR && ctx.avail_out == sizeof(buffer)),
            TypeError, "Called close() on a decompression stream with incomplete data");
        break;
    }

    return Result{
      .success = result == Z_OK,
      .buffer = kj::arrayPtr(buffer, sizeof(buffer) - ctx.avail_out),
    };
  }

  // Runs zlib until it stops producing output and returns everything it produced.
  kj::Array<kj::byte> pump(int flush) {
    kj::Vector<kj::byte> output;
    while (true) {
      auto result = pumpOnce(flush);
      if (result.buffer.size() == 0) {
        if (result.success) {
          // Input was consumed without producing output yet.
          continue;
        }
        return output.releaseAsArray();
      }
      output.addAll(result.buffer);
    }
  }

 private:
  static int getWindowBits(kj::StringPtr format) {
    // A windowBits value of 15 is combined with the magic value for the format: +16 selects a
    // gzip wrapper, a negative value selects raw deflate without a zlib header. See deflateInit2()
    // in zlib.h.
    static constexpr auto GZIP = 16;
    static constexpr auto DEFLATE = 15;
    static constexpr auto DEFLATE_RAW = -15;
    if (format == "gzip") {
      return DEFLATE + GZIP;
    } else if (format == "deflate") {
      return DEFLATE;
    } else if (format == "deflate-raw") {
      return DEFLATE_RAW;
    }
    KJ_UNREACHABLE;
  }

  Mode mode;
  z_stream ctx = {};
  kj::byte buffer[16384];
};

void requireKnownFormat(kj::StringPtr format) {
  RILL_REQUIRE(format == "deflate" || format == "gzip" || format == "deflate-raw", TypeError,
      "The compression format must be either 'deflate', 'deflate-raw' or 'gzip'.");
}

void enqueueOutput(TransformStreamDefaultController& controller, kj::Array<kj::byte> output) {
  if (output.size() > 0) {
    controller.enqueue(Chunk(kj::mv(output)));
  }
}

kj::Own<TransformStream> newZlibStream(Context::Mode mode, kj::StringPtr format) {
  requireKnownFormat(format);
  auto context = kj::refcounted<Context>(mode, format);

  Transformer transformer;
  transformer.transform = [context = kj::addRef(*context)](Chunk chunk,
                              TransformStreamDefaultController& controller) mutable
                              -> kj::Promise<void> {
    RILL_REQUIRE(chunk.isBytes(), TypeError,
        "The chunks written to a compression stream must be byte sequences.");
    context->setInput(chunk.get<Chunk::Bytes>());
    enqueueOutput(controller, context->pump(Z_NO_FLUSH));
    return kj::READY_NOW;
  };
  transformer.flush = [context = kj::mv(context)](
                          TransformStreamDefaultController& controller) mutable
                          -> kj::Promise<void> {
    context->setInput(nullptr);
    enqueueOutput(controller, context->pump(Z_FINISH));
    return kj::READY_NOW;
  };
  return TransformStream::create(kj::mv(transformer));
}

}  // namespace

kj::Own<TransformStream> newCompressionStream(kj::StringPtr format) {
  return newZlibStream(Context::Mode::COMPRESS, format);
}

kj::Own<TransformStream> newDecompressionStream(kj::StringPtr format) {
  return newZlibStream(Context::Mode::DECOMPRESS, format);
}

}  // namespace rill
