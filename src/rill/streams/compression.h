// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "transform.h"

namespace rill {

// Transforms that compress or decompress byte chunks with zlib. The format is one of "gzip",
// "deflate" (zlib framing) or "deflate-raw"; anything else throws a TypeError. Chunks that are
// not byte sequences error the stream with a TypeError.
//
// Decompression is strict: data after the end of the compressed stream, or closing the writable
// side before the compressed stream is complete, errors both sides with a TypeError.
kj::Own<TransformStream> newCompressionStream(kj::StringPtr format);
kj::Own<TransformStream> newDecompressionStream(kj::StringPtr format);

}  // namespace rill
