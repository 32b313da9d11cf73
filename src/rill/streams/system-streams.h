// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
// Adapters between rill streams and KJ byte streams (files, pipes, sockets).

#include "readable.h"
#include "writable.h"

#include <kj/async-io.h>

namespace rill {

// A byte stream that reads from `inner` in chunks of at most `chunkSize` bytes. The stream closes
// when `inner` reports EOF and errors if a read from it fails. Canceling the stream drops `inner`.
kj::Own<ReadableStream> newSystemReadableStream(
    kj::Own<kj::AsyncInputStream> inner, size_t chunkSize = 4096);

// A stream whose sink writes each chunk's bytes to `inner`. Strings are written as UTF-8; any
// other non-byte chunk errors the stream with a TypeError. Closing the stream shuts down the write
// side of `inner` if it is a kj::AsyncIoStream, then drops it. Aborting drops it immediately.
// `strategy` bounds how much is buffered ahead of `inner` before the stream signals backpressure.
kj::Own<WritableStream> newSystemWritableStream(
    kj::Own<kj::AsyncOutputStream> inner, QueuingStrategy strategy = QueuingStrategy());

}  // namespace rill
