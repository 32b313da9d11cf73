// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include "common.h"

namespace rill {

// Pumps every chunk of source into destination, locking both for the duration of the pipe.
//
// - When source closes, destination is closed (unless options.preventClose).
// - When source errors, destination is aborted with the error (unless options.preventAbort) and
//   the pipe fails with it.
// - When destination errors or is closed, source is canceled (unless options.preventCancel) and
//   the pipe fails.
// - When options.signal is aborted, both of the above happen and the pipe fails with the
//   signal's reason.
//
// Writes that were already handed to destination are allowed to finish before it is closed or
// aborted. Rejects with a TypeError if either stream is already locked. Dropping the returned
// promise stops the pipe and releases both locks without canceling or aborting anything.
kj::Promise<void> pipeTo(
    ReadableStream& source, WritableStream& destination, PipeToOptions options = PipeToOptions());

// Pipes source into the writable side of transform in the background and returns the readable
// side. A failure of the pipe shows up as an error of the returned stream. Throws a TypeError if
// source or the writable side is already locked.
kj::Own<ReadableStream> pipeThrough(
    ReadableStream& source, TransformStream& transform, PipeToOptions options = PipeToOptions());

}  // namespace rill
