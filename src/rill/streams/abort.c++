// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "abort.h"

#include "common.h"

namespace rill {

AbortSignal::~AbortSignal() noexcept(false) {
  // Every listener holds a strong reference, so none can be left once we get here.
  KJ_ASSERT(listeners.empty());
}

kj::Own<AbortSignal> AbortSignal::abort(kj::Maybe<kj::Exception> reason) {
  auto signal = kj::refcounted<AbortSignal>();
  signal->triggerAbort(reasonOrAbortError(kj::mv(reason)));
  return kj::mv(signal);
}

kj::Own<AbortSignal> AbortSignal::timeout(kj::Timer& timer, kj::Duration delay) {
  auto signal = kj::refcounted<AbortSignal>();
  // The timer task holds a reference so the signal lives at least until it fires. Tearing down
  // the event loop cancels the task.
  timer.afterDelay(delay)
      .then([signal = kj::addRef(*signal)]() mutable {
    signal->triggerAbort(RILL_KJ_EXCEPTION(DISCONNECTED, TimeoutError,
        "The operation was aborted due to timeout."));
  }).detach(logDetachedFailure);
  return kj::mv(signal);
}

kj::Own<AbortSignal> AbortSignal::any(kj::ArrayPtr<AbortSignal* const> signals) {
  auto result = kj::refcounted<AbortSignal>();
  for (auto signal: signals) {
    KJ_IF_SOME(r, signal->getReason()) {
      result->triggerAbort(kj::cp(r));
      return kj::mv(result);
    }
  }

  for (auto signal: signals) {
    result->dependencies.add(kj::heap<Listener>(*signal,
        [target = result.get()](const kj::Exception& reason) {
      target->triggerAbort(kj::cp(reason));
    }));
  }
  return kj::mv(result);
}

kj::Promise<kj::Exception> AbortSignal::whenAborted() {
  // A Promise<kj::Exception> cannot be constructed from an exception without it being taken as a
  // rejection, so even the already-aborted case goes through a fulfiller.
  auto paf = kj::newPromiseAndFulfiller<kj::Exception>();
  KJ_IF_SOME(r, reason) {
    paf.fulfiller->fulfill(kj::cp(r));
  } else {
    waiters.add(kj::mv(paf.fulfiller));
  }
  return kj::mv(paf.promise);
}

void AbortSignal::triggerAbort(kj::Exception exception) {
  if (reason != kj::none) return;

  // Listener callbacks may drop the last external reference to this signal.
  auto self = kj::addRef(*this);

  reason = kj::cp(exception);

  for (auto& waiter: waiters) {
    waiter->fulfill(kj::cp(exception));
  }
  waiters.clear();

  // Listeners may unregister themselves (or others) while we iterate, so detach each one from the
  // list before invoking it.
  while (!listeners.empty()) {
    auto& listener = listeners.front();
    listeners.remove(listener);
    listener.fn(exception);
  }
}

void AbortController::abort(kj::Maybe<kj::Exception> reason) {
  signal->triggerAbort(reasonOrAbortError(kj::mv(reason)));
}

}  // namespace rill
