// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <rill/util/errors.h>

#include <kj/async.h>
#include <kj/function.h>
#include <kj/list.h>
#include <kj/refcount.h>
#include <kj/time.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace rill {

// An AbortSignal is a one-shot, shareable cancellation flag. It is the only timeout mechanism the
// streams engine knows about: pipeTo() watches the signal given in its options, and a
// WritableStream exposes a signal to its sink that fires when the stream is aborted.
//
// Signals are reference counted so that an AbortController, any number of pipes, and derived
// signals created by any() can all hold on to the same instance.
class AbortSignal final: public kj::Refcounted {
 public:
  // Invokes the given function synchronously when the signal is aborted. The listener keeps the
  // signal alive and unregisters itself when destroyed. A listener created on a signal that is
  // already aborted is never invoked.
  class Listener {
   public:
    explicit Listener(AbortSignal& signal, kj::Function<void(const kj::Exception&)> fn)
        : fn(kj::mv(fn)),
          signal(kj::addRef(signal)) {
      this->signal->listeners.add(*this);
    }

    ~Listener() noexcept(false) {
      if (link.isLinked()) {
        signal->listeners.remove(*this);
      }
    }

    KJ_DISALLOW_COPY_AND_MOVE(Listener);

   private:
    kj::Function<void(const kj::Exception&)> fn;
    kj::Own<AbortSignal> signal;
    kj::ListLink<Listener> link;

    friend class AbortSignal;
  };

  AbortSignal() = default;
  ~AbortSignal() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(AbortSignal);

  // Returns a signal that is already aborted with the given reason (an AbortError by default).
  static kj::Own<AbortSignal> abort(kj::Maybe<kj::Exception> reason = kj::none);

  // Returns a signal that aborts with a TimeoutError once the given delay has elapsed.
  static kj::Own<AbortSignal> timeout(kj::Timer& timer, kj::Duration delay);

  // Returns a signal that aborts as soon as any of the given signals aborts, with that signal's
  // reason. If one of them is already aborted the result is aborted immediately.
  static kj::Own<AbortSignal> any(kj::ArrayPtr<AbortSignal* const> signals);

  bool isAborted() const {
    return reason != kj::none;
  }

  kj::Maybe<const kj::Exception&> getReason() const {
    return reason;
  }

  void throwIfAborted() const {
    KJ_IF_SOME(r, reason) {
      kj::throwFatalException(kj::cp(r));
    }
  }

  // A promise that resolves with the abort reason once the signal is aborted. Never resolves if
  // the signal is never aborted.
  kj::Promise<kj::Exception> whenAborted();

 private:
  kj::Maybe<kj::Exception> reason;
  kj::List<Listener, &Listener::link> listeners;
  kj::Vector<kj::Own<kj::PromiseFulfiller<kj::Exception>>> waiters;

  // Listeners a derived signal (see any()) holds on its inputs.
  kj::Vector<kj::Own<Listener>> dependencies;

  void triggerAbort(kj::Exception exception);

  friend class AbortController;
};

// Owns an AbortSignal and is the only thing that can trigger it.
class AbortController final {
 public:
  AbortController(): signal(kj::refcounted<AbortSignal>()) {}
  KJ_DISALLOW_COPY_AND_MOVE(AbortController);

  AbortSignal& getSignal() {
    return *signal;
  }

  kj::Own<AbortSignal> addSignalRef() {
    return kj::addRef(*signal);
  }

  // Aborts the signal. Only the first call has any effect. When no reason is given an AbortError
  // is used.
  void abort(kj::Maybe<kj::Exception> reason = kj::none);

 private:
  kj::Own<AbortSignal> signal;
};

}  // namespace rill
