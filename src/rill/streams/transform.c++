// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "transform.h"

#include <kj/debug.h>

namespace rill {

class TransformStreamDefaultController::SideRef final {
 public:
  using Detach = void (TransformStreamDefaultController::*)();

  SideRef(kj::Own<TransformStreamDefaultController> controller, Detach detach)
      : controller(kj::mv(controller)),
        detach(detach) {}
  ~SideRef() noexcept(false) {
    ((*controller).*detach)();
  }
  KJ_DISALLOW_COPY_AND_MOVE(SideRef);

  TransformStreamDefaultController* operator->() {
    return controller.get();
  }

 private:
  kj::Own<TransformStreamDefaultController> controller;
  Detach detach;
};

TransformStreamDefaultController::TransformStreamDefaultController(
    Transformer transformer, kj::PromiseFulfillerPair<void> paf)
    : startFulfiller(kj::mv(paf.fulfiller)),
      startPromise(paf.promise.fork()) {
  auto algs = kj::refcounted<Algorithms>();
  algs->start = kj::mv(transformer.start);
  algs->transform = kj::mv(transformer.transform);
  algs->flush = kj::mv(transformer.flush);
  algs->cancel = kj::mv(transformer.cancel);
  algorithms = kj::mv(algs);
}

kj::Maybe<ssize_t> TransformStreamDefaultController::getDesiredSize() {
  KJ_IF_SOME(controller, readableController) {
    return controller.getDesiredSize();
  }
  return kj::none;
}

void TransformStreamDefaultController::enqueue(Chunk chunk) {
  auto& controller = RILL_REQUIRE_NONNULL(readableController, TypeError,
      "The readable side of this TransformStream is no longer readable.");
  RILL_REQUIRE(controller.canCloseOrEnqueue(), TypeError,
      "The readable side of this TransformStream is no longer readable.");

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { controller.enqueue(kj::mv(chunk)); })) {
    errorWritableAndUnblockWrite(kj::cp(exception));
    kj::throwFatalException(kj::mv(exception));
  }

  // Backpressure is only ever relieved by the readable side pulling.
  bool newBackpressure = true;
  KJ_IF_SOME(size, controller.getDesiredSize()) {
    newBackpressure = size <= 0;
  }
  if (newBackpressure && !backpressure) {
    setBackpressure(true);
  }
}

void TransformStreamDefaultController::error(kj::Exception reason) {
  // Erroring the two sides drops the references their algorithms hold on this controller.
  auto self = kj::addRef(*this);
  KJ_IF_SOME(controller, readableController) {
    controller.error(kj::cp(reason));
  }
  detachReadable();
  errorWritableAndUnblockWrite(kj::mv(reason));
}

void TransformStreamDefaultController::terminate() {
  auto self = kj::addRef(*this);
  KJ_IF_SOME(controller, readableController) {
    if (controller.canCloseOrEnqueue()) {
      controller.close();
    }
  }
  detachReadable();
  errorWritableAndUnblockWrite(
      RILL_KJ_EXCEPTION(FAILED, TypeError, "The transform stream has been terminated."));
}

void TransformStreamDefaultController::start() {
  setBackpressure(true);
  maybeRunAlgorithm(algorithms, &Algorithms::start, *this)
      .then([this, self = kj::addRef(*this)]() { startFulfiller->fulfill(); },
          [this, self = kj::addRef(*this)](kj::Exception&& exception) {
    startFulfiller->reject(kj::mv(exception));
  }).detach(logDetachedFailure);
}

kj::Promise<void> TransformStreamDefaultController::write(Chunk chunk) {
  KJ_IF_SOME(exception, storedError) {
    return kj::cp(exception);
  }

  if (backpressure) {
    return KJ_ASSERT_NONNULL(backpressureChange)
        .addBranch()
        .then([this, self = kj::addRef(*this), chunk = kj::mv(chunk)]() mutable
              -> kj::Promise<void> {
      KJ_IF_SOME(exception, storedError) {
        return kj::cp(exception);
      }
      KJ_IF_SOME(w, writable) {
        if (w.isErroring()) {
          return kj::cp(KJ_ASSERT_NONNULL(w.getStoredError()));
        }
      }
      return performTransform(kj::mv(chunk));
    });
  }
  return performTransform(kj::mv(chunk));
}

kj::Promise<void> TransformStreamDefaultController::abort(kj::Exception reason) {
  KJ_IF_SOME(finish, maybeFinish) {
    return finish.addBranch();
  }

  auto promise = maybeRunAlgorithm(algorithms, &Algorithms::cancel, kj::cp(reason))
                     .then([this, self = kj::addRef(*this), reason = kj::cp(reason)]() mutable
                           -> kj::Promise<void> {
    KJ_IF_SOME(exception, readableError()) {
      return kj::mv(exception);
    }
    error(kj::mv(reason));
    return kj::READY_NOW;
  }, [this, self = kj::addRef(*this)](kj::Exception&& exception) -> kj::Promise<void> {
    error(kj::cp(exception));
    return kj::mv(exception);
  });

  return maybeFinish.emplace(promise.fork()).addBranch();
}

kj::Promise<void> TransformStreamDefaultController::close() {
  return maybeRunAlgorithm(algorithms, &Algorithms::flush, *this)
      .then([this, self = kj::addRef(*this)]() -> kj::Promise<void> {
    algorithms = kj::none;
    KJ_IF_SOME(exception, readableError()) {
      return kj::mv(exception);
    }
    // The readable side closes once everything already enqueued has been read.
    KJ_IF_SOME(controller, readableController) {
      if (controller.canCloseOrEnqueue()) {
        controller.close();
      }
    }
    return kj::READY_NOW;
  }, [this, self = kj::addRef(*this)](kj::Exception&& exception) -> kj::Promise<void> {
    error(kj::cp(exception));
    return kj::mv(exception);
  });
}

kj::Promise<void> TransformStreamDefaultController::pull() {
  KJ_ASSERT(backpressure);
  setBackpressure(false);
  return KJ_ASSERT_NONNULL(backpressureChange).addBranch();
}

kj::Promise<void> TransformStreamDefaultController::cancel(kj::Exception reason) {
  KJ_IF_SOME(finish, maybeFinish) {
    return finish.addBranch();
  }

  // The readable side is already closed, so nothing can be enqueued on it from here on.
  detachReadable();

  auto promise = maybeRunAlgorithm(algorithms, &Algorithms::cancel, kj::cp(reason))
                     .then([this, self = kj::addRef(*this), reason = kj::cp(reason)]() mutable
                           -> kj::Promise<void> {
    errorWritableAndUnblockWrite(kj::mv(reason));
    return kj::READY_NOW;
  }, [this, self = kj::addRef(*this)](kj::Exception&& exception) -> kj::Promise<void> {
    errorWritableAndUnblockWrite(kj::cp(exception));
    return kj::mv(exception);
  });

  return maybeFinish.emplace(promise.fork()).addBranch();
}

kj::Promise<void> TransformStreamDefaultController::performTransform(Chunk chunk) {
  KJ_IF_SOME(algs, algorithms) {
    if (algs->transform != kj::none) {
      return maybeRunAlgorithm(algorithms, &Algorithms::transform, kj::mv(chunk), *this)
          .catch_([this, self = kj::addRef(*this)](kj::Exception&& exception)
                      -> kj::Promise<void> {
        error(kj::cp(exception));
        return kj::mv(exception);
      });
    }
  }
  // No transform hook: the chunk passes through unchanged.
  return kj::evalNow([&]() { enqueue(kj::mv(chunk)); });
}

void TransformStreamDefaultController::setBackpressure(bool newBackpressure) {
  KJ_IF_SOME(fulfiller, backpressureChangeFulfiller) {
    fulfiller->fulfill();
  }
  auto paf = kj::newPromiseAndFulfiller<void>();
  backpressureChangeFulfiller = kj::mv(paf.fulfiller);
  backpressureChange = paf.promise.fork();
  backpressure = newBackpressure;
}

void TransformStreamDefaultController::errorWritableAndUnblockWrite(kj::Exception reason) {
  // Erroring the writable side releases its hooks, which may hold the last reference to us.
  auto self = kj::addRef(*this);
  algorithms = kj::none;
  KJ_IF_SOME(controller, writableController) {
    KJ_IF_SOME(w, writable) {
      if (w.isWritable()) {
        controller.error(kj::cp(reason));
      }
    }
  }
  detachWritable();
  if (storedError == kj::none) {
    storedError = kj::mv(reason);
  }
  if (backpressure) {
    setBackpressure(false);
  }
}

void TransformStreamDefaultController::detachReadable() {
  readable = kj::none;
  readableController = kj::none;
}

void TransformStreamDefaultController::detachWritable() {
  writable = kj::none;
  writableController = kj::none;
}

kj::Maybe<kj::Exception> TransformStreamDefaultController::readableError() {
  KJ_IF_SOME(r, readable) {
    KJ_IF_SOME(exception, r.getStoredError()) {
      return kj::cp(exception);
    }
    return kj::none;
  }
  // A readable side that errored has been detached. Its reason is the stored error.
  KJ_IF_SOME(exception, storedError) {
    return kj::cp(exception);
  }
  return kj::none;
}

// ======================================================================================

kj::Own<TransformStream> TransformStream::create(
    Transformer transformer, QueuingStrategy writableStrategy, QueuingStrategy readableStrategy) {
  auto controller = kj::refcounted<TransformStreamDefaultController>(kj::mv(transformer));

  UnderlyingSink sink;
  sink.start = [controller = kj::addRef(*controller)](
                   WritableStreamDefaultController& writableController) mutable {
    controller->writableController = writableController;
    return controller->startPromise.addBranch();
  };
  sink.write = [controller = kj::addRef(*controller)](
                   Chunk chunk, WritableStreamDefaultController&) mutable {
    return controller->write(kj::mv(chunk));
  };
  sink.close = [controller = kj::addRef(*controller)]() mutable { return controller->close(); };
  sink.abort = [side = kj::heap<TransformStreamDefaultController::SideRef>(
                    kj::addRef(*controller), &TransformStreamDefaultController::detachWritable)](
                    kj::Exception reason) mutable { return (*side)->abort(kj::mv(reason)); };
  auto writable = WritableStream::create(kj::mv(sink), kj::mv(writableStrategy));

  UnderlyingSource source;
  source.start = [controller = kj::addRef(*controller)](
                     ReadableStreamDefaultController& readableController) mutable {
    controller->readableController = readableController;
    return controller->startPromise.addBranch();
  };
  source.pull = [controller = kj::addRef(*controller)](ReadableStreamDefaultController&) mutable {
    return controller->pull();
  };
  source.cancel = [side = kj::heap<TransformStreamDefaultController::SideRef>(
                      kj::addRef(*controller), &TransformStreamDefaultController::detachReadable)](
                      kj::Exception reason) mutable { return (*side)->cancel(kj::mv(reason)); };
  if (readableStrategy.highWaterMark == kj::none) {
    readableStrategy.highWaterMark = size_t(0);
  }
  auto readable = ReadableStream::create(kj::mv(source), kj::mv(readableStrategy));

  controller->readable = *readable;
  controller->writable = *writable;
  controller->start();

  return kj::refcounted<TransformStream>(kj::mv(readable), kj::mv(writable));
}

kj::Own<TransformStream> TransformStream::identity() {
  return create();
}

}  // namespace rill
