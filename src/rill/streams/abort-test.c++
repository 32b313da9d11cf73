// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "abort.h"

#include <kj/test.h>

namespace rill {
namespace {

KJ_TEST("AbortController aborts its signal once") {
  AbortController controller;
  auto& signal = controller.getSignal();
  KJ_EXPECT(!signal.isAborted());
  signal.throwIfAborted();

  uint calls = 0;
  AbortSignal::Listener listener(signal, [&](const kj::Exception& reason) {
    ++calls;
    KJ_EXPECT(errorTypeOf(reason) == ErrorType::ABORT_ERROR);
  });

  controller.abort();
  controller.abort(KJ_EXCEPTION(FAILED, "ignored"));
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(signal.isAborted());
  KJ_EXPECT(errorTypeOf(KJ_ASSERT_NONNULL(signal.getReason())) == ErrorType::ABORT_ERROR);
  KJ_EXPECT_THROW_MESSAGE("The operation was aborted.", signal.throwIfAborted());
}

KJ_TEST("AbortController keeps a custom reason") {
  AbortController controller;
  controller.abort(KJ_EXCEPTION(FAILED, "custom"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(controller.getSignal().getReason()).getDescription() == "custom");
}

KJ_TEST("destroyed listeners are not invoked") {
  AbortController controller;
  bool called = false;
  {
    AbortSignal::Listener listener(
        controller.getSignal(), [&](const kj::Exception&) { called = true; });
  }
  controller.abort();
  KJ_EXPECT(!called);
}

KJ_TEST("AbortSignal::abort is already aborted") {
  auto signal = AbortSignal::abort(KJ_EXCEPTION(FAILED, "early"));
  KJ_EXPECT(signal->isAborted());
  KJ_EXPECT(KJ_ASSERT_NONNULL(signal->getReason()).getDescription() == "early");
}

KJ_TEST("whenAborted resolves with the reason") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);

  AbortController controller;
  auto promise = controller.getSignal().whenAborted();
  KJ_EXPECT(!promise.poll(ws));
  controller.abort(KJ_EXCEPTION(FAILED, "stop"));
  KJ_EXPECT(promise.wait(ws).getDescription() == "stop");

  // Also for a signal that is aborted already.
  auto signal = AbortSignal::abort();
  KJ_EXPECT(errorTypeOf(signal->whenAborted().wait(ws)) == ErrorType::ABORT_ERROR);
}

KJ_TEST("AbortSignal::timeout aborts with a TimeoutError") {
  kj::EventLoop loop;
  kj::WaitScope ws(loop);
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());

  auto signal = AbortSignal::timeout(timer, 10 * kj::MILLISECONDS);
  timer.advanceTo(timer.now() + 5 * kj::MILLISECONDS);
  ws.poll();
  KJ_EXPECT(!signal->isAborted());

  timer.advanceTo(timer.now() + 5 * kj::MILLISECONDS);
  ws.poll();
  KJ_EXPECT(signal->isAborted());
  KJ_EXPECT(errorTypeOf(KJ_ASSERT_NONNULL(signal->getReason())) == ErrorType::TIMEOUT_ERROR);
}

KJ_TEST("AbortSignal::any follows the first input to abort") {
  AbortController a;
  AbortController b;
  AbortSignal* inputs[] = {&a.getSignal(), &b.getSignal()};
  auto combined = AbortSignal::any(kj::arrayPtr(inputs, 2));
  KJ_EXPECT(!combined->isAborted());

  b.abort(KJ_EXCEPTION(FAILED, "second"));
  KJ_EXPECT(combined->isAborted());
  KJ_EXPECT(KJ_ASSERT_NONNULL(combined->getReason()).getDescription() == "second");

  a.abort(KJ_EXCEPTION(FAILED, "first"));
  KJ_EXPECT(KJ_ASSERT_NONNULL(combined->getReason()).getDescription() == "second");
}

KJ_TEST("AbortSignal::any of an aborted signal") {
  auto aborted = AbortSignal::abort(KJ_EXCEPTION(FAILED, "done"));
  AbortController other;
  AbortSignal* inputs[] = {&other.getSignal(), aborted.get()};
  auto combined = AbortSignal::any(kj::arrayPtr(inputs, 2));
  KJ_EXPECT(KJ_ASSERT_NONNULL(combined->getReason()).getDescription() == "done");
}

}  // namespace
}  // namespace rill
