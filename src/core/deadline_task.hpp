#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <utility>

namespace comfytest::core {

enum class DeadlineOutcome {
  kCompleted,
  kTimedOut,
  kCancelled,
};

// Runs `task` on its own thread with a child cancellation token and waits at
// most `timeout` for it (zero means no deadline).
//
// Contract:
// - On expiry or parent cancellation the child token is cancelled and this
//   call still waits for `task` to return, so everything the task acquired
//   (processes, sockets) is released before the caller sees the outcome.
// - `result` always holds whatever `task` returned.
template <typename Result>
DeadlineOutcome RunWithDeadline(std::chrono::milliseconds timeout,
                                const CancellationToken& parent,
                                std::function<Result(const CancellationToken&)> task,
                                Result& result) {
  const CancellationToken child = parent.Child();
  std::future<Result> pending =
      std::async(std::launch::async, [task = std::move(task), child]() { return task(child); });

  constexpr auto kSlice = std::chrono::milliseconds(50);
  const bool has_deadline = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  DeadlineOutcome outcome = DeadlineOutcome::kCompleted;
  while (pending.wait_for(kSlice) != std::future_status::ready) {
    if (parent.IsCancelled()) {
      outcome = DeadlineOutcome::kCancelled;
      break;
    }
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      outcome = DeadlineOutcome::kTimedOut;
      break;
    }
  }

  if (outcome != DeadlineOutcome::kCompleted) {
    child.Cancel();
  }
  result = pending.get();
  return outcome;
}

} // namespace comfytest::core
