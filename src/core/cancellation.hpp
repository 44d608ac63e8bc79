#pragma once

#include <atomic>
#include <memory>

namespace comfytest::core {

// Shared cancellation flag threaded through every collaborator call.
//
// Tokens form a tree: cancelling a token cancels every child derived from it,
// but never its parent. A default-constructed token owns a fresh root.
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  // Derives a child that is cancelled together with this token, and can also
  // be cancelled on its own (used for per-call deadlines).
  CancellationToken Child() const {
    CancellationToken child;
    child.state_->parent = state_;
    return child;
  }

  void Cancel() const {
    state_->cancelled.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    for (const State* state = state_.get(); state != nullptr; state = state->parent.get()) {
      if (state->cancelled.load(std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

  // Lock-free flag of this token only; safe to set from a signal handler.
  std::atomic<bool>* Flag() const {
    return &state_->cancelled;
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<State> parent;
  };

  std::shared_ptr<State> state_;
};

} // namespace comfytest::core
