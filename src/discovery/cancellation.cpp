// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/cancellation.hpp"
#include <algorithm>

namespace topowatch {
namespace discovery {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

CancellationToken CancellationToken::WithDeadline(Clock::time_point deadline) {
  auto state = std::make_shared<State>();
  state->deadline = deadline;
  return CancellationToken(std::move(state));
}

CancellationToken CancellationToken::Child(Clock::time_point deadline) const {
  auto state = std::make_shared<State>();
  state->deadline = deadline;
  state->parent = state_;
  return CancellationToken(std::move(state));
}

void CancellationToken::Cancel() {
  state_->cancelled.store(true, std::memory_order_release);
}

bool CancellationToken::IsCancelled() const {
  const auto now = Clock::now();
  for (const State *s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->cancelled.load(std::memory_order_acquire)) {
      return true;
    }
    if (s->deadline && now >= *s->deadline) {
      return true;
    }
  }
  return false;
}

CancellationToken::Clock::time_point CancellationToken::Deadline() const {
  auto deadline = Clock::time_point::max();
  for (const State *s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->deadline) {
      deadline = std::min(deadline, *s->deadline);
    }
  }
  return deadline;
}

std::chrono::milliseconds CancellationToken::Remaining() const {
  if (IsCancelled()) {
    return std::chrono::milliseconds(0);
  }
  const auto deadline = Deadline();
  if (deadline == Clock::time_point::max()) {
    return std::chrono::milliseconds::max();
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

} // namespace discovery
} // namespace topowatch
