// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace topowatch {
namespace discovery {

/**
 * Cooperative cancellation for probe tasks
 *
 * A token is cancelled when Cancel() is called on it or any ancestor, or when
 * its own deadline (or an ancestor's) has passed. The coordinator holds the
 * round token; each probe attempt gets a child with the per-probe deadline,
 * so cancelling the round reaches every attempt while a per-probe timeout
 * affects only its own task.
 *
 * Thread-safety: all methods may be called concurrently. Copies share state.
 */
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken();

  // Token that expires at the given deadline
  static CancellationToken WithDeadline(Clock::time_point deadline);

  // Child inherits cancellation from this token and adds its own deadline
  // (the effective deadline is the earlier of the two)
  CancellationToken Child(Clock::time_point deadline) const;

  void Cancel();

  bool IsCancelled() const;

  // Time left before the effective deadline (zero if cancelled/expired)
  std::chrono::milliseconds Remaining() const;

  Clock::time_point Deadline() const;

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<State> parent;
  };

  explicit CancellationToken(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

} // namespace discovery
} // namespace topowatch
