// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "topology/types.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace topowatch {
namespace topology {

/**
 * Result of a store mutation (Apply, Restore, SetMaintenance)
 */
class ApplyState {
public:
  enum class Result {
    VALID,
    INVALID, // Graph invariant violation, nothing published
    ERROR    // Bad request (unknown key, stale graph)
  };

  ApplyState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason, const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason, const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

/**
 * Lifecycle thresholds, in seconds since a device or link was last seen
 */
struct LifecyclePolicy {
  int64_t warning_after{300};
  int64_t grace_period{900};
  int64_t retention_period{86400};
};

/**
 * Check graph invariants: every link endpoint is a known device, no self
 * loops, map keys match the element keys, link endpoints ordered.
 * Returns false with a description of the first violation.
 */
bool CheckGraphInvariants(const TopologyGraph &graph, std::string &violation);

/**
 * GraphStore - versioned, immutable topology snapshots
 *
 * Single writer: Apply, Restore and SetMaintenance serialize on an internal
 * mutex. Readers take a shared_ptr copy of the current snapshot under a
 * short-lived lock and never block the writer for longer than that.
 *
 * Each mutation builds the next graph from a copy of the current one,
 * validates it and swaps it in with version + 1. A mutation that changes
 * nothing publishes nothing. A mutation that breaks an invariant is
 * rejected through ApplyState and the previous snapshot stays current.
 *
 * After a publish the store emits per-element change events followed by
 * SnapshotPublished on TopologyEvents(), on the calling thread.
 */
class GraphStore {
public:
  explicit GraphStore(LifecyclePolicy policy = {}, size_t history_depth = 64);

  GraphSnapshot CurrentSnapshot() const;

  // Retained snapshot with `version`, or nullptr if evicted/unknown
  GraphSnapshot Snapshot(uint64_t version) const;

  /**
   * Apply a resolver delta followed by a lifecycle sweep at util::GetTime()
   * @return The snapshot current after the call (new or unchanged)
   */
  GraphSnapshot Apply(const GraphDelta &delta, ApplyState &state);

  // Lifecycle sweep only
  GraphSnapshot Sweep(ApplyState &state);

  /**
   * Changes between two retained versions
   * @return nullopt if either version is not retained
   */
  std::optional<GraphDiff> Diff(uint64_t from_version, uint64_t to_version) const;

  /**
   * Replace the current graph with `graph` (e.g. loaded from persistence).
   * The restored snapshot gets a version above the current one.
   */
  bool Restore(TopologyGraph graph, ApplyState &state);

  // Operator hook: enter or leave Maintenance
  bool SetMaintenance(const std::string &device_key, bool enabled, ApplyState &state);

  const LifecyclePolicy &policy() const { return policy_; }
  uint64_t version() const;

private:
  // Status implied by age alone
  DeviceStatus StatusForAge(int64_t age) const;

  // Sweep `graph` at `now`: update statuses, prune expired elements
  void RunLifecycle(TopologyGraph &graph, int64_t now) const;

  // Validate, version and publish `next` built from `base`. Caller holds
  // apply_mutex_.
  GraphSnapshot Publish(const GraphSnapshot &base, TopologyGraph next, ApplyState &state,
                        uint64_t min_version = 0);

  void EmitEvents(const TopologyGraph &before, const GraphSnapshot &after,
                  const GraphDiff &diff) const;

  const LifecyclePolicy policy_;
  const size_t history_depth_;

  std::mutex apply_mutex_;            // Single writer
  mutable std::mutex snapshot_mutex_; // Guards current_ and history_
  GraphSnapshot current_;
  std::deque<GraphSnapshot> history_; // Oldest first, includes current_
};

} // namespace topology
} // namespace topowatch
