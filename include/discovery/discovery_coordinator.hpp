// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/probe.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

struct BackoffPolicy {
  std::chrono::milliseconds initial{std::chrono::milliseconds(500)};
  double multiplier{2.0};
  std::chrono::milliseconds max{std::chrono::seconds(10)};

  // Delay before retry number `retry` (0-based)
  std::chrono::milliseconds Delay(int retry) const;
};

struct RoundConfig {
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(10)};
  size_t max_concurrency{8};
  int max_retries{2};
  int max_unreachable_retries{1};
  BackoffPolicy backoff;
  std::chrono::milliseconds round_deadline{std::chrono::minutes(2)};
};

enum class PairStatus { SUCCESS, PARTIAL_SUCCESS, FAILED };

std::string PairStatusToString(PairStatus status);

/**
 * Outcome of one (target, probe) pair across all its attempts
 */
struct PairReport {
  std::string target;
  std::string probe;
  PairStatus status{PairStatus::FAILED};
  std::optional<ProbeError> error;   // Last error (set unless SUCCESS)
  int attempts{0};
  size_t observations{0};
  std::chrono::milliseconds elapsed{0};
};

struct RoundResult {
  uint64_t round_id{0};
  int64_t started_at{0};
  int64_t finished_at{0};
  ObservationSet records;            // All observations from all attempts
  std::vector<PairReport> pairs;     // Sorted by (target, probe)
  bool deadline_exceeded{false};

  size_t SuccessCount() const;
  size_t FailureCount() const;

  // Deadline hit and not a single pair succeeded (even partially)
  bool TotalFailure() const;
};

/**
 * DiscoveryCoordinator - runs discovery rounds
 *
 * One task per (target, probe) pair is executed on a ThreadPool sized
 * min(max_concurrency, pair count). Each task owns its retries: TIMEOUT is
 * retried up to max_retries, UNREACHABLE up to
 * min(max_retries, max_unreachable_retries), every other error is terminal.
 * Observations gathered by failed attempts are kept.
 *
 * The round deadline cancels all outstanding attempts through the round
 * token; a pair that had not finished by then reports FAILED(TIMEOUT).
 *
 * Thread-safety: RunRound may be called concurrently; rounds share nothing
 * but the registry (read-only) and the round id counter.
 */
class DiscoveryCoordinator {
public:
  explicit DiscoveryCoordinator(ProbeRegistry registry);

  /**
   * Run one discovery round
   * @param targets Hosts/interfaces to probe
   * @param probe_set Probe ids to run; each target further filters by
   *        Target::probes. Unknown ids are reported as FAILED(INTERNAL).
   */
  RoundResult RunRound(const std::vector<Target> &targets,
                       const std::vector<std::string> &probe_set,
                       const RoundConfig &config);

  const ProbeRegistry &registry() const { return registry_; }

private:
  PairReport RunPair(const Target &target, Probe &probe, const RoundConfig &config,
                     const CancellationToken &round_token, ObservationSet &records);

  ProbeRegistry registry_;
  std::atomic<uint64_t> next_round_id_{1};
};

} // namespace discovery
} // namespace topowatch
