// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "analytics/graph_analytics.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "storage/repository.hpp"
#include "topology/graph_store.hpp"
#include "topology/identity_resolver.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace topowatch {
namespace engine {

struct EngineConfig {
  discovery::RoundConfig round;
  topology::LifecyclePolicy lifecycle;
  analytics::AnalysisOptions analysis;
  // Findings below this severity are persisted but not raised as events
  analytics::Severity alert_threshold{analytics::Severity::MEDIUM};
  size_t history_depth{64};
  bool analyze_after_commit{true};
};

/**
 * Outcome of one round (or one ingest of externally gathered records)
 */
struct RoundReport {
  uint64_t round_id{0};
  std::vector<discovery::PairReport> pairs;
  size_t records{0};
  size_t records_dropped{0};
  size_t devices_upserted{0};
  size_t links_upserted{0};
  size_t conflicts{0};
  uint64_t version{0};          // Current version after the commit
  bool published{false};        // A new version was published
  analytics::Findings findings; // Newly raised findings
  std::optional<std::string> error;

  bool ok() const { return !error.has_value(); }
};

/**
 * TopologyEngine - facade over discovery, resolution, storage and analytics
 *
 * RunRound runs the coordinator, then commits: Resolve against the current
 * snapshot and Apply to the store under one commit mutex, so concurrent
 * rounds serialize their commits while their probes overlap. Published
 * changes are mirrored into the repository, analytics run on the new
 * snapshot and newly appearing findings are appended and raised on
 * TopologyEvents().
 *
 * A round that hit its deadline without a single successful pair reports one
 * aggregated error. Observations it did collect are still committed.
 */
class TopologyEngine {
public:
  TopologyEngine(discovery::ProbeRegistry registry,
                 std::shared_ptr<storage::TopologyRepository> repository,
                 EngineConfig config = {});

  /**
   * Seed the store from the repository
   * Returns false if the persisted graph violates graph invariants
   */
  bool Initialize();

  RoundReport RunRound(const std::vector<discovery::Target> &targets,
                       const std::vector<std::string> &probe_set);

  // Commit records gathered outside the coordinator
  RoundReport Ingest(const discovery::ObservationSet &records);

  // Lifecycle sweep without new observations
  RoundReport Maintain();

  topology::GraphSnapshot CurrentSnapshot() const { return store_.CurrentSnapshot(); }
  std::optional<topology::GraphDiff> Diff(uint64_t from_version, uint64_t to_version) const {
    return store_.Diff(from_version, to_version);
  }

  analytics::AnalysisReport Analyze(const topology::GraphSnapshot &snapshot) const;

  bool SetMaintenance(const std::string &device_key, bool enabled, std::string &error);

  const EngineConfig &config() const { return config_; }
  const discovery::ProbeRegistry &registry() const { return coordinator_.registry(); }

private:
  void Commit(const discovery::ObservationSet &records, RoundReport &report);
  void Persist(const topology::TopologyGraph &before, const topology::TopologyGraph &after);
  void RaiseFindings(analytics::Findings findings, bool replace_active, RoundReport &report);
  analytics::Finding ConflictFinding(const topology::ResolverConflict &conflict,
                                     uint64_t version) const;

  EngineConfig config_;
  discovery::DiscoveryCoordinator coordinator_;
  topology::IdentityResolver resolver_;
  topology::GraphStore store_;
  analytics::GraphAnalytics analytics_;
  std::shared_ptr<storage::TopologyRepository> repository_;

  std::mutex commit_mutex_;                 // Serializes Resolve + Apply
  std::set<std::string> active_findings_;   // Ids raised by the last analysis
  std::set<std::string> raised_conflicts_;  // Conflict ids of the last ingest round
};

} // namespace engine
} // namespace topowatch
