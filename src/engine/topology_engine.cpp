// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "engine/topology_engine.hpp"
#include "topology/notifications.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace topowatch {
namespace engine {

using analytics::Finding;
using analytics::Findings;
using topology::ApplyState;
using topology::GraphSnapshot;
using topology::TopologyGraph;

namespace {

// Pairs quoted in an aggregated round error
constexpr size_t kMaxQuotedFailures = 5;

void AppendError(RoundReport &report, const std::string &message) {
  report.error = report.error ? *report.error + "; " + message : message;
}

} // namespace

TopologyEngine::TopologyEngine(discovery::ProbeRegistry registry,
                               std::shared_ptr<storage::TopologyRepository> repository,
                               EngineConfig config)
    : config_(std::move(config)), coordinator_(std::move(registry)),
      store_(config_.lifecycle, config_.history_depth), analytics_(config_.analysis),
      repository_(std::move(repository)) {}

bool TopologyEngine::Initialize() {
  if (!repository_) {
    return true;
  }
  std::lock_guard<std::mutex> lock(commit_mutex_);
  auto graph = repository_->LoadGraphSnapshot();
  if (!graph) {
    LOG_INFO("no persisted topology, starting empty");
    return true;
  }
  ApplyState state;
  if (!store_.Restore(std::move(*graph), state)) {
    LOG_ERROR("persisted topology rejected: {} ({})", state.GetRejectReason(),
              state.GetDebugMessage());
    return false;
  }

  // Findings that still hold for the restored graph were raised before
  GraphSnapshot snapshot = store_.CurrentSnapshot();
  for (const auto &finding : analytics_.Analyze(*snapshot).findings) {
    active_findings_.insert(finding.Id());
  }
  LOG_INFO("restored topology version {}: {} device(s), {} link(s)", snapshot->version,
           snapshot->devices.size(), snapshot->links.size());
  return true;
}

RoundReport TopologyEngine::RunRound(const std::vector<discovery::Target> &targets,
                                     const std::vector<std::string> &probe_set) {
  discovery::RoundResult result = coordinator_.RunRound(targets, probe_set, config_.round);

  RoundReport report;
  report.round_id = result.round_id;
  report.pairs = result.pairs;

  if (result.TotalFailure()) {
    std::string message = "round " + std::to_string(result.round_id) +
                          " failed: deadline exceeded with no successful probe (" +
                          std::to_string(result.pairs.size()) + " pair(s))";
    size_t quoted = 0;
    for (const auto &pair : result.pairs) {
      if (!pair.error || quoted == kMaxQuotedFailures) {
        continue;
      }
      message += (quoted == 0 ? ": " : ", ") + pair.target + "/" + pair.probe + " " +
                 pair.error->ToString();
      ++quoted;
    }
    LOG_ERROR("{}", message);
    AppendError(report, message);
  }

  Commit(result.records, report);
  return report;
}

RoundReport TopologyEngine::Ingest(const discovery::ObservationSet &records) {
  RoundReport report;
  Commit(records, report);
  return report;
}

RoundReport TopologyEngine::Maintain() {
  RoundReport report;
  Commit({}, report);
  return report;
}

void TopologyEngine::Commit(const discovery::ObservationSet &records, RoundReport &report) {
  std::lock_guard<std::mutex> lock(commit_mutex_);
  GraphSnapshot base = store_.CurrentSnapshot();

  topology::GraphDelta delta = resolver_.Resolve(records, *base);
  report.records = delta.records_consumed;
  report.records_dropped = delta.records_dropped;
  report.devices_upserted = delta.upserted_devices.size();
  report.links_upserted = delta.upserted_links.size();
  report.conflicts = delta.conflicts.size();

  ApplyState state;
  GraphSnapshot snapshot = store_.Apply(delta, state);
  report.version = snapshot->version;

  // A conflict is raised once while consecutive rounds keep reporting it;
  // once a round no longer reports it, a later recurrence is raised again
  Findings conflicts;
  std::set<std::string> reported;
  for (const auto &conflict : delta.conflicts) {
    Finding finding = ConflictFinding(conflict, snapshot->version);
    const std::string id = finding.Id();
    if (reported.insert(id).second && !raised_conflicts_.count(id)) {
      conflicts.push_back(std::move(finding));
    }
  }
  if (!records.empty()) {
    raised_conflicts_ = std::move(reported);
  }

  if (!state.IsValid()) {
    std::string message = "apply rejected: " + state.GetRejectReason() + " (" +
                          state.GetDebugMessage() + ")";
    LOG_ERROR("{}, serving version {}", message, snapshot->version);
    AppendError(report, message);
    RaiseFindings(std::move(conflicts), false, report);
    if (repository_ && !report.findings.empty() && !repository_->Flush()) {
      LOG_ERROR("failed to flush repository after rejected apply");
    }
    return;
  }
  report.published = snapshot != base;

  if (report.published) {
    Persist(*base, *snapshot);
  }
  RaiseFindings(std::move(conflicts), false, report);
  if (report.published && config_.analyze_after_commit) {
    RaiseFindings(analytics_.Analyze(*snapshot).findings, true, report);
  }

  if (repository_ && (report.published || !report.findings.empty())) {
    if (!repository_->Flush()) {
      LOG_ERROR("failed to flush repository after version {}", snapshot->version);
    }
  }
}

void TopologyEngine::Persist(const TopologyGraph &before, const TopologyGraph &after) {
  if (!repository_) {
    return;
  }
  bool ok = true;
  for (const auto &[key, device] : after.devices) {
    const auto *previous = before.FindDevice(key);
    if (!previous || !(*previous == device)) {
      ok &= repository_->SaveDevice(device);
    }
  }
  for (const auto &[key, device] : before.devices) {
    if (!after.FindDevice(key)) {
      ok &= repository_->RemoveDevice(key);
    }
  }
  for (const auto &[key, link] : after.links) {
    const auto *previous = before.FindLink(key);
    if (!previous || !(*previous == link)) {
      ok &= repository_->SaveLink(link);
    }
  }
  for (const auto &[key, link] : before.links) {
    if (!after.FindLink(key)) {
      ok &= repository_->RemoveLink(key);
    }
  }
  for (const auto &change :
       storage::BuildChangeLog(before, after, topology::ComputeDiff(before, after))) {
    ok &= repository_->AppendChange(change);
  }
  if (!ok) {
    LOG_WARN("repository rejected part of version {}", after.version);
  }
}

void TopologyEngine::RaiseFindings(Findings findings, bool replace_active,
                                   RoundReport &report) {
  std::set<std::string> current;
  for (auto &finding : findings) {
    const std::string id = finding.Id();
    current.insert(id);
    if (replace_active && active_findings_.count(id)) {
      continue;
    }
    if (repository_ && !repository_->AppendFinding(finding)) {
      LOG_WARN("repository rejected finding {}", id);
    }
    if (finding.severity >= config_.alert_threshold) {
      LOG_INFO("{} finding: {}", analytics::SeverityToString(finding.severity),
               finding.description);
      topology::TopologyEvents().NotifyFindingRaised(finding);
    }
    report.findings.push_back(std::move(finding));
  }
  if (replace_active) {
    active_findings_ = std::move(current);
  }
}

Finding TopologyEngine::ConflictFinding(const topology::ResolverConflict &conflict,
                                        uint64_t version) const {
  Finding finding;
  finding.type = analytics::FindingType::RESOLVER_CONFLICT;
  finding.subjects = {conflict.device_key, conflict.conflicting_ip};
  finding.affected_nodes = 1;
  finding.risk_score = analytics::RiskScore(0.0, 0, 0.0);
  finding.severity = analytics::Severity::MEDIUM;
  finding.description = "Address conflict: " + conflict.Describe();
  finding.recommendation = "Confirm the current address of " + conflict.device_key +
                           " and correct the source reporting the stale binding";
  finding.snapshot_version = version;
  finding.detected_at = util::GetTime();
  return finding;
}

analytics::AnalysisReport TopologyEngine::Analyze(const GraphSnapshot &snapshot) const {
  if (!snapshot) {
    return {};
  }
  return analytics_.Analyze(*snapshot);
}

bool TopologyEngine::SetMaintenance(const std::string &device_key, bool enabled,
                                    std::string &error) {
  std::lock_guard<std::mutex> lock(commit_mutex_);
  GraphSnapshot base = store_.CurrentSnapshot();
  ApplyState state;
  if (!store_.SetMaintenance(device_key, enabled, state)) {
    error = state.GetRejectReason() + ": " + state.GetDebugMessage();
    return false;
  }
  GraphSnapshot snapshot = store_.CurrentSnapshot();
  if (snapshot != base) {
    Persist(*base, *snapshot);
    if (repository_ && !repository_->Flush()) {
      LOG_ERROR("failed to flush repository after version {}", snapshot->version);
    }
  }
  return true;
}

} // namespace engine
} // namespace topowatch
