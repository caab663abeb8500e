// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace analytics {

enum class FindingType {
  SINGLE_POINT_OF_FAILURE,
  BOTTLENECK_LINK,
  HIGH_LOAD_NODE,
  CONNECTIVITY_RISK,
  RESOLVER_CONFLICT,
};

enum class Severity {
  MEDIUM,
  HIGH,
  CRITICAL,
};

std::string FindingTypeToString(FindingType type);
std::optional<FindingType> FindingTypeFromString(const std::string &str);
std::string SeverityToString(Severity severity);
std::optional<Severity> SeverityFromString(const std::string &str);

// Severity band for a 0..100 risk score: >= 70 critical, >= 45 high
Severity SeverityForScore(double risk_score);

/**
 * Risk score from the three inputs findings are graded on
 * @param affected_node_ratio Share of nodes cut off or rerouted (0..1)
 * @param affected_links Links carried by or lost with the subject
 * @param centrality_percentile Subject's betweenness percentile (0..1)
 */
double RiskScore(double affected_node_ratio, size_t affected_links, double centrality_percentile);

/**
 * A vulnerability or conflict report attached to a snapshot version
 */
struct Finding {
  FindingType type{FindingType::CONNECTIVITY_RISK};
  Severity severity{Severity::MEDIUM};
  double risk_score{0.0};
  std::vector<std::string> subjects;   // Device keys or link keys
  size_t affected_nodes{0};
  size_t affected_links{0};
  double centrality_percentile{0.0};
  std::string description;
  std::string recommendation;
  uint64_t snapshot_version{0};
  int64_t detected_at{0};

  // Stable identity across rounds: "<type>:<subject>,<subject>"
  std::string Id() const;
};

using Findings = std::vector<Finding>;

} // namespace analytics
} // namespace topowatch
