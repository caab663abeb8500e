// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "analytics/finding.hpp"
#include "topology/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace analytics {

struct AnalysisOptions {
  // Node removal raising the diameter above factor * diameter is a SPOF
  double diameter_factor{1.5};
  // Normalized edge betweenness at which a link is a bottleneck
  double bottleneck_share{0.5};
  // Normalized node betweenness at which a node is flagged as high load
  double high_load_threshold{0.5};
  size_t top_n{5};
  bool include_offline{false};
  // Skip the per-node diameter recomputation above this many nodes
  size_t max_nodes_for_removal_analysis{256};
};

struct AnalysisReport {
  uint64_t snapshot_version{0};
  size_t node_count{0};
  size_t edge_count{0};                         // Distinct adjacent pairs
  std::map<size_t, size_t> degree_distribution; // degree -> node count
  double average_degree{0.0};
  double density{0.0};
  std::vector<std::vector<std::string>> components; // Largest first
  std::optional<size_t> diameter;               // nullopt if empty or disconnected
  double average_clustering{0.0};
  std::map<std::string, size_t> degree;
  std::map<std::string, double> clustering;
  std::map<std::string, double> betweenness;      // Normalized
  std::map<std::string, double> edge_betweenness; // Link key -> normalized
  std::vector<std::string> critical_nodes;        // Top-N by betweenness
  Findings findings;                              // Highest risk first

  size_t component_count() const { return components.size(); }
};

/**
 * GraphAnalytics - structural metrics and vulnerability findings
 *
 * Works on a read-only snapshot. Parallel links between the same pair of
 * devices count as one edge. Offline devices and links are left out unless
 * include_offline is set. Empty, disconnected and single-node graphs are
 * valid input.
 */
class GraphAnalytics {
public:
  explicit GraphAnalytics(AnalysisOptions options = {});

  AnalysisReport Analyze(const topology::TopologyGraph &graph) const;

  const AnalysisOptions &options() const { return options_; }

private:
  AnalysisOptions options_;
};

} // namespace analytics
} // namespace topowatch
