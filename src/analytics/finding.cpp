// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "analytics/finding.hpp"
#include <algorithm>

namespace topowatch {
namespace analytics {

std::string FindingTypeToString(FindingType type) {
  switch (type) {
  case FindingType::SINGLE_POINT_OF_FAILURE:
    return "single_point_of_failure";
  case FindingType::BOTTLENECK_LINK:
    return "bottleneck_link";
  case FindingType::HIGH_LOAD_NODE:
    return "high_load_node";
  case FindingType::CONNECTIVITY_RISK:
    return "connectivity_risk";
  case FindingType::RESOLVER_CONFLICT:
    return "resolver_conflict";
  }
  return "unknown";
}

std::optional<FindingType> FindingTypeFromString(const std::string &str) {
  for (FindingType type :
       {FindingType::SINGLE_POINT_OF_FAILURE, FindingType::BOTTLENECK_LINK,
        FindingType::HIGH_LOAD_NODE, FindingType::CONNECTIVITY_RISK,
        FindingType::RESOLVER_CONFLICT}) {
    if (FindingTypeToString(type) == str) {
      return type;
    }
  }
  return std::nullopt;
}

std::string SeverityToString(Severity severity) {
  switch (severity) {
  case Severity::MEDIUM:
    return "medium";
  case Severity::HIGH:
    return "high";
  case Severity::CRITICAL:
    return "critical";
  }
  return "medium";
}

std::optional<Severity> SeverityFromString(const std::string &str) {
  if (str == "medium")
    return Severity::MEDIUM;
  if (str == "high")
    return Severity::HIGH;
  if (str == "critical")
    return Severity::CRITICAL;
  return std::nullopt;
}

Severity SeverityForScore(double risk_score) {
  if (risk_score >= 70.0)
    return Severity::CRITICAL;
  if (risk_score >= 45.0)
    return Severity::HIGH;
  return Severity::MEDIUM;
}

double RiskScore(double affected_node_ratio, size_t affected_links,
                 double centrality_percentile) {
  const double nodes = std::clamp(affected_node_ratio, 0.0, 1.0) * 50.0;
  const double links = static_cast<double>(std::min<size_t>(affected_links, 5)) / 5.0 * 20.0;
  const double centrality = std::clamp(centrality_percentile, 0.0, 1.0) * 30.0;
  return nodes + links + centrality;
}

std::string Finding::Id() const {
  std::string id = FindingTypeToString(type) + ":";
  for (size_t i = 0; i < subjects.size(); ++i) {
    if (i > 0)
      id += ",";
    id += subjects[i];
  }
  return id;
}

} // namespace analytics
} // namespace topowatch
