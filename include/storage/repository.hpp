// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "analytics/finding.hpp"
#include "topology/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace storage {

enum class ChangeType {
  DEVICE_ADDED,
  DEVICE_REMOVED,
  DEVICE_STATUS,
  LINK_ADDED,
  LINK_REMOVED,
  LINK_STATUS,
};

std::string ChangeTypeToString(ChangeType type);
std::optional<ChangeType> ChangeTypeFromString(const std::string &str);

/**
 * One entry of the topology audit trail
 */
struct TopologyChange {
  int64_t timestamp{0};
  ChangeType change_type{ChangeType::DEVICE_ADDED};
  std::string subject;      // Device or link key
  std::string device_type;  // Empty for links
  std::string details;
  uint64_t version{0};      // Snapshot version that introduced the change
};

// Audit entries for the transition `before` -> `after`
std::vector<TopologyChange> BuildChangeLog(const topology::TopologyGraph &before,
                                           const topology::TopologyGraph &after,
                                           const topology::GraphDiff &diff);

/**
 * Persistence collaborator
 *
 * Mutators may buffer; Flush() makes everything durable. All methods return
 * false on I/O failure and never throw.
 */
class TopologyRepository {
public:
  virtual ~TopologyRepository() = default;

  virtual bool SaveDevice(const topology::Device &device) = 0;
  virtual bool SaveLink(const topology::Link &link) = 0;
  virtual bool RemoveDevice(const std::string &key) = 0;
  virtual bool RemoveLink(const std::string &key) = 0;

  // Last persisted graph, or nullopt if nothing was ever saved
  virtual std::optional<topology::TopologyGraph> LoadGraphSnapshot() = 0;

  virtual bool AppendFinding(const analytics::Finding &finding) = 0;
  virtual bool AppendChange(const TopologyChange &change) = 0;

  virtual bool Flush() = 0;
};

} // namespace storage
} // namespace topowatch
