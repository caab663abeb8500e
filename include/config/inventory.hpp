// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "analytics/finding.hpp"
#include "discovery/types.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace config {

/**
 * One monitored network from the inventory document
 */
struct NetworkSpec {
  std::string name;
  std::vector<std::string> addresses;  // Hosts and IPv4 CIDR blocks
  std::vector<std::string> interfaces; // Local interfaces for link-layer listening
  std::vector<std::string> probes;     // Active probe ids; empty = all active probes
  std::string credentials;             // Key into Inventory::credentials
  uint16_t port{0};                    // Override of the probe default port
  std::string location;
  analytics::Severity alert_threshold{analytics::Severity::MEDIUM};
  int scan_interval{300};              // Seconds between rounds
};

/**
 * Inventory - targets and credentials, loaded from JSON
 *
 * {
 *   "version": 1,
 *   "credentials": { "core": { "username": "admin", "password": "..." } },
 *   "networks": [
 *     { "name": "office", "addresses": ["10.0.0.0/29", "10.0.1.1"],
 *       "interfaces": ["eth0"], "probes": ["cli"], "credentials": "core",
 *       "location": "HQ", "alert_threshold": "high", "scan_interval": 300 }
 *   ]
 * }
 */
struct Inventory {
  static constexpr int VERSION = 1;
  static constexpr size_t DEFAULT_MAX_HOSTS_PER_ENTRY = 1024;

  std::vector<NetworkSpec> networks;
  std::map<std::string, discovery::Credentials> credentials;

  /**
   * Parse an inventory document
   * @param error Set to a description of the first problem on failure
   */
  static std::optional<Inventory> Parse(const std::string &text, std::string &error);
  static std::optional<Inventory> LoadFile(const std::filesystem::path &path,
                                           std::string &error);

  /**
   * Expand networks into probe targets
   *
   * Every address becomes a target for the network's active probes;
   * every interface becomes a target "if:<name>" for the link-layer probe.
   * A target id listed by several networks keeps its first definition.
   *
   * @param link_layer_probe Id of the passive listener ("lldp")
   * @param active_probes Ids used when a network lists no probes
   */
  std::vector<discovery::Target> BuildTargets(const std::string &link_layer_probe,
                                              const std::vector<std::string> &active_probes,
                                              size_t max_hosts_per_entry =
                                                  DEFAULT_MAX_HOSTS_PER_ENTRY) const;

  // Union of every network's probe set plus the link-layer probe if needed
  std::vector<std::string> ProbeSet(const std::string &link_layer_probe,
                                    const std::vector<std::string> &active_probes) const;

  // Lowest alert threshold across networks
  analytics::Severity AlertThreshold() const;

  // Shortest scan interval across networks
  int ScanInterval() const;
};

} // namespace config
} // namespace topowatch
