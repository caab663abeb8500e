// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace topowatch {
namespace topology {

/**
 * Topology data model
 *
 * Devices and links are stored by identity key in ordered maps; links refer
 * to devices by key only. Identity keys:
 *   mac:<aa:bb:cc:dd:ee:ff>   primary
 *   ip:<address>             provisional (no MAC known yet)
 *   vid:<vendor id>          provisional (neither MAC nor IP known)
 */

enum class DeviceStatus {
  UNKNOWN,
  ONLINE,
  WARNING,
  OFFLINE,
  MAINTENANCE,
};

std::string DeviceStatusToString(DeviceStatus status);
std::optional<DeviceStatus> DeviceStatusFromString(const std::string &str);

std::string MacKey(const std::string &normalized_mac);
std::string IpKey(const std::string &normalized_ip);
std::string VendorKey(const std::string &vendor_id);

// Ordered link key "a|b|type" with a < b
std::string LinkKey(const std::string &a, const std::string &b, const std::string &link_type);

struct Link;

// Move endpoint `from` of `link` to `to`, reordering endpoints and ports and
// recomputing the key. Returns false if the link collapses to a self-loop.
bool RekeyLinkEndpoint(Link &link, const std::string &from, const std::string &to);

// Fold a duplicate of `into` (same key after a re-key) into it
void FoldLink(Link &into, const Link &from);

// Device attribute names carried with provenance
namespace attr {
inline constexpr const char *IP = "ip";
inline constexpr const char *HOSTNAME = "hostname";
inline constexpr const char *DEVICE_TYPE = "device_type";
inline constexpr const char *VENDOR = "vendor";
inline constexpr const char *MODEL = "model";
inline constexpr const char *OS_VERSION = "os_version";
inline constexpr const char *VENDOR_ID = "vendor_id";
inline constexpr const char *NETWORK = "network";
inline constexpr const char *LOCATION = "location";
} // namespace attr

/**
 * One attribute value together with the observation that set it
 */
struct Attribute {
  std::string value;
  double confidence{0.0};
  int64_t timestamp{0};
  bool active_source{false};
  std::string source;

  /**
   * Merge precedence: higher confidence, then newer timestamp, then active
   * over passive source, then the lexicographically smaller value. Returns
   * true if `this` strictly beats `other`.
   */
  bool Outranks(const Attribute &other) const;

  bool operator==(const Attribute &) const = default;
};

struct Device {
  std::string key;
  std::string mac;                              // Empty while provisional
  std::map<std::string, Attribute> attributes;  // attr::* -> provenance
  DeviceStatus status{DeviceStatus::UNKNOWN};
  double confidence{0.0};
  int64_t first_seen{0};
  int64_t last_seen{0};
  std::set<std::string> sources;
  std::map<std::string, double> source_confidence;  // Best hint per source

  bool provisional() const { return mac.empty(); }

  // Attribute value or "" if unset
  std::string Get(const std::string &name) const;
  std::optional<std::string> ip() const;

  // 1 - prod(1 - c) over source_confidence
  double ComputeConfidence() const;

  bool operator==(const Device &) const = default;
};

struct Link {
  std::string key;
  std::string a;                // a < b
  std::string b;
  std::string link_type;        // "physical", "logical", "inferred"
  std::string port_a;
  std::string port_b;
  std::set<std::string> discovered_via;
  DeviceStatus status{DeviceStatus::ONLINE};
  int64_t first_seen{0};
  int64_t last_seen{0};

  bool operator==(const Link &) const = default;
};

/**
 * Immutable once published through the GraphStore
 */
struct TopologyGraph {
  uint64_t version{0};
  int64_t created_at{0};
  std::map<std::string, Device> devices;
  std::map<std::string, Link> links;

  const Device *FindDevice(const std::string &key) const;
  const Link *FindLink(const std::string &key) const;

  // Keys of devices adjacent to `key`
  std::vector<std::string> Neighbors(const std::string &key) const;
};

using GraphSnapshot = std::shared_ptr<const TopologyGraph>;

/**
 * A MAC-to-IP binding disagreement between sources
 */
struct ResolverConflict {
  std::string device_key;
  std::string existing_ip;
  std::string existing_source;
  std::string conflicting_ip;
  std::string conflicting_source;
  int64_t detected_at{0};

  std::string Describe() const;
};

/**
 * Output of the IdentityResolver for one round
 */
struct GraphDelta {
  std::vector<Device> upserted_devices;
  std::vector<Link> upserted_links;
  std::map<std::string, std::string> rekeyed;  // old key -> new key
  std::vector<ResolverConflict> conflicts;
  int64_t observed_at{0};
  size_t records_consumed{0};
  size_t records_dropped{0};

  bool empty() const {
    return upserted_devices.empty() && upserted_links.empty() && rekeyed.empty();
  }
};

struct StatusChange {
  std::string key;
  DeviceStatus from{DeviceStatus::UNKNOWN};
  DeviceStatus to{DeviceStatus::UNKNOWN};

  bool operator==(const StatusChange &) const = default;
};

struct GraphDiff {
  uint64_t from_version{0};
  uint64_t to_version{0};
  std::vector<std::string> added_devices;
  std::vector<std::string> removed_devices;
  std::vector<StatusChange> device_status_changed;
  std::vector<std::string> added_links;
  std::vector<std::string> removed_links;
  std::vector<StatusChange> link_status_changed;

  bool empty() const;
};

// Diff between two graphs (keys sorted)
GraphDiff ComputeDiff(const TopologyGraph &from, const TopologyGraph &to);

} // namespace topology
} // namespace topowatch
