// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/types.hpp"
#include <algorithm>

namespace topowatch {
namespace topology {

std::string DeviceStatusToString(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::UNKNOWN:
    return "unknown";
  case DeviceStatus::ONLINE:
    return "online";
  case DeviceStatus::WARNING:
    return "warning";
  case DeviceStatus::OFFLINE:
    return "offline";
  case DeviceStatus::MAINTENANCE:
    return "maintenance";
  }
  return "unknown";
}

std::optional<DeviceStatus> DeviceStatusFromString(const std::string &str) {
  if (str == "unknown")
    return DeviceStatus::UNKNOWN;
  if (str == "online")
    return DeviceStatus::ONLINE;
  if (str == "warning")
    return DeviceStatus::WARNING;
  if (str == "offline")
    return DeviceStatus::OFFLINE;
  if (str == "maintenance")
    return DeviceStatus::MAINTENANCE;
  return std::nullopt;
}

std::string MacKey(const std::string &normalized_mac) { return "mac:" + normalized_mac; }

std::string IpKey(const std::string &normalized_ip) { return "ip:" + normalized_ip; }

std::string VendorKey(const std::string &vendor_id) { return "vid:" + vendor_id; }

std::string LinkKey(const std::string &a, const std::string &b, const std::string &link_type) {
  if (b < a) {
    return b + "|" + a + "|" + link_type;
  }
  return a + "|" + b + "|" + link_type;
}

bool RekeyLinkEndpoint(Link &link, const std::string &from, const std::string &to) {
  if (link.a == from)
    link.a = to;
  if (link.b == from)
    link.b = to;
  if (link.a == link.b) {
    return false;
  }
  if (link.b < link.a) {
    std::swap(link.a, link.b);
    std::swap(link.port_a, link.port_b);
  }
  link.key = LinkKey(link.a, link.b, link.link_type);
  return true;
}

void FoldLink(Link &into, const Link &from) {
  into.discovered_via.insert(from.discovered_via.begin(), from.discovered_via.end());
  if (into.first_seen == 0 || (from.first_seen != 0 && from.first_seen < into.first_seen))
    into.first_seen = from.first_seen;
  into.last_seen = std::max(into.last_seen, from.last_seen);
  if (into.port_a.empty())
    into.port_a = from.port_a;
  if (into.port_b.empty())
    into.port_b = from.port_b;
  if (from.status == DeviceStatus::ONLINE)
    into.status = DeviceStatus::ONLINE;
}

// ============================================================================
// Attribute / Device
// ============================================================================

bool Attribute::Outranks(const Attribute &other) const {
  if (confidence != other.confidence) {
    return confidence > other.confidence;
  }
  if (timestamp != other.timestamp) {
    return timestamp > other.timestamp;
  }
  if (active_source != other.active_source) {
    return active_source;
  }
  if (value != other.value) {
    return value < other.value;
  }
  // Same observation from another probe: stable on source id
  return source < other.source;
}

std::string Device::Get(const std::string &name) const {
  auto it = attributes.find(name);
  return it == attributes.end() ? "" : it->second.value;
}

std::optional<std::string> Device::ip() const {
  auto it = attributes.find(attr::IP);
  if (it == attributes.end() || it->second.value.empty()) {
    return std::nullopt;
  }
  return it->second.value;
}

double Device::ComputeConfidence() const {
  double miss = 1.0;
  for (const auto &[source, c] : source_confidence) {
    miss *= 1.0 - std::clamp(c, 0.0, 1.0);
  }
  return 1.0 - miss;
}

// ============================================================================
// TopologyGraph
// ============================================================================

const Device *TopologyGraph::FindDevice(const std::string &key) const {
  auto it = devices.find(key);
  return it == devices.end() ? nullptr : &it->second;
}

const Link *TopologyGraph::FindLink(const std::string &key) const {
  auto it = links.find(key);
  return it == links.end() ? nullptr : &it->second;
}

std::vector<std::string> TopologyGraph::Neighbors(const std::string &key) const {
  std::set<std::string> out;
  for (const auto &[lk, link] : links) {
    if (link.a == key) {
      out.insert(link.b);
    } else if (link.b == key) {
      out.insert(link.a);
    }
  }
  return {out.begin(), out.end()};
}

std::string ResolverConflict::Describe() const {
  return device_key + " bound to " + existing_ip + " by " + existing_source + ", " +
         conflicting_source + " reports " + conflicting_ip;
}

// ============================================================================
// Diff
// ============================================================================

bool GraphDiff::empty() const {
  return added_devices.empty() && removed_devices.empty() && device_status_changed.empty() &&
         added_links.empty() && removed_links.empty() && link_status_changed.empty();
}

namespace {

template <typename T>
void DiffMaps(const std::map<std::string, T> &from, const std::map<std::string, T> &to,
              std::vector<std::string> &added, std::vector<std::string> &removed,
              std::vector<StatusChange> &changed) {
  for (const auto &[key, item] : to) {
    auto it = from.find(key);
    if (it == from.end()) {
      added.push_back(key);
    } else if (it->second.status != item.status) {
      changed.push_back(StatusChange{key, it->second.status, item.status});
    }
  }
  for (const auto &[key, item] : from) {
    if (to.find(key) == to.end()) {
      removed.push_back(key);
    }
  }
}

} // namespace

GraphDiff ComputeDiff(const TopologyGraph &from, const TopologyGraph &to) {
  GraphDiff diff;
  diff.from_version = from.version;
  diff.to_version = to.version;
  DiffMaps(from.devices, to.devices, diff.added_devices, diff.removed_devices,
           diff.device_status_changed);
  DiffMaps(from.links, to.links, diff.added_links, diff.removed_links, diff.link_status_changed);
  return diff;
}

} // namespace topology
} // namespace topowatch
