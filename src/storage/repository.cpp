// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/repository.hpp"

namespace topowatch {
namespace storage {

using topology::DeviceStatusToString;

std::string ChangeTypeToString(ChangeType type) {
  switch (type) {
  case ChangeType::DEVICE_ADDED:
    return "device_added";
  case ChangeType::DEVICE_REMOVED:
    return "device_removed";
  case ChangeType::DEVICE_STATUS:
    return "device_status";
  case ChangeType::LINK_ADDED:
    return "link_added";
  case ChangeType::LINK_REMOVED:
    return "link_removed";
  case ChangeType::LINK_STATUS:
    return "link_status";
  }
  return "unknown";
}

std::optional<ChangeType> ChangeTypeFromString(const std::string &str) {
  for (ChangeType type : {ChangeType::DEVICE_ADDED, ChangeType::DEVICE_REMOVED,
                          ChangeType::DEVICE_STATUS, ChangeType::LINK_ADDED,
                          ChangeType::LINK_REMOVED, ChangeType::LINK_STATUS}) {
    if (ChangeTypeToString(type) == str) {
      return type;
    }
  }
  return std::nullopt;
}

std::vector<TopologyChange> BuildChangeLog(const topology::TopologyGraph &before,
                                           const topology::TopologyGraph &after,
                                           const topology::GraphDiff &diff) {
  std::vector<TopologyChange> log;
  auto add = [&](ChangeType type, const std::string &subject, const std::string &device_type,
                 std::string details) {
    TopologyChange change;
    change.timestamp = after.created_at;
    change.change_type = type;
    change.subject = subject;
    change.device_type = device_type;
    change.details = std::move(details);
    change.version = after.version;
    log.push_back(std::move(change));
  };

  for (const auto &key : diff.added_devices) {
    const auto &device = after.devices.at(key);
    std::string name = device.Get(topology::attr::HOSTNAME);
    add(ChangeType::DEVICE_ADDED, key, device.Get(topology::attr::DEVICE_TYPE),
        "discovered" + (name.empty() ? "" : " " + name) + " via " +
            (device.sources.empty() ? "unknown" : *device.sources.begin()));
  }
  for (const auto &key : diff.removed_devices) {
    const auto &device = before.devices.at(key);
    add(ChangeType::DEVICE_REMOVED, key, device.Get(topology::attr::DEVICE_TYPE),
        "not seen since " + std::to_string(device.last_seen));
  }
  for (const auto &change : diff.device_status_changed) {
    add(ChangeType::DEVICE_STATUS, change.key,
        after.devices.at(change.key).Get(topology::attr::DEVICE_TYPE),
        DeviceStatusToString(change.from) + " -> " + DeviceStatusToString(change.to));
  }
  for (const auto &key : diff.added_links) {
    const auto &link = after.links.at(key);
    add(ChangeType::LINK_ADDED, key, "", link.link_type + " link " + link.a + " - " + link.b);
  }
  for (const auto &key : diff.removed_links) {
    const auto &link = before.links.at(key);
    add(ChangeType::LINK_REMOVED, key, "", link.link_type + " link " + link.a + " - " + link.b);
  }
  for (const auto &change : diff.link_status_changed) {
    add(ChangeType::LINK_STATUS, change.key, "",
        DeviceStatusToString(change.from) + " -> " + DeviceStatusToString(change.to));
  }
  return log;
}

} // namespace storage
} // namespace topowatch
