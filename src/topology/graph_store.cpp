// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/graph_store.hpp"
#include "topology/notifications.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <set>
#include <vector>

namespace topowatch {
namespace topology {

namespace {

int StatusRank(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::WARNING:
    return 1;
  case DeviceStatus::OFFLINE:
    return 2;
  default:
    return 0;
  }
}

} // namespace

bool CheckGraphInvariants(const TopologyGraph &graph, std::string &violation) {
  for (const auto &[key, device] : graph.devices) {
    if (device.key != key) {
      violation = "device stored under " + key + " has key " + device.key;
      return false;
    }
    if (!device.mac.empty() && key != MacKey(device.mac)) {
      violation = "device " + key + " carries mac " + device.mac;
      return false;
    }
  }
  for (const auto &[key, link] : graph.links) {
    if (link.a == link.b) {
      violation = "self-loop link " + key;
      return false;
    }
    if (link.key != key || key != LinkKey(link.a, link.b, link.link_type) || !(link.a < link.b)) {
      violation = "link stored under " + key + " does not match its endpoints";
      return false;
    }
    if (!graph.FindDevice(link.a) || !graph.FindDevice(link.b)) {
      violation = "link " + key + " references an unknown device";
      return false;
    }
  }
  return true;
}

GraphStore::GraphStore(LifecyclePolicy policy, size_t history_depth)
    : policy_(policy), history_depth_(std::max<size_t>(1, history_depth)),
      current_(std::make_shared<const TopologyGraph>()) {
  history_.push_back(current_);
}

GraphSnapshot GraphStore::CurrentSnapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return current_;
}

uint64_t GraphStore::version() const { return CurrentSnapshot()->version; }

GraphSnapshot GraphStore::Snapshot(uint64_t version) const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  for (const auto &snapshot : history_) {
    if (snapshot->version == version) {
      return snapshot;
    }
  }
  return nullptr;
}

std::optional<GraphDiff> GraphStore::Diff(uint64_t from_version, uint64_t to_version) const {
  GraphSnapshot from = Snapshot(from_version);
  GraphSnapshot to = Snapshot(to_version);
  if (!from || !to) {
    return std::nullopt;
  }
  return ComputeDiff(*from, *to);
}

// ============================================================================
// Lifecycle
// ============================================================================

DeviceStatus GraphStore::StatusForAge(int64_t age) const {
  if (age >= policy_.grace_period) {
    return DeviceStatus::OFFLINE;
  }
  if (age >= policy_.warning_after) {
    return DeviceStatus::WARNING;
  }
  return DeviceStatus::ONLINE;
}

void GraphStore::RunLifecycle(TopologyGraph &graph, int64_t now) const {
  std::set<std::string> pruned;
  for (auto it = graph.devices.begin(); it != graph.devices.end();) {
    Device &device = it->second;
    const int64_t age = now - device.last_seen;
    if (age >= policy_.retention_period) {
      LOG_GRAPH_DEBUG("pruning device {} (unseen for {}s)", it->first, age);
      pruned.insert(it->first);
      it = graph.devices.erase(it);
      continue;
    }
    if (device.status != DeviceStatus::MAINTENANCE) {
      device.status = StatusForAge(age);
    }
    ++it;
  }

  for (auto it = graph.links.begin(); it != graph.links.end();) {
    Link &link = it->second;
    const int64_t age = now - link.last_seen;
    if (pruned.count(link.a) || pruned.count(link.b) || age >= policy_.retention_period) {
      LOG_GRAPH_DEBUG("pruning link {}", it->first);
      it = graph.links.erase(it);
      continue;
    }
    // A link is no healthier than its endpoints
    int rank = StatusRank(StatusForAge(age));
    for (const std::string &end : {link.a, link.b}) {
      if (const Device *device = graph.FindDevice(end)) {
        rank = std::max(rank, StatusRank(device->status));
      }
    }
    link.status = rank == 2 ? DeviceStatus::OFFLINE
                            : (rank == 1 ? DeviceStatus::WARNING : DeviceStatus::ONLINE);
    ++it;
  }
}

// ============================================================================
// Mutations
// ============================================================================

GraphSnapshot GraphStore::Apply(const GraphDelta &delta, ApplyState &state) {
  std::lock_guard<std::mutex> writer(apply_mutex_);
  GraphSnapshot base = CurrentSnapshot();
  TopologyGraph next = *base;

  for (const auto &[from, to] : delta.rekeyed) {
    auto it = next.devices.find(from);
    if (it != next.devices.end()) {
      Device device = std::move(it->second);
      next.devices.erase(it);
      if (!next.devices.count(to)) {
        device.key = to;
        if (to.rfind("mac:", 0) == 0) {
          device.mac = to.substr(4);
        }
        next.devices.emplace(to, std::move(device));
      }
    }

    std::vector<Link> moving;
    for (auto lit = next.links.begin(); lit != next.links.end();) {
      if (lit->second.a == from || lit->second.b == from) {
        moving.push_back(std::move(lit->second));
        lit = next.links.erase(lit);
      } else {
        ++lit;
      }
    }
    for (Link &link : moving) {
      if (!RekeyLinkEndpoint(link, from, to)) {
        continue;
      }
      auto existing = next.links.find(link.key);
      if (existing == next.links.end()) {
        next.links.emplace(link.key, std::move(link));
      } else {
        FoldLink(existing->second, link);
      }
    }
  }

  for (const Device &device : delta.upserted_devices) {
    auto it = next.devices.find(device.key);
    if (it != next.devices.end() && it->second.status == DeviceStatus::MAINTENANCE) {
      Device kept = device;
      kept.status = DeviceStatus::MAINTENANCE;
      it->second = std::move(kept);
    } else {
      next.devices[device.key] = device;
    }
  }
  for (const Link &link : delta.upserted_links) {
    next.links[link.key] = link;
  }

  RunLifecycle(next, util::GetTime());
  return Publish(base, std::move(next), state);
}

GraphSnapshot GraphStore::Sweep(ApplyState &state) {
  std::lock_guard<std::mutex> writer(apply_mutex_);
  GraphSnapshot base = CurrentSnapshot();
  TopologyGraph next = *base;
  RunLifecycle(next, util::GetTime());
  return Publish(base, std::move(next), state);
}

bool GraphStore::Restore(TopologyGraph graph, ApplyState &state) {
  std::lock_guard<std::mutex> writer(apply_mutex_);
  GraphSnapshot base = CurrentSnapshot();
  const uint64_t restored_version = graph.version;
  RunLifecycle(graph, util::GetTime());
  GraphSnapshot published = Publish(base, std::move(graph), state, restored_version);
  if (state.IsValid()) {
    LOG_GRAPH_INFO("restored graph at version {} ({} devices, {} links)", published->version,
                   published->devices.size(), published->links.size());
  }
  return state.IsValid();
}

bool GraphStore::SetMaintenance(const std::string &device_key, bool enabled,
                                ApplyState &state) {
  std::lock_guard<std::mutex> writer(apply_mutex_);
  GraphSnapshot base = CurrentSnapshot();
  if (!base->FindDevice(device_key)) {
    return state.Error("unknown-device", device_key);
  }
  TopologyGraph next = *base;
  const int64_t now = util::GetTime();
  Device &device = next.devices.at(device_key);
  device.status = enabled ? DeviceStatus::MAINTENANCE : StatusForAge(now - device.last_seen);
  RunLifecycle(next, now);
  Publish(base, std::move(next), state);
  if (state.IsValid()) {
    LOG_GRAPH_INFO("device {} {} maintenance", device_key, enabled ? "entered" : "left");
  }
  return state.IsValid();
}

GraphSnapshot GraphStore::Publish(const GraphSnapshot &base, TopologyGraph next,
                                  ApplyState &state, uint64_t min_version) {
  std::string violation;
  if (!CheckGraphInvariants(next, violation)) {
    LOG_GRAPH_ERROR("graph invariant violation, keeping version {}: {}", base->version,
                    violation);
    state.Invalid("graph-invariant-violation", violation);
    return base;
  }
  if (next.devices == base->devices && next.links == base->links) {
    return base;
  }

  next.version = std::max(base->version + 1, min_version);
  next.created_at = util::GetTime();
  GraphDiff diff = ComputeDiff(*base, next);
  auto snapshot = std::make_shared<const TopologyGraph>(std::move(next));
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current_ = snapshot;
    history_.push_back(snapshot);
    while (history_.size() > history_depth_) {
      history_.pop_front();
    }
  }

  LOG_GRAPH_DEBUG("published version {}: {} device(s), {} link(s), +{}/-{} devices, "
                  "+{}/-{} links",
                  snapshot->version, snapshot->devices.size(), snapshot->links.size(),
                  diff.added_devices.size(), diff.removed_devices.size(),
                  diff.added_links.size(), diff.removed_links.size());
  EmitEvents(*base, snapshot, diff);
  return snapshot;
}

void GraphStore::EmitEvents(const TopologyGraph &before, const GraphSnapshot &after,
                            const GraphDiff &diff) const {
  auto &events = TopologyEvents();
  for (const auto &key : diff.removed_links) {
    events.NotifyLinkRemoved(before.links.at(key));
  }
  for (const auto &key : diff.removed_devices) {
    events.NotifyDeviceRemoved(before.devices.at(key));
  }
  for (const auto &key : diff.added_devices) {
    events.NotifyDeviceAdded(after->devices.at(key));
  }
  for (const auto &change : diff.device_status_changed) {
    events.NotifyDeviceStatusChanged(after->devices.at(change.key), change.from);
  }
  for (const auto &key : diff.added_links) {
    events.NotifyLinkAdded(after->links.at(key));
  }
  for (const auto &change : diff.link_status_changed) {
    events.NotifyLinkStatusChanged(after->links.at(change.key), change.from);
  }
  events.NotifySnapshotPublished(after, diff);
}

} // namespace topology
} // namespace topowatch
