// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/notifications.hpp"
#include <algorithm>

namespace topowatch {
namespace topology {

// ============================================================================
// TopologyNotifications::Subscription
// ============================================================================

TopologyNotifications::Subscription::Subscription(TopologyNotifications *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

TopologyNotifications::Subscription::~Subscription() { Unsubscribe(); }

TopologyNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

TopologyNotifications::Subscription &
TopologyNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void TopologyNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// TopologyNotifications
// ============================================================================

TopologyNotifications::Subscription TopologyNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;
  entry.id = id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeDeviceAdded(DeviceCallback callback) {
  CallbackEntry entry{};
  entry.device_added = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeDeviceRemoved(DeviceCallback callback) {
  CallbackEntry entry{};
  entry.device_removed = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeDeviceStatusChanged(DeviceStatusCallback callback) {
  CallbackEntry entry{};
  entry.device_status_changed = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeLinkAdded(LinkCallback callback) {
  CallbackEntry entry{};
  entry.link_added = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeLinkRemoved(LinkCallback callback) {
  CallbackEntry entry{};
  entry.link_removed = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeLinkStatusChanged(LinkStatusCallback callback) {
  CallbackEntry entry{};
  entry.link_status_changed = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeSnapshotPublished(SnapshotCallback callback) {
  CallbackEntry entry{};
  entry.snapshot_published = std::move(callback);
  return Add(std::move(entry));
}

TopologyNotifications::Subscription
TopologyNotifications::SubscribeFindingRaised(FindingCallback callback) {
  CallbackEntry entry{};
  entry.finding_raised = std::move(callback);
  return Add(std::move(entry));
}

void TopologyNotifications::NotifyDeviceAdded(const Device &device) {
  for (auto &cb : Collect(&CallbackEntry::device_added)) {
    cb(device);
  }
}

void TopologyNotifications::NotifyDeviceRemoved(const Device &device) {
  for (auto &cb : Collect(&CallbackEntry::device_removed)) {
    cb(device);
  }
}

void TopologyNotifications::NotifyDeviceStatusChanged(const Device &device,
                                                      DeviceStatus previous) {
  for (auto &cb : Collect(&CallbackEntry::device_status_changed)) {
    cb(device, previous);
  }
}

void TopologyNotifications::NotifyLinkAdded(const Link &link) {
  for (auto &cb : Collect(&CallbackEntry::link_added)) {
    cb(link);
  }
}

void TopologyNotifications::NotifyLinkRemoved(const Link &link) {
  for (auto &cb : Collect(&CallbackEntry::link_removed)) {
    cb(link);
  }
}

void TopologyNotifications::NotifyLinkStatusChanged(const Link &link, DeviceStatus previous) {
  for (auto &cb : Collect(&CallbackEntry::link_status_changed)) {
    cb(link, previous);
  }
}

void TopologyNotifications::NotifySnapshotPublished(const GraphSnapshot &snapshot,
                                                    const GraphDiff &diff) {
  for (auto &cb : Collect(&CallbackEntry::snapshot_published)) {
    cb(snapshot, diff);
  }
}

void TopologyNotifications::NotifyFindingRaised(const analytics::Finding &finding) {
  for (auto &cb : Collect(&CallbackEntry::finding_raised)) {
    cb(finding);
  }
}

TopologyNotifications &TopologyNotifications::Get() {
  static TopologyNotifications instance;
  return instance;
}

void TopologyNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) { return entry.id == id; }),
                   callbacks_.end());
}

} // namespace topology
} // namespace topowatch
