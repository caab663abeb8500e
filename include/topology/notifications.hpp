// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "analytics/finding.hpp"
#include "topology/types.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace topowatch {
namespace topology {

/**
 * Notification system for topology events
 *
 * - Simple observer pattern with std::function
 * - Synchronous callbacks, invoked outside the registry lock on the thread
 *   that published the snapshot
 * - RAII-based subscription management
 * - Singleton pattern (no wiring needed)
 *
 * Events:
 * - DeviceAdded / DeviceRemoved / DeviceStatusChanged
 * - LinkAdded / LinkRemoved / LinkStatusChanged
 * - SnapshotPublished: a new graph version became current
 * - FindingRaised: analytics or the resolver produced a new finding
 */
class TopologyNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Unsubscribe explicitly
    void Unsubscribe();

  private:
    friend class TopologyNotifications;
    Subscription(TopologyNotifications *owner, size_t id);

    TopologyNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  // Callback types
  using DeviceCallback = std::function<void(const Device &device)>;
  using DeviceStatusCallback =
      std::function<void(const Device &device, DeviceStatus previous)>;
  using LinkCallback = std::function<void(const Link &link)>;
  using LinkStatusCallback = std::function<void(const Link &link, DeviceStatus previous)>;
  using SnapshotCallback =
      std::function<void(const GraphSnapshot &snapshot, const GraphDiff &diff)>;
  using FindingCallback = std::function<void(const analytics::Finding &finding)>;

  [[nodiscard]] Subscription SubscribeDeviceAdded(DeviceCallback callback);
  [[nodiscard]] Subscription SubscribeDeviceRemoved(DeviceCallback callback);
  [[nodiscard]] Subscription SubscribeDeviceStatusChanged(DeviceStatusCallback callback);
  [[nodiscard]] Subscription SubscribeLinkAdded(LinkCallback callback);
  [[nodiscard]] Subscription SubscribeLinkRemoved(LinkCallback callback);
  [[nodiscard]] Subscription SubscribeLinkStatusChanged(LinkStatusCallback callback);

  /**
   * Subscribe to snapshot publication
   * Fired once per published version, after the per-element events
   */
  [[nodiscard]] Subscription SubscribeSnapshotPublished(SnapshotCallback callback);

  [[nodiscard]] Subscription SubscribeFindingRaised(FindingCallback callback);

  void NotifyDeviceAdded(const Device &device);
  void NotifyDeviceRemoved(const Device &device);
  void NotifyDeviceStatusChanged(const Device &device, DeviceStatus previous);
  void NotifyLinkAdded(const Link &link);
  void NotifyLinkRemoved(const Link &link);
  void NotifyLinkStatusChanged(const Link &link, DeviceStatus previous);
  void NotifySnapshotPublished(const GraphSnapshot &snapshot, const GraphDiff &diff);
  void NotifyFindingRaised(const analytics::Finding &finding);

  /**
   * Get singleton instance
   */
  static TopologyNotifications &Get();

private:
  TopologyNotifications() = default;

  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    DeviceCallback device_added;
    DeviceCallback device_removed;
    DeviceStatusCallback device_status_changed;
    LinkCallback link_added;
    LinkCallback link_removed;
    LinkStatusCallback link_status_changed;
    SnapshotCallback snapshot_published;
    FindingCallback finding_raised;
  };

  Subscription Add(CallbackEntry entry);

  // Copy the callbacks stored in `member` so they can run unlocked
  template <typename Callback>
  std::vector<Callback> Collect(Callback CallbackEntry::*member) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Callback> snapshot;
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      if (entry.*member)
        snapshot.push_back(entry.*member);
    }
    return snapshot;
  }

  // Thread-safety: protect callbacks_ and next_id_ across threads
  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

/**
 * Global accessor for topology notifications
 */
inline TopologyNotifications &TopologyEvents() { return TopologyNotifications::Get(); }

} // namespace topology
} // namespace topowatch
