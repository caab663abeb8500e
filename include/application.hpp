// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "config/inventory.hpp"
#include "engine/topology_engine.hpp"
#include "storage/json_repository.hpp"
#include "topology/notifications.hpp"
#include "util/files.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace topowatch {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (topology.json, findings.json, changes.json, log)
  std::filesystem::path datadir;

  // Inventory document; empty = <datadir>/inventory.json
  std::filesystem::path inventory_path;

  // Seconds between rounds; 0 = shortest scan_interval of the inventory
  int interval = 0;

  // Run a single round, then exit
  bool once = false;

  engine::EngineConfig engine;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}

  std::filesystem::path GetInventoryPath() const {
    return inventory_path.empty() ? datadir / "inventory.json" : inventory_path;
  }
};

// Application - daemon coordinator
// Loads the inventory, opens the repository, restores the engine, runs
// discovery rounds on a schedule, handles signals, coordinates shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // One round against the inventory (used by start() and --once)
  engine::RoundReport run_round();

  // Component access
  engine::TopologyEngine &topology_engine() { return *engine_; }
  const config::Inventory &inventory() const { return inventory_; }

  // Status
  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  config::Inventory inventory_;
  std::vector<discovery::Target> targets_;
  std::vector<std::string> probe_set_;

  std::shared_ptr<storage::JsonFileRepository> repository_;
  std::unique_ptr<engine::TopologyEngine> engine_;

  std::unique_ptr<std::thread> round_thread_;

  // Notification subscriptions (declared after the engine so they are
  // destroyed first)
  topology::TopologyNotifications::Subscription device_status_sub_;
  topology::TopologyNotifications::Subscription device_removed_sub_;
  topology::TopologyNotifications::Subscription link_status_sub_;
  topology::TopologyNotifications::Subscription snapshot_sub_;
  topology::TopologyNotifications::Subscription finding_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_inventory();
  bool init_repository();
  bool init_engine();
  void init_subscriptions();

  // Round scheduling
  void start_rounds();
  void stop_rounds();
  void round_loop();
  std::chrono::seconds round_interval() const;

  void shutdown();

  static Application *instance_;

  void setup_signal_handlers();
};

} // namespace app
} // namespace topowatch
