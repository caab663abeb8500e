#include "application.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace topowatch {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(config_.once ? "ONE-SHOT" : "DAEMON") << std::flush;

  LOG_INFO("Initializing topowatch...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_inventory()) {
    LOG_ERROR("Failed to load inventory");
    return false;
  }

  if (!init_repository()) {
    LOG_ERROR("Failed to open topology repository");
    return false;
  }

  if (!init_engine()) {
    LOG_ERROR("Failed to initialize topology engine");
    return false;
  }

  init_subscriptions();

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting topowatch...");

  setup_signal_handlers();

  running_ = true;

  start_rounds();

  LOG_INFO("topowatch started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  std::string probes;
  for (const auto &id : probe_set_) {
    probes += (probes.empty() ? "" : ", ") + id;
  }
  LOG_INFO("Monitoring {} target(s) with probes [{}], round every {}s", targets_.size(),
           probes, round_interval().count());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

engine::RoundReport Application::run_round() {
  LOG_APP_DEBUG("Starting round over {} target(s)", targets_.size());
  engine::RoundReport report = engine_->RunRound(targets_, probe_set_);

  size_t failed = 0;
  for (const auto &pair : report.pairs) {
    if (pair.status == discovery::PairStatus::FAILED) {
      ++failed;
    }
  }
  LOG_INFO("Round {} complete: {} pair(s) ({} failed), {} record(s) ({} dropped), "
           "version {}{}, {} new finding(s)",
           report.round_id, report.pairs.size(), failed, report.records,
           report.records_dropped, report.version, report.published ? " (published)" : "",
           report.findings.size());
  if (report.error) {
    LOG_ERROR("Round {} error: {}", report.round_id, *report.error);
  }
  return report;
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down topowatch...");

  running_ = false;

  // Let the in-flight round finish its commit
  stop_rounds();

  // Unsubscribe from notifications BEFORE releasing components
  LOG_APP_DEBUG("Unsubscribing from notifications...");
  device_status_sub_.Unsubscribe();
  device_removed_sub_.Unsubscribe();
  link_status_sub_.Unsubscribe();
  snapshot_sub_.Unsubscribe();
  finding_sub_.Unsubscribe();

  if (repository_) {
    LOG_INFO("Flushing topology repository...");
    if (!repository_->Flush()) {
      LOG_ERROR("Failed to flush topology repository");
    }
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_inventory() {
  const std::filesystem::path path = config_.GetInventoryPath();
  LOG_INFO("Loading inventory from {}", path.string());

  std::string error;
  auto inventory = config::Inventory::LoadFile(path, error);
  if (!inventory) {
    LOG_ERROR("Invalid inventory {}: {}", path.string(), error);
    return false;
  }
  inventory_ = std::move(*inventory);

  if (inventory_.networks.empty()) {
    LOG_WARN("Inventory {} defines no networks", path.string());
  }
  for (const auto &network : inventory_.networks) {
    LOG_APP_DEBUG("Network {}: {} address entr(ies), {} interface(s), every {}s",
                  network.name, network.addresses.size(), network.interfaces.size(),
                  network.scan_interval);
  }
  return true;
}

bool Application::init_repository() {
  repository_ = std::make_shared<storage::JsonFileRepository>(config_.datadir);
  return repository_->Open();
}

bool Application::init_engine() {
  discovery::ProbeRegistry registry = discovery::ProbeRegistry::Default();

  std::string link_layer_probe;
  std::vector<std::string> active_probes;
  for (const auto &name : registry.Names()) {
    auto probe = registry.Create(name);
    if (!probe) {
      continue;
    }
    if (discovery::IsActiveProbe(probe->kind())) {
      active_probes.push_back(name);
    } else {
      link_layer_probe = name;
    }
  }

  targets_ = inventory_.BuildTargets(link_layer_probe, active_probes);
  probe_set_ = inventory_.ProbeSet(link_layer_probe, active_probes);

  for (const auto &id : probe_set_) {
    if (!registry.Has(id)) {
      LOG_ERROR("Inventory enables unknown probe '{}'", id);
      return false;
    }
  }

  engine::EngineConfig engine_config = config_.engine;
  engine_config.alert_threshold = inventory_.AlertThreshold();

  engine_ = std::make_unique<engine::TopologyEngine>(std::move(registry), repository_,
                                                     engine_config);
  if (!engine_->Initialize()) {
    return false;
  }

  LOG_INFO("Topology engine ready at version {} ({} target(s), alert threshold {})",
           engine_->CurrentSnapshot()->version, targets_.size(),
           analytics::SeverityToString(engine_config.alert_threshold));
  return true;
}

void Application::init_subscriptions() {
  auto &events = topology::TopologyEvents();

  device_status_sub_ = events.SubscribeDeviceStatusChanged(
      [](const topology::Device &device, topology::DeviceStatus previous) {
        LOG_APP_INFO("Device {} ({}) {} -> {}", device.key, device.Get(topology::attr::HOSTNAME),
                     topology::DeviceStatusToString(previous),
                     topology::DeviceStatusToString(device.status));
      });

  device_removed_sub_ = events.SubscribeDeviceRemoved([](const topology::Device &device) {
    LOG_APP_INFO("Device {} retired after {}s unseen", device.key,
                 util::GetTime() - device.last_seen);
  });

  link_status_sub_ = events.SubscribeLinkStatusChanged(
      [](const topology::Link &link, topology::DeviceStatus previous) {
        LOG_APP_DEBUG("Link {} {} -> {}", link.key, topology::DeviceStatusToString(previous),
                      topology::DeviceStatusToString(link.status));
      });

  snapshot_sub_ = events.SubscribeSnapshotPublished(
      [](const topology::GraphSnapshot &snapshot, const topology::GraphDiff &diff) {
        LOG_APP_INFO("Published topology version {}: {} device(s), {} link(s) "
                     "(+{}/-{} devices, +{}/-{} links)",
                     snapshot->version, snapshot->devices.size(), snapshot->links.size(),
                     diff.added_devices.size(), diff.removed_devices.size(),
                     diff.added_links.size(), diff.removed_links.size());
      });

  finding_sub_ = events.SubscribeFindingRaised([](const analytics::Finding &finding) {
    LOG_APP_WARN("[{}] {} (risk {:.1f}): {}. {}",
                 analytics::SeverityToString(finding.severity),
                 analytics::FindingTypeToString(finding.type), finding.risk_score,
                 finding.description, finding.recommendation);
  });
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

std::chrono::seconds Application::round_interval() const {
  return std::chrono::seconds(config_.interval > 0 ? config_.interval
                                                   : inventory_.ScanInterval());
}

void Application::start_rounds() {
  LOG_INFO("Starting discovery rounds (every {}s)", round_interval().count());
  round_thread_ = std::make_unique<std::thread>(&Application::round_loop, this);
}

void Application::stop_rounds() {
  if (round_thread_ && round_thread_->joinable()) {
    LOG_APP_DEBUG("Stopping round thread");
    round_thread_->join();
    round_thread_.reset();
  }
}

void Application::round_loop() {
  using namespace std::chrono;

  const auto interval = round_interval();

  // First round immediately
  auto next_round = steady_clock::now();

  while (running_) {
    if (steady_clock::now() >= next_round) {
      run_round();
      next_round = steady_clock::now() + interval;
    }

    std::this_thread::sleep_for(seconds(1));
  }
}

} // namespace app
} // namespace topowatch
