// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/json_repository.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace topowatch {
namespace storage {

using json = nlohmann::json;
using topology::Attribute;
using topology::Device;
using topology::DeviceStatus;
using topology::Link;

namespace {

constexpr int kDocumentVersion = 1;
constexpr int kFileMode = 0600;

const char *kTopologyFile = "topology.json";
const char *kFindingsFile = "findings.json";
const char *kChangesFile = "changes.json";

DeviceStatus StatusOrUnknown(const json &j, const char *field) {
  auto status = topology::DeviceStatusFromString(j.value(field, std::string("unknown")));
  return status.value_or(DeviceStatus::UNKNOWN);
}

// Parse a document and check its version. A missing file is not an error.
bool ReadDocument(const std::filesystem::path &path, json &root, bool &missing) {
  missing = false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    missing = true;
    return true;
  }
  auto data = util::read_file_string(path);
  if (!data) {
    LOG_STORAGE_ERROR("cannot read {}", path.string());
    return false;
  }
  try {
    root = json::parse(*data);
  } catch (const json::parse_error &e) {
    LOG_STORAGE_ERROR("corrupt document {}: {}", path.string(), e.what());
    return false;
  }
  int version = root.is_object() ? root.value("version", 0) : 0;
  if (version != kDocumentVersion) {
    LOG_STORAGE_ERROR("unsupported document version {} in {}", version, path.string());
    return false;
  }
  return true;
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

json SerializeDevice(const Device &device) {
  json j;
  j["key"] = device.key;
  j["mac"] = device.mac;
  j["status"] = topology::DeviceStatusToString(device.status);
  j["confidence"] = device.confidence;
  j["first_seen"] = device.first_seen;
  j["last_seen"] = device.last_seen;
  j["sources"] = device.sources;
  j["source_confidence"] = device.source_confidence;

  json attributes = json::object();
  for (const auto &[name, a] : device.attributes) {
    attributes[name] = {{"value", a.value},
                        {"confidence", a.confidence},
                        {"timestamp", a.timestamp},
                        {"active", a.active_source},
                        {"source", a.source}};
  }
  j["attributes"] = attributes;
  return j;
}

bool DeserializeDevice(const json &j, Device &device) {
  try {
    device.key = j.at("key").get<std::string>();
    device.mac = j.value("mac", std::string());
    device.status = StatusOrUnknown(j, "status");
    device.confidence = j.value("confidence", 0.0);
    device.first_seen = j.value("first_seen", int64_t{0});
    device.last_seen = j.at("last_seen").get<int64_t>();
    device.sources = j.value("sources", std::set<std::string>());
    device.source_confidence = j.value("source_confidence", std::map<std::string, double>());
    device.attributes.clear();
    if (j.contains("attributes")) {
      for (const auto &[name, a] : j.at("attributes").items()) {
        Attribute attribute;
        attribute.value = a.at("value").get<std::string>();
        attribute.confidence = a.value("confidence", 0.0);
        attribute.timestamp = a.value("timestamp", int64_t{0});
        attribute.active_source = a.value("active", false);
        attribute.source = a.value("source", std::string());
        device.attributes.emplace(name, std::move(attribute));
      }
    }
    return !device.key.empty();
  } catch (const json::exception &) {
    return false;
  }
}

json SerializeLink(const Link &link) {
  json j;
  j["key"] = link.key;
  j["a"] = link.a;
  j["b"] = link.b;
  j["link_type"] = link.link_type;
  j["port_a"] = link.port_a;
  j["port_b"] = link.port_b;
  j["discovered_via"] = link.discovered_via;
  j["status"] = topology::DeviceStatusToString(link.status);
  j["first_seen"] = link.first_seen;
  j["last_seen"] = link.last_seen;
  return j;
}

bool DeserializeLink(const json &j, Link &link) {
  try {
    link.a = j.at("a").get<std::string>();
    link.b = j.at("b").get<std::string>();
    link.link_type = j.value("link_type", std::string("physical"));
    link.key = topology::LinkKey(link.a, link.b, link.link_type);
    link.port_a = j.value("port_a", std::string());
    link.port_b = j.value("port_b", std::string());
    link.discovered_via = j.value("discovered_via", std::set<std::string>());
    link.status = StatusOrUnknown(j, "status");
    link.first_seen = j.value("first_seen", int64_t{0});
    link.last_seen = j.at("last_seen").get<int64_t>();
    return link.a < link.b;
  } catch (const json::exception &) {
    return false;
  }
}

json SerializeFinding(const analytics::Finding &finding) {
  json j;
  j["type"] = analytics::FindingTypeToString(finding.type);
  j["severity"] = analytics::SeverityToString(finding.severity);
  j["risk_score"] = finding.risk_score;
  j["subjects"] = finding.subjects;
  j["affected_nodes"] = finding.affected_nodes;
  j["affected_links"] = finding.affected_links;
  j["centrality_percentile"] = finding.centrality_percentile;
  j["description"] = finding.description;
  j["recommendation"] = finding.recommendation;
  j["snapshot_version"] = finding.snapshot_version;
  j["detected_at"] = finding.detected_at;
  return j;
}

bool DeserializeFinding(const json &j, analytics::Finding &finding) {
  try {
    auto type = analytics::FindingTypeFromString(j.at("type").get<std::string>());
    auto severity = analytics::SeverityFromString(j.at("severity").get<std::string>());
    if (!type || !severity) {
      return false;
    }
    finding.type = *type;
    finding.severity = *severity;
    finding.risk_score = j.value("risk_score", 0.0);
    finding.subjects = j.value("subjects", std::vector<std::string>());
    finding.affected_nodes = j.value("affected_nodes", size_t{0});
    finding.affected_links = j.value("affected_links", size_t{0});
    finding.centrality_percentile = j.value("centrality_percentile", 0.0);
    finding.description = j.value("description", std::string());
    finding.recommendation = j.value("recommendation", std::string());
    finding.snapshot_version = j.value("snapshot_version", uint64_t{0});
    finding.detected_at = j.value("detected_at", int64_t{0});
    return true;
  } catch (const json::exception &) {
    return false;
  }
}

json SerializeChange(const TopologyChange &change) {
  json j;
  j["timestamp"] = change.timestamp;
  j["change_type"] = ChangeTypeToString(change.change_type);
  j["subject"] = change.subject;
  j["device_type"] = change.device_type;
  j["details"] = change.details;
  j["version"] = change.version;
  return j;
}

bool DeserializeChange(const json &j, TopologyChange &change) {
  try {
    auto type = ChangeTypeFromString(j.at("change_type").get<std::string>());
    if (!type) {
      return false;
    }
    change.change_type = *type;
    change.timestamp = j.at("timestamp").get<int64_t>();
    change.subject = j.at("subject").get<std::string>();
    change.device_type = j.value("device_type", std::string());
    change.details = j.value("details", std::string());
    change.version = j.value("version", uint64_t{0});
    return true;
  } catch (const json::exception &) {
    return false;
  }
}

// ============================================================================
// JsonFileRepository
// ============================================================================

JsonFileRepository::JsonFileRepository(std::filesystem::path directory, size_t max_findings,
                                       size_t max_changes)
    : directory_(std::move(directory)), max_findings_(max_findings),
      max_changes_(max_changes) {}

bool JsonFileRepository::Open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!util::ensure_directory(directory_)) {
    LOG_STORAGE_ERROR("cannot create data directory {}", directory_.string());
    return false;
  }
  if (!LoadTopology(directory_ / kTopologyFile) || !LoadFindings(directory_ / kFindingsFile) ||
      !LoadChanges(directory_ / kChangesFile)) {
    return false;
  }
  LOG_STORAGE_INFO("opened repository {}: {} device(s), {} link(s), {} finding(s), "
                   "{} change(s)",
                   directory_.string(), devices_.size(), links_.size(), findings_.size(),
                   changes_.size());
  return true;
}

bool JsonFileRepository::LoadTopology(const std::filesystem::path &path) {
  json root;
  bool missing = false;
  if (!ReadDocument(path, root, missing)) {
    return false;
  }
  devices_.clear();
  links_.clear();
  have_graph_ = false;
  if (missing) {
    LOG_STORAGE_TRACE("no topology at {} (starting fresh)", path.string());
    return true;
  }

  graph_version_ = root.value("graph_version", uint64_t{0});
  if (root.contains("devices") && root["devices"].is_array()) {
    for (const auto &j : root["devices"]) {
      Device device;
      if (!DeserializeDevice(j, device)) {
        LOG_STORAGE_WARN("invalid device entry in {}, skipping", path.string());
        continue;
      }
      devices_[device.key] = std::move(device);
    }
  }
  if (root.contains("links") && root["links"].is_array()) {
    for (const auto &j : root["links"]) {
      Link link;
      if (!DeserializeLink(j, link)) {
        LOG_STORAGE_WARN("invalid link entry in {}, skipping", path.string());
        continue;
      }
      links_[link.key] = std::move(link);
    }
  }
  have_graph_ = true;
  return true;
}

bool JsonFileRepository::LoadFindings(const std::filesystem::path &path) {
  json root;
  bool missing = false;
  if (!ReadDocument(path, root, missing)) {
    return false;
  }
  findings_.clear();
  if (missing || !root.contains("findings")) {
    return true;
  }
  for (const auto &j : root["findings"]) {
    analytics::Finding finding;
    if (DeserializeFinding(j, finding)) {
      findings_.push_back(std::move(finding));
    } else {
      LOG_STORAGE_WARN("invalid finding entry in {}, skipping", path.string());
    }
  }
  return true;
}

bool JsonFileRepository::LoadChanges(const std::filesystem::path &path) {
  json root;
  bool missing = false;
  if (!ReadDocument(path, root, missing)) {
    return false;
  }
  changes_.clear();
  if (missing || !root.contains("changes")) {
    return true;
  }
  for (const auto &j : root["changes"]) {
    TopologyChange change;
    if (DeserializeChange(j, change)) {
      changes_.push_back(std::move(change));
    } else {
      LOG_STORAGE_WARN("invalid change entry in {}, skipping", path.string());
    }
  }
  return true;
}

bool JsonFileRepository::SaveDevice(const Device &device) {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_[device.key] = device;
  topology_dirty_ = true;
  return true;
}

bool JsonFileRepository::SaveLink(const Link &link) {
  std::lock_guard<std::mutex> lock(mutex_);
  links_[link.key] = link;
  topology_dirty_ = true;
  return true;
}

bool JsonFileRepository::RemoveDevice(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (devices_.erase(key) > 0) {
    topology_dirty_ = true;
  }
  return true;
}

bool JsonFileRepository::RemoveLink(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (links_.erase(key) > 0) {
    topology_dirty_ = true;
  }
  return true;
}

std::optional<topology::TopologyGraph> JsonFileRepository::LoadGraphSnapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!have_graph_ && devices_.empty()) {
    return std::nullopt;
  }
  topology::TopologyGraph graph;
  graph.version = graph_version_;
  graph.devices = devices_;
  // Drop links whose endpoints did not survive a partial write history
  for (const auto &[key, link] : links_) {
    if (devices_.count(link.a) && devices_.count(link.b)) {
      graph.links.emplace(key, link);
    }
  }
  return graph;
}

bool JsonFileRepository::AppendFinding(const analytics::Finding &finding) {
  std::lock_guard<std::mutex> lock(mutex_);
  findings_.push_back(finding);
  while (findings_.size() > max_findings_) {
    findings_.pop_front();
  }
  findings_dirty_ = true;
  return true;
}

bool JsonFileRepository::AppendChange(const TopologyChange &change) {
  std::lock_guard<std::mutex> lock(mutex_);
  changes_.push_back(change);
  while (changes_.size() > max_changes_) {
    changes_.pop_front();
  }
  graph_version_ = std::max(graph_version_, change.version);
  changes_dirty_ = true;
  topology_dirty_ = true;
  return true;
}

bool JsonFileRepository::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  bool ok = true;
  try {
    if (topology_dirty_) {
      json root;
      root["version"] = kDocumentVersion;
      root["graph_version"] = graph_version_;
      json devices = json::array();
      for (const auto &[key, device] : devices_) {
        devices.push_back(SerializeDevice(device));
      }
      json links = json::array();
      for (const auto &[key, link] : links_) {
        links.push_back(SerializeLink(link));
      }
      root["devices"] = devices;
      root["links"] = links;
      if (util::atomic_write_file(directory_ / kTopologyFile, root.dump(2), kFileMode)) {
        topology_dirty_ = false;
        have_graph_ = true;
      } else {
        LOG_STORAGE_ERROR("failed to write {}", (directory_ / kTopologyFile).string());
        ok = false;
      }
    }

    if (findings_dirty_) {
      json root;
      root["version"] = kDocumentVersion;
      json list = json::array();
      for (const auto &finding : findings_) {
        list.push_back(SerializeFinding(finding));
      }
      root["findings"] = list;
      if (util::atomic_write_file(directory_ / kFindingsFile, root.dump(2), kFileMode)) {
        findings_dirty_ = false;
      } else {
        LOG_STORAGE_ERROR("failed to write {}", (directory_ / kFindingsFile).string());
        ok = false;
      }
    }

    if (changes_dirty_) {
      json root;
      root["version"] = kDocumentVersion;
      json list = json::array();
      for (const auto &change : changes_) {
        list.push_back(SerializeChange(change));
      }
      root["changes"] = list;
      if (util::atomic_write_file(directory_ / kChangesFile, root.dump(2), kFileMode)) {
        changes_dirty_ = false;
      } else {
        LOG_STORAGE_ERROR("failed to write {}", (directory_ / kChangesFile).string());
        ok = false;
      }
    }
  } catch (const json::exception &e) {
    LOG_STORAGE_ERROR("exception during flush: {}", e.what());
    return false;
  }

  if (ok) {
    LOG_STORAGE_TRACE("flushed repository {} (graph version {})", directory_.string(),
                      graph_version_);
  }
  return ok;
}

std::vector<analytics::Finding> JsonFileRepository::findings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {findings_.begin(), findings_.end()};
}

std::vector<TopologyChange> JsonFileRepository::changes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {changes_.begin(), changes_.end()};
}

} // namespace storage
} // namespace topowatch
