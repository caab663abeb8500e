// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "storage/repository.hpp"
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json_fwd.hpp>

namespace topowatch {
namespace storage {

// JSON (de)serialization of the persisted types
nlohmann::json SerializeDevice(const topology::Device &device);
bool DeserializeDevice(const nlohmann::json &j, topology::Device &device);
nlohmann::json SerializeLink(const topology::Link &link);
bool DeserializeLink(const nlohmann::json &j, topology::Link &link);
nlohmann::json SerializeFinding(const analytics::Finding &finding);
bool DeserializeFinding(const nlohmann::json &j, analytics::Finding &finding);
nlohmann::json SerializeChange(const TopologyChange &change);
bool DeserializeChange(const nlohmann::json &j, TopologyChange &change);

/**
 * JsonFileRepository - repository backed by three JSON documents
 *
 *   <dir>/topology.json   devices and links of the last flushed graph
 *   <dir>/findings.json   bounded finding history (oldest dropped first)
 *   <dir>/changes.json    bounded change log
 *
 * Every document carries "version": 1. Writes go through
 * util::atomic_write_file with owner-only permissions: the inventory
 * reveals network layout.
 *
 * Thread-safety: all methods lock an internal mutex.
 */
class JsonFileRepository : public TopologyRepository {
public:
  explicit JsonFileRepository(std::filesystem::path directory, size_t max_findings = 10000,
                              size_t max_changes = 10000);

  /**
   * Create the directory and load existing documents. Missing documents
   * start fresh; a corrupt or unsupported document fails the open.
   */
  bool Open();

  bool SaveDevice(const topology::Device &device) override;
  bool SaveLink(const topology::Link &link) override;
  bool RemoveDevice(const std::string &key) override;
  bool RemoveLink(const std::string &key) override;
  std::optional<topology::TopologyGraph> LoadGraphSnapshot() override;
  bool AppendFinding(const analytics::Finding &finding) override;
  bool AppendChange(const TopologyChange &change) override;
  bool Flush() override;

  std::vector<analytics::Finding> findings() const;
  std::vector<TopologyChange> changes() const;

  const std::filesystem::path &directory() const { return directory_; }

private:
  bool LoadTopology(const std::filesystem::path &path);
  bool LoadFindings(const std::filesystem::path &path);
  bool LoadChanges(const std::filesystem::path &path);

  const std::filesystem::path directory_;
  const size_t max_findings_;
  const size_t max_changes_;

  mutable std::mutex mutex_;
  std::map<std::string, topology::Device> devices_;
  std::map<std::string, topology::Link> links_;
  std::deque<analytics::Finding> findings_;
  std::deque<TopologyChange> changes_;
  uint64_t graph_version_{0};
  bool have_graph_{false};
  bool topology_dirty_{false};
  bool findings_dirty_{false};
  bool changes_dirty_{false};
};

} // namespace storage
} // namespace topowatch
