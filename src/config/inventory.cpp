// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/inventory.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <set>

namespace topowatch {
namespace config {

using json = nlohmann::json;

namespace {

std::vector<std::string> StringList(const json &j, const char *field) {
  std::vector<std::string> out;
  if (!j.contains(field)) {
    return out;
  }
  for (const auto &item : j.at(field)) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

} // namespace

std::optional<Inventory> Inventory::Parse(const std::string &text, std::string &error) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error &e) {
    error = std::string("invalid JSON: ") + e.what();
    return std::nullopt;
  }

  try {
    if (!root.is_object()) {
      error = "inventory must be a JSON object";
      return std::nullopt;
    }
    int version = root.value("version", 0);
    if (version != VERSION) {
      error = "unsupported inventory version " + std::to_string(version);
      return std::nullopt;
    }

    Inventory inventory;
    if (root.contains("credentials")) {
      for (const auto &[name, entry] : root.at("credentials").items()) {
        discovery::Credentials creds;
        creds.username = entry.at("username").get<std::string>();
        creds.password = entry.value("password", std::string());
        inventory.credentials[name] = std::move(creds);
      }
    }

    std::set<std::string> names;
    for (const auto &entry : root.value("networks", json::array())) {
      NetworkSpec network;
      network.name = entry.at("name").get<std::string>();
      if (network.name.empty() || !names.insert(network.name).second) {
        error = "duplicate or empty network name '" + network.name + "'";
        return std::nullopt;
      }
      network.addresses = StringList(entry, "addresses");
      network.interfaces = StringList(entry, "interfaces");
      network.probes = StringList(entry, "probes");
      network.credentials = entry.value("credentials", std::string());
      network.port = entry.value("port", uint16_t{0});
      network.location = entry.value("location", std::string());
      network.scan_interval = entry.value("scan_interval", 300);
      if (network.scan_interval <= 0) {
        error = "network '" + network.name + "': scan_interval must be positive";
        return std::nullopt;
      }
      if (entry.contains("alert_threshold")) {
        auto severity =
            analytics::SeverityFromString(entry.at("alert_threshold").get<std::string>());
        if (!severity) {
          error = "network '" + network.name + "': unknown alert_threshold";
          return std::nullopt;
        }
        network.alert_threshold = *severity;
      }
      if (!network.credentials.empty() && !inventory.credentials.count(network.credentials)) {
        error = "network '" + network.name + "' references unknown credentials '" +
                network.credentials + "'";
        return std::nullopt;
      }
      for (const auto &address : network.addresses) {
        if (!util::ExpandSubnet(address, DEFAULT_MAX_HOSTS_PER_ENTRY)) {
          error = "network '" + network.name + "': invalid address entry '" + address + "'";
          return std::nullopt;
        }
      }
      inventory.networks.push_back(std::move(network));
    }
    return inventory;
  } catch (const json::exception &e) {
    error = std::string("malformed inventory: ") + e.what();
    return std::nullopt;
  }
}

std::optional<Inventory> Inventory::LoadFile(const std::filesystem::path &path,
                                             std::string &error) {
  auto text = util::read_file_string(path);
  if (!text) {
    error = "cannot read " + path.string();
    return std::nullopt;
  }
  return Parse(*text, error);
}

std::vector<discovery::Target>
Inventory::BuildTargets(const std::string &link_layer_probe,
                        const std::vector<std::string> &active_probes,
                        size_t max_hosts_per_entry) const {
  std::vector<discovery::Target> targets;
  std::set<std::string> seen;

  for (const auto &network : networks) {
    std::optional<discovery::Credentials> creds;
    if (!network.credentials.empty()) {
      auto it = credentials.find(network.credentials);
      if (it != credentials.end()) {
        creds = it->second;
      }
    }

    std::vector<std::string> probes;
    for (const auto &id : network.probes.empty() ? active_probes : network.probes) {
      if (id != link_layer_probe) {
        probes.push_back(id);
      }
    }

    for (const auto &entry : network.addresses) {
      auto hosts = util::ExpandSubnet(entry, max_hosts_per_entry);
      if (!hosts) {
        LOG_WARN("network {}: skipping address entry {}", network.name, entry);
        continue;
      }
      for (const auto &host : *hosts) {
        if (!seen.insert(host).second) {
          LOG_DEBUG("network {}: target {} already defined", network.name, host);
          continue;
        }
        discovery::Target target;
        target.id = host;
        target.address = host;
        target.port = network.port;
        target.credentials = creds;
        target.probes = probes;
        target.network = network.name;
        target.location = network.location;
        targets.push_back(std::move(target));
      }
    }

    for (const auto &iface : network.interfaces) {
      const std::string id = "if:" + iface;
      if (!seen.insert(id).second) {
        continue;
      }
      discovery::Target target;
      target.id = id;
      target.interface = iface;
      target.probes = {link_layer_probe};
      target.network = network.name;
      target.location = network.location;
      targets.push_back(std::move(target));
    }
  }
  return targets;
}

std::vector<std::string>
Inventory::ProbeSet(const std::string &link_layer_probe,
                    const std::vector<std::string> &active_probes) const {
  std::set<std::string> out;
  for (const auto &network : networks) {
    if (!network.addresses.empty()) {
      for (const auto &id : network.probes.empty() ? active_probes : network.probes) {
        if (id != link_layer_probe) {
          out.insert(id);
        }
      }
    }
    if (!network.interfaces.empty()) {
      out.insert(link_layer_probe);
    }
  }
  return {out.begin(), out.end()};
}

analytics::Severity Inventory::AlertThreshold() const {
  analytics::Severity lowest = analytics::Severity::CRITICAL;
  if (networks.empty()) {
    return analytics::Severity::MEDIUM;
  }
  for (const auto &network : networks) {
    lowest = std::min(lowest, network.alert_threshold);
  }
  return lowest;
}

int Inventory::ScanInterval() const {
  int interval = 300;
  bool first = true;
  for (const auto &network : networks) {
    interval = first ? network.scan_interval : std::min(interval, network.scan_interval);
    first = false;
  }
  return interval;
}

} // namespace config
} // namespace topowatch
