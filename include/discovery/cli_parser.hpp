// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/*
 CLI output parsing

 Parses the semi-structured text of IOS-style `show version` and
 `show cdp neighbors detail`. Parsing is line oriented and tolerant: unknown
 lines are ignored, and a neighbor block without a Device ID is dropped.
*/

struct CliDeviceInfo {
  std::string hostname;
  std::string model;
  std::string os_version;
  std::string serial;
  std::string base_mac;
  std::string vendor;

  bool empty() const {
    return hostname.empty() && model.empty() && os_version.empty() && base_mac.empty();
  }
};

struct CliNeighbor {
  std::string device_id;
  std::string ip;
  std::string platform;
  std::string capabilities;     // Raw text, e.g. "Router Switch IGMP"
  std::string local_interface;
  std::string remote_port;
  std::string version;          // First line of the Version section
};

CliDeviceInfo ParseShowVersion(const std::string &text);

std::vector<CliNeighbor> ParseCdpNeighborsDetail(const std::string &text);

// "Router Switch IGMP" -> "router"; "Trans-Bridge" -> "switch"; "Phone" -> "phone"
std::string DeviceTypeFromCapabilities(const std::string &capabilities);

// Hostname embedded in a prompt line ("sw1#", "sw1>", "sw1(config)#"); "" if none
std::string HostnameFromPrompt(const std::string &line);

} // namespace discovery
} // namespace topowatch
