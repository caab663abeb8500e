// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/cli_parser.hpp"
#include "discovery/types.hpp"
#include "util/string_parsing.hpp"
#include <regex>
#include <sstream>

namespace topowatch {
namespace discovery {

namespace {

std::vector<std::string> Lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

bool Match(const std::string &line, const std::regex &re, std::smatch &m) {
  return std::regex_search(line, m, re);
}

// "sw2.example.com(FOC123)" -> "sw2.example.com"
std::string StripSerialSuffix(const std::string &device_id) {
  auto paren = device_id.find('(');
  return paren == std::string::npos ? device_id : device_id.substr(0, paren);
}

} // namespace

CliDeviceInfo ParseShowVersion(const std::string &text) {
  static const std::regex kUptime(R"(^(\S+)\s+uptime is)");
  static const std::regex kVersion(R"(Version\s+([^,\s]+))");
  static const std::regex kProcessor(R"(^[Cc]isco\s+(\S+)\s+\(.*\)\s+processor)");
  static const std::regex kModelNumber(R"(^Model [Nn]umber\s*:\s*(\S+))");
  static const std::regex kBaseMac(R"(Base [Ee]thernet MAC [Aa]ddress\s*:\s*(\S+))");
  static const std::regex kSerial(R"(^System [Ss]erial [Nn]umber\s*:\s*(\S+))");
  static const std::regex kBoardId(R"(Processor board ID\s+(\S+))");

  CliDeviceInfo info;
  std::smatch m;
  for (const auto &line : Lines(text)) {
    if (info.hostname.empty() && Match(line, kUptime, m)) {
      info.hostname = m[1];
    } else if (info.os_version.empty() && Match(line, kVersion, m)) {
      info.os_version = m[1];
    } else if (Match(line, kModelNumber, m)) {
      info.model = m[1];
    } else if (info.model.empty() && Match(line, kProcessor, m)) {
      info.model = m[1];
    } else if (info.base_mac.empty() && Match(line, kBaseMac, m)) {
      info.base_mac = m[1];
    } else if (Match(line, kSerial, m)) {
      info.serial = m[1];
    } else if (info.serial.empty() && Match(line, kBoardId, m)) {
      info.serial = m[1];
    }
  }
  info.vendor = InferVendor(text);
  return info;
}

std::vector<CliNeighbor> ParseCdpNeighborsDetail(const std::string &text) {
  static const std::regex kDeviceId(R"(^\s*Device ID:\s*(\S+))");
  static const std::regex kIp(R"(^\s*IP(?:v4)? [Aa]ddress:\s*([0-9A-Fa-f.:]+))");
  static const std::regex kPlatform(R"(^\s*Platform:\s*([^,]+),\s*Capabilities:\s*(.*)$)");
  static const std::regex kInterface(
      R"(^\s*Interface:\s*([^,]+),\s*Port ID \(outgoing port\):\s*(\S+))");
  static const std::regex kVersionHeader(R"(^\s*Version\s*:\s*$)");

  std::vector<CliNeighbor> neighbors;
  CliNeighbor current;
  bool in_block = false;
  bool want_version = false;

  auto flush = [&]() {
    if (in_block && !current.device_id.empty()) {
      neighbors.push_back(std::move(current));
    }
    current = CliNeighbor{};
  };

  std::smatch m;
  for (const auto &line : Lines(text)) {
    if (Match(line, kDeviceId, m)) {
      flush();
      in_block = true;
      want_version = false;
      current.device_id = StripSerialSuffix(m[1]);
      continue;
    }
    if (!in_block) {
      continue;
    }
    if (want_version) {
      std::string trimmed = util::Trim(line);
      if (!trimmed.empty()) {
        current.version = trimmed;
        want_version = false;
      }
      continue;
    }
    if (current.ip.empty() && Match(line, kIp, m)) {
      current.ip = m[1];
    } else if (Match(line, kPlatform, m)) {
      current.platform = util::Trim(m[1].str());
      current.capabilities = util::Trim(m[2].str());
    } else if (Match(line, kInterface, m)) {
      current.local_interface = util::Trim(m[1].str());
      current.remote_port = m[2];
    } else if (Match(line, kVersionHeader, m)) {
      want_version = true;
    }
  }
  flush();
  return neighbors;
}

std::string DeviceTypeFromCapabilities(const std::string &capabilities) {
  const std::string caps = util::ToLower(capabilities);
  if (caps.find("router") != std::string::npos) {
    return "router";
  }
  if (caps.find("switch") != std::string::npos || caps.find("bridge") != std::string::npos) {
    return "switch";
  }
  if (caps.find("phone") != std::string::npos) {
    return "phone";
  }
  if (caps.find("host") != std::string::npos) {
    return "host";
  }
  return "";
}

std::string HostnameFromPrompt(const std::string &line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty() || (trimmed.back() != '#' && trimmed.back() != '>')) {
    return "";
  }
  trimmed.pop_back();
  auto paren = trimmed.find('(');
  if (paren != std::string::npos) {
    trimmed.resize(paren);
  }
  if (trimmed.empty() || trimmed.find(' ') != std::string::npos) {
    return "";
  }
  return trimmed;
}

} // namespace discovery
} // namespace topowatch
