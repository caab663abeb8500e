// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <cctype>
#include <cstdio>

namespace topowatch {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip_part;
  std::string port_part;

  if (address_port[0] == '[') {
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.size() || address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip_part = address_port.substr(1, bracket_end - 1);
    port_part = address_port.substr(bracket_end + 2);
  } else {
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false;
    }
    // Unbracketed IPv6 is ambiguous
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip_part = address_port.substr(0, first_colon);
    port_part = address_port.substr(first_colon + 1);
  }

  auto port = SafeParsePort(port_part);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip_part);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::optional<std::string> NormalizeMac(const std::string& mac) {
  std::string digits;
  digits.reserve(12);
  for (char c : mac) {
    if (c == ':' || c == '-' || c == '.') {
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (digits.size() != 12) {
    return std::nullopt;
  }
  if (digits == "000000000000" || digits == "ffffffffffff") {
    return std::nullopt;
  }

  std::string out;
  out.reserve(17);
  for (size_t i = 0; i < 12; i += 2) {
    if (!out.empty()) {
      out.push_back(':');
    }
    out.append(digits, i, 2);
  }
  return out;
}

std::string FormatMac(const std::array<uint8_t, 6>& bytes) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0],
                bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
  return std::string(buf);
}

std::optional<std::vector<std::string>> ExpandSubnet(const std::string& entry,
                                                     size_t max_hosts) {
  std::string trimmed = Trim(entry);
  if (trimmed.find('/') == std::string::npos) {
    auto ip = ValidateAndNormalizeIP(trimmed);
    if (!ip) {
      return std::nullopt;
    }
    return std::vector<std::string>{*ip};
  }

  boost::system::error_code ec;
  auto network = boost::asio::ip::make_network_v4(trimmed, ec);
  if (ec) {
    LOG_TRACE("ExpandSubnet: rejecting '{}': {}", trimmed, ec.message());
    return std::nullopt;
  }

  std::vector<std::string> hosts;
  if (network.prefix_length() == 31) {
    // RFC 3021 point-to-point: both addresses are hosts
    auto base = network.network().to_uint();
    hosts.push_back(boost::asio::ip::address_v4(base).to_string());
    hosts.push_back(boost::asio::ip::address_v4(base + 1).to_string());
    return hosts;
  }

  auto range = network.hosts();
  if (range.size() > max_hosts) {
    return std::nullopt;
  }
  hosts.reserve(range.size());
  for (const auto& addr : range) {
    hosts.push_back(addr.to_string());
  }
  return hosts;
}

} // namespace util
} // namespace topowatch
