// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings and MAC addresses
 - Expand inventory subnets into host targets
 - One canonical textual form per identity so that the resolver never
   treats "AA-BB-CC-DD-EE-FF" and "aabb.ccdd.eeff" as different devices
*/

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to plain IPv4.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:DB8::1" -> "2001:db8::1"
 *   "switch-1" -> std::nullopt (hostnames are not addresses)
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Parse "IP:port" or "[IPv6]:port"
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

/**
 * Normalize a MAC address to lower-case colon form
 *
 * Accepted inputs: "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff",
 * "aabb.ccdd.eeff" (Cisco), "aabbccddeeff".
 * All-zero and broadcast addresses are rejected: they never identify a device.
 */
std::optional<std::string> NormalizeMac(const std::string& mac);

/**
 * Format 6 raw bytes as "aa:bb:cc:dd:ee:ff"
 */
std::string FormatMac(const std::array<uint8_t, 6>& bytes);

/**
 * Expand an inventory entry into host addresses
 *
 * "10.0.0.7" -> {"10.0.0.7"}; "10.0.0.0/30" -> {"10.0.0.1", "10.0.0.2"}.
 * IPv4 prefixes only. Returns std::nullopt if the entry is invalid or would
 * expand to more than max_hosts addresses.
 */
std::optional<std::vector<std::string>> ExpandSubnet(const std::string& entry,
                                                     size_t max_hosts);

} // namespace util
} // namespace topowatch
