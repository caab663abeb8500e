// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/types.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <utility>

namespace topowatch {
namespace discovery {

std::string ProbeKindToString(ProbeKind kind) {
  switch (kind) {
  case ProbeKind::LINK_LAYER_LISTENER:
    return "link-layer-listener";
  case ProbeKind::REMOTE_QUERY:
    return "remote-query";
  case ProbeKind::VENDOR_API:
    return "vendor-api";
  }
  return "unknown";
}

std::string ProbeErrorCodeToString(ProbeErrorCode code) {
  switch (code) {
  case ProbeErrorCode::TIMEOUT:
    return "timeout";
  case ProbeErrorCode::UNREACHABLE:
    return "unreachable";
  case ProbeErrorCode::AUTH_FAILURE:
    return "auth-failure";
  case ProbeErrorCode::MALFORMED_RESPONSE:
    return "malformed-response";
  case ProbeErrorCode::INTERNAL:
    return "internal";
  }
  return "unknown";
}

std::string ProbeError::ToString() const {
  if (message.empty()) {
    return ProbeErrorCodeToString(code);
  }
  return ProbeErrorCodeToString(code) + ": " + message;
}

std::string InferVendor(const std::string &text) {
  static const std::pair<const char *, const char *> kVendors[] = {
      {"cisco", "Cisco"},     {"mikrotik", "MikroTik"}, {"routeros", "MikroTik"},
      {"juniper", "Juniper"}, {"junos", "Juniper"},     {"arista", "Arista"},
      {"aruba", "HPE"},       {"procurve", "HPE"},      {"ubiquiti", "Ubiquiti"},
      {"edgeos", "Ubiquiti"},
  };
  const std::string lower = util::ToLower(text);
  for (const auto &[needle, vendor] : kVendors) {
    if (lower.find(needle) != std::string::npos) {
      return vendor;
    }
  }
  return "";
}

bool Target::WantsProbe(const std::string &probe_id) const {
  return probes.empty() ||
         std::find(probes.begin(), probes.end(), probe_id) != probes.end();
}

} // namespace discovery
} // namespace topowatch
