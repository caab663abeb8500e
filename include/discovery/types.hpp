// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/**
 * Discovery data types shared by probes, the coordinator and the resolver
 *
 * A DiscoveryRecord is raw probe output: payload fields are strings exactly as
 * the probe parsed them (MACs in vendor notation, unvalidated IPs). The
 * resolver owns normalization.
 */

// Probe family. Passive listeners rank below active sources when merging.
enum class ProbeKind {
  LINK_LAYER_LISTENER,
  REMOTE_QUERY,
  VENDOR_API,
};

inline bool IsActiveProbe(ProbeKind kind) {
  return kind != ProbeKind::LINK_LAYER_LISTENER;
}

std::string ProbeKindToString(ProbeKind kind);

enum class ProbeErrorCode {
  TIMEOUT,            // Deadline hit (retryable)
  UNREACHABLE,        // Connect failed/reset (retryable, capped)
  AUTH_FAILURE,       // Credentials or privileges rejected (terminal)
  MALFORMED_RESPONSE, // Output could not be parsed (terminal for the observation)
  INTERNAL,           // Probe raised an unexpected exception (terminal)
};

std::string ProbeErrorCodeToString(ProbeErrorCode code);

struct ProbeError {
  ProbeErrorCode code{ProbeErrorCode::INTERNAL};
  std::string message;

  bool retryable() const {
    return code == ProbeErrorCode::TIMEOUT || code == ProbeErrorCode::UNREACHABLE;
  }
  std::string ToString() const;
};

// Payload field names understood by the resolver
namespace fields {
inline constexpr const char *MAC = "mac";
inline constexpr const char *IP = "ip";
inline constexpr const char *VENDOR_ID = "vendor_id";
inline constexpr const char *HOSTNAME = "hostname";
inline constexpr const char *DEVICE_TYPE = "device_type";
inline constexpr const char *VENDOR = "vendor";
inline constexpr const char *MODEL = "model";
inline constexpr const char *OS_VERSION = "os_version";
inline constexpr const char *PORT = "port";
inline constexpr const char *NETWORK = "network";
inline constexpr const char *LOCATION = "location";
} // namespace fields

using FieldMap = std::map<std::string, std::string>;

// Vendor name recognised in free-form text such as a system description or
// platform string ("" if none)
std::string InferVendor(const std::string &text);

struct DiscoveryRecord {
  std::string source_probe;     // Probe id, e.g. "lldp", "cli", "routeros"
  ProbeKind probe_kind{ProbeKind::LINK_LAYER_LISTENER};
  std::string target;           // Target id the probe ran against
  int64_t timestamp{0};         // Unix seconds
  double confidence_hint{0.5};  // 0..1
  FieldMap payload;             // Observed device (or local endpoint of a link)

  // Set when the record describes an adjacency: payload is the local
  // endpoint, peer the remote one
  std::optional<FieldMap> peer;
  std::string link_type;        // "physical", "logical", "inferred"

  bool is_link() const { return peer.has_value(); }
};

using ObservationSet = std::vector<DiscoveryRecord>;

struct Credentials {
  std::string username;
  std::string password;

  bool empty() const { return username.empty(); }
};

/**
 * One host or interface a probe can run against
 */
struct Target {
  std::string id;               // Unique within a round ("10.0.0.1", "if:eth0")
  std::string address;          // Host address for active probes
  std::string interface;        // Interface name for passive listeners
  uint16_t port{0};             // 0 = probe default
  std::optional<Credentials> credentials;
  std::vector<std::string> probes;  // Probe ids to run; empty = every probe
  std::string network;          // Inventory network name
  std::string location;

  bool WantsProbe(const std::string &probe_id) const;
};

/**
 * Outcome of one probe invocation. observations may be non-empty even when
 * error is set (partial results gathered before the failure).
 */
struct ProbeResult {
  ObservationSet observations;
  std::optional<ProbeError> error;

  static ProbeResult Failure(ProbeErrorCode code, std::string message) {
    ProbeResult r;
    r.error = ProbeError{code, std::move(message)};
    return r;
  }
};

} // namespace discovery
} // namespace topowatch
