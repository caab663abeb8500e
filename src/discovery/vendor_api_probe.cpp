// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/cli_parser.hpp"
#include "discovery/routeros_api.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace topowatch {
namespace discovery {

namespace {

std::string Get(const routeros::Attributes &attrs, const std::string &key) {
  auto it = attrs.find(key);
  return it == attrs.end() ? "" : it->second;
}

void SetIfPresent(FieldMap &fields, const char *field, const std::string &value) {
  if (!value.empty()) {
    fields[field] = value;
  }
}

} // namespace

VendorApiProbe::VendorApiProbe(StreamFactory factory)
    : VendorApiProbe(std::move(factory), Options{}) {}

VendorApiProbe::VendorApiProbe(StreamFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {}

ProbeResult VendorApiProbe::Run(const Target &target, std::chrono::milliseconds timeout,
                                const CancellationToken &token) {
  if (target.address.empty()) {
    return ProbeResult::Failure(ProbeErrorCode::INTERNAL,
                                "target " + target.id + " has no address");
  }
  if (!target.credentials || target.credentials->empty()) {
    return ProbeResult::Failure(ProbeErrorCode::AUTH_FAILURE,
                                "RouterOS API requires credentials");
  }

  CancellationToken attempt = token.Child(CancellationToken::Clock::now() + timeout);
  const uint16_t port = target.port != 0 ? target.port : routeros::DEFAULT_PORT;

  ProbeResult result;
  ProbeError error;
  auto stream = factory_();
  if (!stream->Connect(target.address, port, attempt, error)) {
    result.error = error;
    return result;
  }

  routeros::ApiClient client(*stream, attempt);
  std::vector<routeros::Attributes> identity;
  std::vector<routeros::Attributes> resource;
  if (!client.Login(*target.credentials, error) ||
      !client.Query("/system/identity/print", identity, error) ||
      !client.Query("/system/resource/print", resource, error)) {
    stream->Close();
    result.error = error;
    return result;
  }

  // Virtual routers (CHR) have no routerboard and trap this query
  std::vector<routeros::Attributes> board;
  if (!client.Query("/system/routerboard/print", board, error)) {
    if (error.code != ProbeErrorCode::MALFORMED_RESPONSE) {
      stream->Close();
      result.error = error;
      return result;
    }
    board.clear();
  }

  const std::string hostname = identity.empty() ? "" : Get(identity.front(), "name");
  const std::string serial = board.empty() ? "" : Get(board.front(), "serial-number");
  const routeros::Attributes res = resource.empty() ? routeros::Attributes{} : resource.front();

  // Chassis MAC: first ethernet interface
  std::vector<routeros::Attributes> interfaces;
  bool interfaces_ok = client.Query("/interface/print", interfaces, error);
  std::string chassis_mac;
  for (const auto &iface : interfaces) {
    if (Get(iface, "type") == "ether" && !Get(iface, "mac-address").empty()) {
      chassis_mac = Get(iface, "mac-address");
      break;
    }
  }

  FieldMap self;
  self[fields::IP] = target.address;
  SetIfPresent(self, fields::HOSTNAME, hostname);
  SetIfPresent(self, fields::MAC, chassis_mac);
  // The identity name is operator-editable; only the serial is stable
  if (!serial.empty()) {
    self[fields::VENDOR_ID] = "serial:" + serial;
  }

  const int64_t now = util::GetTime();
  DiscoveryRecord device;
  device.source_probe = id();
  device.probe_kind = kind();
  device.target = target.id;
  device.timestamp = now;
  device.confidence_hint = options_.device_confidence;
  device.payload = self;
  device.payload[fields::VENDOR] = "MikroTik";
  device.payload[fields::DEVICE_TYPE] = "router";
  SetIfPresent(device.payload, fields::MODEL, Get(res, "board-name"));
  SetIfPresent(device.payload, fields::OS_VERSION, Get(res, "version"));
  SetIfPresent(device.payload, fields::NETWORK, target.network);
  SetIfPresent(device.payload, fields::LOCATION, target.location);
  result.observations.push_back(std::move(device));

  if (!interfaces_ok) {
    stream->Close();
    result.error = error;
    return result;
  }

  std::vector<routeros::Attributes> neighbors;
  if (!client.Query("/ip/neighbor/print", neighbors, error)) {
    stream->Close();
    result.error = error;
    return result;
  }
  stream->Close();

  for (const auto &neighbor : neighbors) {
    DiscoveryRecord link;
    link.source_probe = id();
    link.probe_kind = kind();
    link.target = target.id;
    link.timestamp = now;
    link.confidence_hint = options_.neighbor_confidence;
    link.link_type = "physical";
    link.payload = self;
    // "ether2,bridge1": physical port first
    std::string local_port = Get(neighbor, "interface");
    local_port = local_port.substr(0, local_port.find(','));
    SetIfPresent(link.payload, fields::PORT, local_port);

    FieldMap peer;
    SetIfPresent(peer, fields::MAC, Get(neighbor, "mac-address"));
    std::string ip = Get(neighbor, "address4");
    SetIfPresent(peer, fields::IP, ip.empty() ? Get(neighbor, "address") : ip);
    SetIfPresent(peer, fields::HOSTNAME, Get(neighbor, "identity"));
    SetIfPresent(peer, fields::MODEL, Get(neighbor, "board"));
    SetIfPresent(peer, fields::OS_VERSION, Get(neighbor, "version"));
    SetIfPresent(peer, fields::PORT, Get(neighbor, "interface-name"));
    SetIfPresent(peer, fields::VENDOR, InferVendor(Get(neighbor, "platform")));
    std::string caps = Get(neighbor, "system-caps-enabled");
    SetIfPresent(peer, fields::DEVICE_TYPE,
                 DeviceTypeFromCapabilities(caps.empty() ? Get(neighbor, "system-caps") : caps));
    link.peer = std::move(peer);
    result.observations.push_back(std::move(link));
  }

  LOG_DISC_DEBUG("{}: routeros api returned {} observation(s)", target.id,
                 result.observations.size());
  return result;
}

} // namespace discovery
} // namespace topowatch
