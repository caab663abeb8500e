// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/identity_resolver.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <string_view>
#include <tuple>
#include <vector>

namespace topowatch {
namespace topology {

namespace fields = discovery::fields;

namespace {

bool IsMacKey(const std::string &key) { return key.rfind("mac:", 0) == 0; }

std::string FieldOrEmpty(const discovery::FieldMap &map, const char *name) {
  auto it = map.find(name);
  return it == map.end() ? "" : util::Trim(it->second);
}

// Keep the lower of two non-zero timestamps
int64_t MinSeen(int64_t a, int64_t b) {
  if (a == 0)
    return b;
  if (b == 0)
    return a;
  return std::min(a, b);
}

// Plain attributes copied from a record side
const char *const kPlainAttributes[] = {
    attr::HOSTNAME, attr::DEVICE_TYPE, attr::VENDOR,   attr::MODEL,
    attr::OS_VERSION, attr::NETWORK,   attr::LOCATION,
};

} // namespace

IdentityResolver::Identity IdentityResolver::ExtractIdentity(const discovery::FieldMap &map) {
  Identity id;
  if (auto mac = util::NormalizeMac(FieldOrEmpty(map, fields::MAC))) {
    id.mac = *mac;
  }
  if (auto ip = util::ValidateAndNormalizeIP(FieldOrEmpty(map, fields::IP))) {
    id.ip = *ip;
  }
  id.vendor_id = FieldOrEmpty(map, fields::VENDOR_ID);
  return id;
}

// ============================================================================
// Working state helpers
// ============================================================================

void IdentityResolver::IndexDevice(Work &work, const Device &device) const {
  // A device with a MAC wins an IP/vendor id over a provisional one; otherwise
  // the first owner keeps it
  auto claim = [&](std::map<std::string, std::string> &index, const std::string &value) {
    if (value.empty()) {
      return;
    }
    auto it = index.find(value);
    if (it == index.end() || work.removed.count(it->second) ||
        (IsMacKey(device.key) && !IsMacKey(it->second))) {
      index[value] = device.key;
    }
  };
  claim(work.ip_index, device.Get(attr::IP));
  claim(work.vid_index, device.Get(attr::VENDOR_ID));
}

void IdentityResolver::BuildIndexes(Work &work) const {
  for (const auto &[key, device] : work.graph->devices) {
    IndexDevice(work, device);
  }
}

Device *IdentityResolver::Touch(Work &work, const std::string &key) const {
  auto it = work.devices.find(key);
  if (it != work.devices.end()) {
    return &it->second;
  }
  if (work.removed.count(key)) {
    return nullptr;
  }
  const Device *existing = work.graph->FindDevice(key);
  if (!existing) {
    return nullptr;
  }
  return &work.devices.emplace(key, *existing).first->second;
}

std::string IdentityResolver::FollowRekey(const Work &work, std::string key) const {
  // Rekey() keeps the map flattened, so one hop suffices
  auto it = work.rekeyed.find(key);
  return it == work.rekeyed.end() ? key : it->second;
}

std::string IdentityResolver::Locate(Work &work, const Identity &id) const {
  auto lookup = [&](const std::map<std::string, std::string> &index,
                    const std::string &value) -> std::string {
    if (value.empty()) {
      return "";
    }
    auto it = index.find(value);
    if (it == index.end()) {
      return "";
    }
    std::string key = FollowRekey(work, it->second);
    return Touch(work, key) ? key : "";
  };

  // A vendor id only identifies a device whose address does not contradict it
  auto lookup_vid = [&]() -> std::string {
    std::string key = lookup(work.vid_index, id.vendor_id);
    if (key.empty() || id.ip.empty()) {
      return key;
    }
    const Device *device = Touch(work, key);
    const std::string bound = device ? device->Get(attr::IP) : "";
    return bound.empty() || bound == id.ip ? key : "";
  };

  if (!id.mac.empty()) {
    const std::string key = MacKey(id.mac);
    // Absorb provisional devices this observation ties to the MAC
    for (const std::string &alt : {lookup(work.ip_index, id.ip), lookup_vid()}) {
      if (!alt.empty() && alt != key && !IsMacKey(alt)) {
        Rekey(work, alt, key);
      }
    }
    if (!Touch(work, key)) {
      Device device;
      device.key = key;
      device.mac = id.mac;
      work.devices.emplace(key, std::move(device));
    }
    return key;
  }

  if (auto key = lookup(work.ip_index, id.ip); !key.empty()) {
    return key;
  }
  if (auto key = lookup_vid(); !key.empty()) {
    return key;
  }

  const std::string key = !id.ip.empty() ? IpKey(id.ip) : VendorKey(id.vendor_id);
  if (!Touch(work, key)) {
    Device device;
    device.key = key;
    work.devices.emplace(key, std::move(device));
  }
  return key;
}

void IdentityResolver::Rekey(Work &work, const std::string &from, const std::string &to) const {
  Device *src = Touch(work, from);
  if (!src) {
    return;
  }
  Device moved = std::move(*src);
  work.devices.erase(from);
  work.removed.insert(from);

  Device *dst = Touch(work, to);
  if (!dst) {
    moved.key = to;
    if (IsMacKey(to)) {
      moved.mac = to.substr(4);
    }
    dst = &work.devices.emplace(to, std::move(moved)).first->second;
  } else {
    for (const auto &[name, value] : moved.attributes) {
      MergeAttribute(work, *dst, name, value);
    }
    dst->sources.insert(moved.sources.begin(), moved.sources.end());
    for (const auto &[source, c] : moved.source_confidence) {
      double &best = dst->source_confidence[source];
      best = std::max(best, c);
    }
    dst->first_seen = MinSeen(dst->first_seen, moved.first_seen);
    if (moved.last_seen > dst->last_seen && dst->status != DeviceStatus::MAINTENANCE) {
      dst->status = moved.status;
    }
    dst->last_seen = std::max(dst->last_seen, moved.last_seen);
    dst->confidence = dst->ComputeConfidence();
  }

  // Keep the rekey map and indexes flattened onto the final key
  for (auto &[old_key, new_key] : work.rekeyed) {
    if (new_key == from)
      new_key = to;
  }
  work.rekeyed[from] = to;
  for (auto *index : {&work.ip_index, &work.vid_index}) {
    for (auto &[value, key] : *index) {
      if (key == from)
        key = to;
    }
  }
  IndexDevice(work, *dst);

  // Carry links touching the old key over to the new one
  std::vector<Link> moving;
  for (auto it = work.links.begin(); it != work.links.end();) {
    if (it->second.a == from || it->second.b == from) {
      moving.push_back(std::move(it->second));
      it = work.links.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto &[key, link] : work.graph->links) {
    if ((link.a == from || link.b == from) && !work.links.count(key)) {
      moving.push_back(link);
    }
  }
  for (Link &link : moving) {
    if (!RekeyLinkEndpoint(link, from, to)) {
      continue;
    }
    auto existing = work.links.find(link.key);
    if (existing == work.links.end()) {
      if (const Link *in_graph = work.graph->FindLink(link.key)) {
        existing = work.links.emplace(link.key, *in_graph).first;
      }
    }
    if (existing == work.links.end()) {
      work.links.emplace(link.key, std::move(link));
    } else {
      FoldLink(existing->second, link);
    }
  }

  LOG_RESOLVER_DEBUG("re-keyed {} -> {}", from, to);
}

// ============================================================================
// Merging
// ============================================================================

void IdentityResolver::MergeAttribute(Work &work, Device &device, const std::string &name,
                                      const Attribute &candidate) const {
  if (candidate.value.empty()) {
    return;
  }
  auto it = device.attributes.find(name);
  if (it == device.attributes.end()) {
    device.attributes.emplace(name, candidate);
    return;
  }
  Attribute &current = it->second;

  if (name == attr::IP && !device.mac.empty() && current.value != candidate.value &&
      current.source != candidate.source) {
    // A binding the graph already holds is kept; bindings first seen in this
    // pass compete by precedence. The winner is filled in by SettleConflicts.
    const Device *before = work.graph->FindDevice(device.key);
    const bool established = before && before->Get(attr::IP) == current.value;
    const bool replace = !established && candidate.Outranks(current);
    const Attribute &lost = replace ? current : candidate;
    auto id = std::make_tuple(device.key, lost.value, lost.source);
    if (work.conflict_seen.insert(id).second) {
      ResolverConflict conflict;
      conflict.device_key = device.key;
      conflict.conflicting_ip = lost.value;
      conflict.conflicting_source = lost.source;
      conflict.detected_at = std::max(current.timestamp, candidate.timestamp);
      work.delta.conflicts.push_back(std::move(conflict));
    }
    if (replace) {
      current = candidate;
    }
    return;
  }

  if (candidate.Outranks(current)) {
    current = candidate;
  }
}

void IdentityResolver::MergeObservation(Work &work, Device &device, const Identity &id,
                                        const discovery::FieldMap &map,
                                        const discovery::DiscoveryRecord &record) const {
  const bool active = discovery::IsActiveProbe(record.probe_kind);
  const double hint = std::clamp(record.confidence_hint, 0.0, 1.0);

  auto candidate = [&](std::string value) {
    Attribute a;
    a.value = std::move(value);
    a.confidence = hint;
    a.timestamp = record.timestamp;
    a.active_source = active;
    a.source = record.source_probe;
    return a;
  };

  for (const char *name : kPlainAttributes) {
    std::string value = FieldOrEmpty(map, name);
    if (std::string_view(name) == attr::DEVICE_TYPE) {
      value = util::ToLower(value);
    }
    MergeAttribute(work, device, name, candidate(std::move(value)));
  }
  MergeAttribute(work, device, attr::VENDOR_ID, candidate(id.vendor_id));
  MergeAttribute(work, device, attr::IP, candidate(id.ip));

  device.sources.insert(record.source_probe);
  double &best = device.source_confidence[record.source_probe];
  best = std::max(best, hint);
  device.confidence = device.ComputeConfidence();

  if (device.status != DeviceStatus::MAINTENANCE &&
      (device.status == DeviceStatus::UNKNOWN || record.timestamp > device.last_seen)) {
    device.status = DeviceStatus::ONLINE;
  }
  device.first_seen = MinSeen(device.first_seen, record.timestamp);
  device.last_seen = std::max(device.last_seen, record.timestamp);

  IndexDevice(work, device);
}

std::string IdentityResolver::ResolveSide(Work &work, const discovery::FieldMap &map,
                                          const discovery::DiscoveryRecord &record) const {
  Identity id = ExtractIdentity(map);
  if (id.empty()) {
    return "";
  }
  std::string key = Locate(work, id);
  Device *device = Touch(work, key);
  if (!device) {
    return "";
  }
  MergeObservation(work, *device, id, map, record);
  return key;
}

void IdentityResolver::MergeLink(Work &work, const std::string &local_key,
                                 const std::string &peer_key,
                                 const discovery::DiscoveryRecord &record) const {
  const std::string local = FollowRekey(work, local_key);
  const std::string peer = FollowRekey(work, peer_key);
  if (local == peer) {
    LOG_RESOLVER_TRACE("ignoring self-loop on {} from {}", local, record.source_probe);
    return;
  }
  const std::string type = record.link_type.empty() ? "physical" : record.link_type;
  const std::string key = LinkKey(local, peer, type);

  auto it = work.links.find(key);
  if (it == work.links.end()) {
    if (const Link *in_graph = work.graph->FindLink(key)) {
      it = work.links.emplace(key, *in_graph).first;
    } else {
      Link link;
      link.key = key;
      link.a = std::min(local, peer);
      link.b = std::max(local, peer);
      link.link_type = type;
      link.status = DeviceStatus::UNKNOWN;
      it = work.links.emplace(key, std::move(link)).first;
    }
  }
  Link &link = it->second;

  const bool newer = record.timestamp >= link.last_seen;
  const std::string local_port = FieldOrEmpty(record.payload, fields::PORT);
  const std::string peer_port = FieldOrEmpty(*record.peer, fields::PORT);
  std::string &port_local = (link.a == local) ? link.port_a : link.port_b;
  std::string &port_peer = (link.a == local) ? link.port_b : link.port_a;
  if (!local_port.empty() && (port_local.empty() || newer))
    port_local = local_port;
  if (!peer_port.empty() && (port_peer.empty() || newer))
    port_peer = peer_port;

  link.discovered_via.insert(record.source_probe);
  if (link.status == DeviceStatus::UNKNOWN || record.timestamp > link.last_seen) {
    link.status = DeviceStatus::ONLINE;
  }
  link.first_seen = MinSeen(link.first_seen, record.timestamp);
  link.last_seen = std::max(link.last_seen, record.timestamp);
}

void IdentityResolver::SettleConflicts(Work &work) const {
  auto &conflicts = work.delta.conflicts;
  for (auto &conflict : conflicts) {
    conflict.device_key = FollowRekey(work, conflict.device_key);
    auto device = work.devices.find(conflict.device_key);
    if (device == work.devices.end()) {
      continue;
    }
    auto ip = device->second.attributes.find(attr::IP);
    if (ip != device->second.attributes.end()) {
      conflict.existing_ip = ip->second.value;
      conflict.existing_source = ip->second.source;
    }
  }
  // A source that lost early and won later is the binding, not a conflict
  conflicts.erase(std::remove_if(conflicts.begin(), conflicts.end(),
                                 [](const ResolverConflict &c) {
                                   return c.existing_ip.empty() ||
                                          c.existing_ip == c.conflicting_ip;
                                 }),
                  conflicts.end());
  std::sort(conflicts.begin(), conflicts.end(),
            [](const ResolverConflict &l, const ResolverConflict &r) {
              return std::tie(l.device_key, l.conflicting_ip, l.conflicting_source) <
                     std::tie(r.device_key, r.conflicting_ip, r.conflicting_source);
            });
  for (const auto &conflict : conflicts) {
    LOG_RESOLVER_WARN("address conflict: {}", conflict.Describe());
  }
}

// ============================================================================
// Resolve
// ============================================================================

GraphDelta IdentityResolver::Resolve(const discovery::RoundResult &round,
                                     const TopologyGraph &current) {
  return Resolve(round.records, current);
}

GraphDelta IdentityResolver::Resolve(const discovery::ObservationSet &records,
                                     const TopologyGraph &current) {
  Work work;
  work.graph = &current;
  BuildIndexes(work);

  for (const auto &record : records) {
    ++work.delta.records_consumed;
    work.delta.observed_at = std::max(work.delta.observed_at, record.timestamp);

    std::string local = ResolveSide(work, record.payload, record);
    if (!record.is_link()) {
      if (local.empty()) {
        ++work.delta.records_dropped;
        LOG_RESOLVER_DEBUG("dropping {} record for {}: no identity", record.source_probe,
                           record.target);
      }
      continue;
    }

    std::string peer = ResolveSide(work, *record.peer, record);
    if (local.empty() || peer.empty()) {
      ++work.delta.records_dropped;
      LOG_RESOLVER_DEBUG("dropping {} link record for {}: endpoint without identity",
                         record.source_probe, record.target);
      continue;
    }
    MergeLink(work, local, peer, record);
  }

  SettleConflicts(work);
  GraphDelta &delta = work.delta;
  delta.rekeyed = work.rekeyed;

  for (auto &[key, device] : work.devices) {
    const Device *before = current.FindDevice(key);
    if (!before || !(*before == device)) {
      delta.upserted_devices.push_back(device);
    }
  }
  for (auto &[key, link] : work.links) {
    // Endpoints merged away later in the same pass
    if (work.removed.count(link.a) || work.removed.count(link.b)) {
      continue;
    }
    const Link *before = current.FindLink(key);
    if (!before || !(*before == link)) {
      delta.upserted_links.push_back(link);
    }
  }

  LOG_RESOLVER_DEBUG("resolved {} record(s): {} device(s), {} link(s), {} re-key(s), "
                     "{} conflict(s), {} dropped",
                     delta.records_consumed, delta.upserted_devices.size(),
                     delta.upserted_links.size(), delta.rekeyed.size(), delta.conflicts.size(),
                     delta.records_dropped);
  return std::move(work.delta);
}

} // namespace topology
} // namespace topowatch
