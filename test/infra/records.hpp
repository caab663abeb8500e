#pragma once

#include "discovery/types.hpp"
#include <cstdint>
#include <string>

namespace topowatch {
namespace test {

// Shorthand for building observation sets

inline discovery::DiscoveryRecord DeviceRecord(const std::string& probe, discovery::FieldMap payload,
                                               double confidence, int64_t timestamp,
                                               bool active = true) {
    discovery::DiscoveryRecord record;
    record.source_probe = probe;
    record.probe_kind = active ? discovery::ProbeKind::REMOTE_QUERY
                               : discovery::ProbeKind::LINK_LAYER_LISTENER;
    record.target = probe + "-target";
    record.timestamp = timestamp;
    record.confidence_hint = confidence;
    record.payload = std::move(payload);
    return record;
}

inline discovery::DiscoveryRecord LinkRecord(const std::string& probe, discovery::FieldMap local,
                                             discovery::FieldMap peer, double confidence,
                                             int64_t timestamp, bool active = true,
                                             const std::string& link_type = "physical") {
    discovery::DiscoveryRecord record = DeviceRecord(probe, std::move(local), confidence,
                                                     timestamp, active);
    record.peer = std::move(peer);
    record.link_type = link_type;
    return record;
}

inline discovery::FieldMap Mac(const std::string& mac) {
    return {{discovery::fields::MAC, mac}};
}

inline discovery::FieldMap MacPort(const std::string& mac, const std::string& port) {
    return {{discovery::fields::MAC, mac}, {discovery::fields::PORT, port}};
}

} // namespace test
} // namespace topowatch
