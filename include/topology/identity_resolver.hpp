// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/discovery_coordinator.hpp"
#include "discovery/types.hpp"
#include "topology/types.hpp"
#include <map>
#include <set>
#include <string>
#include <tuple>

namespace topowatch {
namespace topology {

/**
 * IdentityResolver - merges discovery records into a GraphDelta
 *
 * Identity lookup order for a record: MAC, then IP, then vendor id. A device
 * first seen without a MAC is keyed provisionally by IP (or vendor id) and
 * re-keyed onto its MAC key as soon as an observation ties the two
 * together; the delta carries the old -> new mapping so the store can move
 * links.
 *
 * Attributes merge by Attribute::Outranks. The IP attribute of a device with
 * a MAC is also its MAC-to-IP binding: a different IP reported by a
 * different source is a conflict. A binding already in the current graph is
 * kept; otherwise the binding with the higher precedence wins, whatever the
 * record order. Every losing binding is reported in the delta.
 *
 * A vendor id only matches a device whose IP is unset or equal to the
 * record's IP, so one shared vendor id never merges distinct addresses.
 *
 * The resolver is stateless between rounds. Resolving the same records twice
 * against the graph produced by the first pass yields an empty delta.
 */
class IdentityResolver {
public:
  GraphDelta Resolve(const discovery::RoundResult &round, const TopologyGraph &current);
  GraphDelta Resolve(const discovery::ObservationSet &records, const TopologyGraph &current);

private:
  // Per-call working state
  struct Work {
    const TopologyGraph *graph{nullptr};
    std::map<std::string, Device> devices;     // Touched devices
    std::map<std::string, Link> links;         // Touched links
    std::set<std::string> removed;             // Keys merged away
    std::map<std::string, std::string> ip_index;
    std::map<std::string, std::string> vid_index;
    std::map<std::string, std::string> rekeyed;
    std::set<std::tuple<std::string, std::string, std::string>> conflict_seen;
    GraphDelta delta;
  };

  // Identity fields of one side of a record, normalized
  struct Identity {
    std::string mac;
    std::string ip;
    std::string vendor_id;

    bool empty() const { return mac.empty() && ip.empty() && vendor_id.empty(); }
  };

  static Identity ExtractIdentity(const discovery::FieldMap &fields);

  void BuildIndexes(Work &work) const;

  // Find or create the device for `id`, returning its key ("" if none)
  std::string Locate(Work &work, const Identity &id) const;

  Device *Touch(Work &work, const std::string &key) const;
  std::string FollowRekey(const Work &work, std::string key) const;
  void Rekey(Work &work, const std::string &from, const std::string &to) const;
  void IndexDevice(Work &work, const Device &device) const;

  void MergeObservation(Work &work, Device &device, const Identity &id,
                        const discovery::FieldMap &fields,
                        const discovery::DiscoveryRecord &record) const;
  void MergeAttribute(Work &work, Device &device, const std::string &name,
                      const Attribute &candidate) const;

  // Resolve one side of a record into a device key ("" if no identity)
  std::string ResolveSide(Work &work, const discovery::FieldMap &fields,
                          const discovery::DiscoveryRecord &record) const;

  void MergeLink(Work &work, const std::string &local, const std::string &peer,
                 const discovery::DiscoveryRecord &record) const;

  // Point each conflict at the binding that won and drop resolved ones
  void SettleConflicts(Work &work) const;
};

} // namespace topology
} // namespace topowatch
