// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/cancellation.hpp"
#include "discovery/types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/**
 * Probe - one discovery technique
 *
 * Contract:
 * - Run() must treat `timeout` (and the token) as a hard deadline and return
 *   promptly once the token is cancelled
 * - Observations fully parsed before cancellation or failure are returned in
 *   ProbeResult::observations alongside the error
 * - No shared mutable state: a probe object may be invoked concurrently from
 *   several worker threads against different targets
 *
 * Implementations: LinkLayerListenerProbe ("lldp"), RemoteQueryProbe ("cli"),
 * VendorApiProbe ("routeros").
 */
class Probe {
public:
  virtual ~Probe() = default;

  virtual std::string id() const = 0;
  virtual ProbeKind kind() const = 0;

  virtual ProbeResult Run(const Target &target, std::chrono::milliseconds timeout,
                          const CancellationToken &token) = 0;
};

using ProbePtr = std::shared_ptr<Probe>;

/**
 * Probe registry - maps configured probe names to implementations
 *
 * The daemon registers the built-in probes; tests register fakes.
 */
class ProbeRegistry {
public:
  using Factory = std::function<ProbePtr()>;

  void Register(const std::string &name, Factory factory);

  // Returns nullptr for unknown names
  ProbePtr Create(const std::string &name) const;

  bool Has(const std::string &name) const;
  std::vector<std::string> Names() const;

  // Registry with "lldp", "cli" and "routeros" wired to real network I/O
  static ProbeRegistry Default();

private:
  std::map<std::string, Factory> factories_;
};

} // namespace discovery
} // namespace topowatch
