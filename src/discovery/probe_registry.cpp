// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/byte_stream.hpp"
#include "discovery/link_layer_probe.hpp"
#include "discovery/probe.hpp"
#include "discovery/remote_query_probe.hpp"
#include "discovery/routeros_api.hpp"

namespace topowatch {
namespace discovery {

void ProbeRegistry::Register(const std::string &name, Factory factory) {
  factories_[name] = std::move(factory);
}

ProbePtr ProbeRegistry::Create(const std::string &name) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    return nullptr;
  }
  return it->second();
}

bool ProbeRegistry::Has(const std::string &name) const {
  return factories_.count(name) > 0;
}

std::vector<std::string> ProbeRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &[name, factory] : factories_) {
    names.push_back(name);
  }
  return names;
}

ProbeRegistry ProbeRegistry::Default() {
  ProbeRegistry registry;
  registry.Register("lldp", []() {
    return std::make_shared<LinkLayerListenerProbe>(
        []() { return std::make_unique<PacketSocketSource>(); });
  });
  registry.Register("cli", []() {
    return std::make_shared<RemoteQueryProbe>(TcpStream::Factory());
  });
  registry.Register("routeros", []() {
    return std::make_shared<VendorApiProbe>(TcpStream::Factory());
  });
  return registry;
}

} // namespace discovery
} // namespace topowatch
