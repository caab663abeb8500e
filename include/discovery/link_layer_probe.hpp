// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/probe.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/**
 * FrameSource - receives raw Ethernet frames on one interface
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  virtual bool Open(const std::string &interface, ProbeError &error) = 0;

  /**
   * Wait for the next frame until `until` or cancellation.
   * Returns true with `frame` filled; false with `error` unset when the
   * window elapsed; false with `error` set on failure.
   */
  virtual bool Receive(std::vector<uint8_t> &frame,
                       CancellationToken::Clock::time_point until,
                       const CancellationToken &token,
                       std::optional<ProbeError> &error) = 0;

  // MAC address of the opened interface ("" if unknown)
  virtual std::string LocalMac() const = 0;

  virtual std::string LocalHostname() const { return ""; }
};

using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>()>;

/**
 * AF_PACKET frame source (Linux)
 *
 * Binds a boost::asio generic raw socket to the interface and joins the LLDP
 * and CDP multicast groups. Requires CAP_NET_RAW; EPERM surfaces as
 * AUTH_FAILURE.
 */
class PacketSocketSource : public FrameSource {
public:
  PacketSocketSource();
  ~PacketSocketSource() override;

  bool Open(const std::string &interface, ProbeError &error) override;
  bool Receive(std::vector<uint8_t> &frame, CancellationToken::Clock::time_point until,
               const CancellationToken &token, std::optional<ProbeError> &error) override;
  std::string LocalMac() const override { return local_mac_; }
  std::string LocalHostname() const override;

private:
  boost::asio::io_context io_;
  boost::asio::generic::raw_protocol::socket socket_;
  std::string interface_;
  std::string local_mac_;
};

/**
 * LinkLayerListenerProbe ("lldp")
 *
 * Passive probe: listens on Target::interface for a bounded window and turns
 * each decoded LLDP/CDP advertisement into a link observation between the
 * listening interface's device and the advertising neighbor.
 *
 * The window ends at min(listen_window, probe deadline - margin) so that a
 * normal listen completes before the per-probe timeout. Cancellation by the
 * round deadline returns what was decoded so far with TIMEOUT.
 */
class LinkLayerListenerProbe : public Probe {
public:
  struct Options {
    std::chrono::milliseconds listen_window{std::chrono::seconds(30)};
    double confidence{0.4};
  };

  explicit LinkLayerListenerProbe(FrameSourceFactory factory);
  LinkLayerListenerProbe(FrameSourceFactory factory, Options options);

  std::string id() const override { return "lldp"; }
  ProbeKind kind() const override { return ProbeKind::LINK_LAYER_LISTENER; }

  ProbeResult Run(const Target &target, std::chrono::milliseconds timeout,
                  const CancellationToken &token) override;

private:
  FrameSourceFactory factory_;
  Options options_;
};

} // namespace discovery
} // namespace topowatch
