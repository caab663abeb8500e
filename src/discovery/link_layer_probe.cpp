// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/link_layer_probe.hpp"
#include "discovery/frame_codec.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <map>

#include <arpa/inet.h>
#include <linux/if_ether.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <sys/socket.h>

namespace topowatch {
namespace discovery {

// ============================================================================
// PacketSocketSource
// ============================================================================

namespace {
constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr size_t kMaxFrameSize = 2048;
} // namespace

PacketSocketSource::PacketSocketSource() : socket_(io_) {}

PacketSocketSource::~PacketSocketSource() {
  boost::system::error_code ignored;
  socket_.close(ignored);
}

bool PacketSocketSource::Open(const std::string &interface, ProbeError &error) {
  interface_ = interface;
  unsigned int ifindex = if_nametoindex(interface.c_str());
  if (ifindex == 0) {
    error = ProbeError{ProbeErrorCode::UNREACHABLE, "no such interface " + interface};
    return false;
  }

  const int protocol = htons(ETH_P_ALL);
  boost::system::error_code ec;
  socket_.open(boost::asio::generic::raw_protocol(AF_PACKET, protocol), ec);
  if (ec) {
    if (ec == boost::asio::error::access_denied || ec.value() == EPERM) {
      error = ProbeError{ProbeErrorCode::AUTH_FAILURE,
                         "packet socket requires CAP_NET_RAW: " + ec.message()};
    } else {
      error = ProbeError{ProbeErrorCode::INTERNAL, "packet socket: " + ec.message()};
    }
    return false;
  }

  sockaddr_ll addr{};
  addr.sll_family = AF_PACKET;
  addr.sll_protocol = static_cast<unsigned short>(protocol);
  addr.sll_ifindex = static_cast<int>(ifindex);
  socket_.bind(boost::asio::generic::raw_protocol::endpoint(&addr, sizeof(addr), protocol), ec);
  if (ec) {
    error = ProbeError{ProbeErrorCode::UNREACHABLE, "bind to " + interface + ": " + ec.message()};
    return false;
  }

  const uint8_t *groups[] = {LLDP_MULTICAST, CDP_MULTICAST};
  for (const uint8_t *group : groups) {
    packet_mreq mreq{};
    mreq.mr_ifindex = static_cast<int>(ifindex);
    mreq.mr_type = PACKET_MR_MULTICAST;
    mreq.mr_alen = 6;
    std::memcpy(mreq.mr_address, group, 6);
    if (setsockopt(socket_.native_handle(), SOL_PACKET, PACKET_ADD_MEMBERSHIP, &mreq,
                   sizeof(mreq)) != 0) {
      LOG_DISC_WARN("{}: failed to join multicast group: {}", interface, std::strerror(errno));
    }
  }

  if (auto contents = util::read_file_string("/sys/class/net/" + interface + "/address")) {
    if (auto mac = util::NormalizeMac(util::Trim(*contents))) {
      local_mac_ = *mac;
    }
  }
  if (local_mac_.empty()) {
    LOG_DISC_WARN("{}: interface MAC unknown, adjacencies will be dropped", interface);
  }
  return true;
}

bool PacketSocketSource::Receive(std::vector<uint8_t> &frame,
                                 CancellationToken::Clock::time_point until,
                                 const CancellationToken &token,
                                 std::optional<ProbeError> &error) {
  io_.restart();
  bool done = false;
  bool aborted = false;
  boost::system::error_code result;
  std::array<uint8_t, kMaxFrameSize> buf;
  size_t received = 0;

  socket_.async_receive(boost::asio::buffer(buf),
                        [&](const boost::system::error_code &ec, size_t n) {
                          result = ec;
                          received = n;
                          done = true;
                        });

  while (!done) {
    auto now = CancellationToken::Clock::now();
    if (!aborted && (token.IsCancelled() || now >= until)) {
      aborted = true;
      boost::system::error_code ignored;
      socket_.cancel(ignored);
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
    io_.run_one_for(std::clamp(left, std::chrono::milliseconds(1), kPollSlice));
  }

  if (aborted || result == boost::asio::error::operation_aborted) {
    if (token.IsCancelled() && CancellationToken::Clock::now() < until) {
      error = ProbeError{ProbeErrorCode::TIMEOUT, "listen on " + interface_ + " cancelled"};
    }
    return false;
  }
  if (result) {
    error = ProbeError{ProbeErrorCode::UNREACHABLE,
                       "receive on " + interface_ + ": " + result.message()};
    return false;
  }
  frame.assign(buf.begin(), buf.begin() + received);
  return true;
}

std::string PacketSocketSource::LocalHostname() const {
  boost::system::error_code ec;
  auto name = boost::asio::ip::host_name(ec);
  return ec ? "" : name;
}

// ============================================================================
// LinkLayerListenerProbe
// ============================================================================

LinkLayerListenerProbe::LinkLayerListenerProbe(FrameSourceFactory factory)
    : LinkLayerListenerProbe(std::move(factory), Options{}) {}

LinkLayerListenerProbe::LinkLayerListenerProbe(FrameSourceFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {}

ProbeResult LinkLayerListenerProbe::Run(const Target &target, std::chrono::milliseconds timeout,
                                        const CancellationToken &token) {
  using Clock = CancellationToken::Clock;

  if (target.interface.empty()) {
    return ProbeResult::Failure(ProbeErrorCode::INTERNAL,
                                "target " + target.id + " has no interface to listen on");
  }

  const auto start = Clock::now();
  CancellationToken attempt = token.Child(start + timeout);

  // Finish the window slightly before the hard deadline
  auto margin = std::min<std::chrono::milliseconds>(timeout / 10, std::chrono::milliseconds(250));
  auto window = std::min(options_.listen_window, timeout - margin);
  const auto window_end = start + window;

  ProbeResult result;
  auto source = factory_();
  ProbeError open_error;
  if (!source->Open(target.interface, open_error)) {
    result.error = open_error;
    return result;
  }

  const std::string local_mac = source->LocalMac();
  const std::string local_hostname = source->LocalHostname();

  // One observation per (chassis, port); later advertisements replace earlier
  std::map<std::pair<std::string, std::string>, NeighborAdvertisement> neighbors;
  size_t malformed = 0;

  std::vector<uint8_t> frame;
  while (true) {
    std::optional<ProbeError> error;
    if (!source->Receive(frame, window_end, attempt, error)) {
      result.error = error;
      break;
    }
    if (!IsDiscoveryFrame(frame)) {
      continue;
    }
    NeighborAdvertisement adv;
    std::string decode_error;
    if (!DecodeDiscoveryFrame(frame, adv, decode_error)) {
      ++malformed;
      LOG_DISC_DEBUG("{}: dropping malformed frame: {}", target.interface, decode_error);
      continue;
    }
    auto key = std::make_pair(adv.chassis_id, adv.port_id);
    neighbors[key] = std::move(adv);
  }

  const int64_t now = util::GetTime();
  for (const auto &[key, adv] : neighbors) {
    DiscoveryRecord record;
    record.source_probe = id();
    record.probe_kind = kind();
    record.target = target.id;
    record.timestamp = now;
    record.confidence_hint = options_.confidence;
    record.link_type = "physical";

    if (!local_mac.empty()) {
      record.payload[fields::MAC] = local_mac;
    }
    if (!local_hostname.empty()) {
      record.payload[fields::HOSTNAME] = local_hostname;
    }
    record.payload[fields::PORT] = target.interface;
    if (!target.network.empty()) {
      record.payload[fields::NETWORK] = target.network;
    }
    if (!target.location.empty()) {
      record.payload[fields::LOCATION] = target.location;
    }

    FieldMap peer;
    peer[fields::MAC] = adv.chassis_mac.empty() ? adv.source_mac : adv.chassis_mac;
    if (adv.chassis_mac.empty() && !adv.chassis_id.empty()) {
      peer[fields::VENDOR_ID] = adv.protocol + ":" + adv.chassis_id;
    }
    if (!adv.management_ip.empty()) {
      peer[fields::IP] = adv.management_ip;
    }
    if (!adv.system_name.empty()) {
      peer[fields::HOSTNAME] = adv.system_name;
    }
    if (auto type = adv.DeviceType(); !type.empty()) {
      peer[fields::DEVICE_TYPE] = type;
    }
    if (!adv.port_id.empty()) {
      peer[fields::PORT] = adv.port_id;
    }
    if (!adv.platform.empty()) {
      peer[fields::MODEL] = adv.platform;
    }
    if (!adv.system_description.empty()) {
      auto lines = util::SplitString(adv.system_description, '\n');
      if (!lines.empty()) {
        peer[fields::OS_VERSION] = lines.front();
      }
    }
    if (auto vendor = InferVendor(adv.system_description + " " + adv.platform); !vendor.empty()) {
      peer[fields::VENDOR] = vendor;
    }
    record.peer = std::move(peer);
    result.observations.push_back(std::move(record));
  }

  LOG_DISC_DEBUG("{}: {} neighbor(s) heard, {} malformed frame(s)", target.interface,
                 result.observations.size(), malformed);
  return result;
}

} // namespace discovery
} // namespace topowatch
