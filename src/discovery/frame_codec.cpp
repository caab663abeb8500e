// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/frame_codec.hpp"
#include "util/netaddress.hpp"
#include <algorithm>
#include <array>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <cctype>
#include <cstdio>

namespace topowatch {
namespace discovery {

// ============================================================================
// FrameReader
// ============================================================================

FrameReader::FrameReader(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

FrameReader::FrameReader(std::span<const uint8_t> data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

bool FrameReader::check_available(size_t bytes) {
  if (error_ || bytes_remaining() < bytes) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t FrameReader::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t FrameReader::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t value = static_cast<uint16_t>((data_[position_] << 8) | data_[position_ + 1]);
  position_ += 2;
  return value;
}

uint32_t FrameReader::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t value = (static_cast<uint32_t>(data_[position_]) << 24) |
                   (static_cast<uint32_t>(data_[position_ + 1]) << 16) |
                   (static_cast<uint32_t>(data_[position_ + 2]) << 8) |
                   static_cast<uint32_t>(data_[position_ + 3]);
  position_ += 4;
  return value;
}

std::vector<uint8_t> FrameReader::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

std::string FrameReader::read_string(size_t count) {
  if (!check_available(count))
    return "";
  std::string out(reinterpret_cast<const char *>(data_ + position_), count);
  position_ += count;
  // Some agents NUL-terminate
  while (!out.empty() && out.back() == '\0') {
    out.pop_back();
  }
  return out;
}

void FrameReader::skip(size_t count) {
  if (check_available(count)) {
    position_ += count;
  }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string PrintableOrHex(const std::vector<uint8_t> &bytes) {
  bool printable = !bytes.empty() && std::all_of(bytes.begin(), bytes.end(), [](uint8_t c) {
    return std::isprint(c) != 0;
  });
  if (printable) {
    return std::string(bytes.begin(), bytes.end());
  }
  std::string out;
  out.reserve(bytes.size() * 2);
  char buf[3];
  for (uint8_t b : bytes) {
    std::snprintf(buf, sizeof(buf), "%02x", b);
    out.append(buf, 2);
  }
  return out;
}

std::string MacFromBytes(const std::vector<uint8_t> &bytes) {
  std::array<uint8_t, 6> mac{};
  std::copy_n(bytes.begin(), 6, mac.begin());
  return util::FormatMac(mac);
}

// IANA address family: 1 = IPv4, 2 = IPv6
std::string AddressFromBytes(uint8_t family, const std::vector<uint8_t> &bytes) {
  if (family == 1 && bytes.size() == 4) {
    boost::asio::ip::address_v4::bytes_type raw;
    std::copy_n(bytes.begin(), 4, raw.begin());
    return boost::asio::ip::address_v4(raw).to_string();
  }
  if (family == 2 && bytes.size() == 16) {
    boost::asio::ip::address_v6::bytes_type raw;
    std::copy_n(bytes.begin(), 16, raw.begin());
    return boost::asio::ip::address_v6(raw).to_string();
  }
  return "";
}

void AddCapability(std::vector<std::string> &caps, const char *name) {
  if (std::find(caps.begin(), caps.end(), name) == caps.end()) {
    caps.emplace_back(name);
  }
}

// Prefer an IPv4 management address over IPv6
void SetManagementIp(NeighborAdvertisement &out, const std::string &ip) {
  if (ip.empty()) {
    return;
  }
  bool current_v6 = out.management_ip.find(':') != std::string::npos;
  bool new_v4 = ip.find(':') == std::string::npos;
  if (out.management_ip.empty() || (current_v6 && new_v4)) {
    out.management_ip = ip;
  }
}

} // namespace

std::string NeighborAdvertisement::DeviceType() const {
  static const char *const kPriority[] = {"router", "switch", "access_point", "phone", "host"};
  for (const char *role : kPriority) {
    if (std::find(capabilities.begin(), capabilities.end(), role) != capabilities.end()) {
      return role;
    }
  }
  return "";
}

// ============================================================================
// LLDP
// ============================================================================

bool DecodeLldpdu(std::span<const uint8_t> pdu, NeighborAdvertisement &out,
                  std::string &error) {
  FrameReader reader(pdu);
  bool have_chassis = false;
  bool have_port = false;
  bool have_ttl = false;

  out.protocol = "lldp";

  while (reader.bytes_remaining() >= 2) {
    uint16_t header = reader.read_uint16();
    uint8_t type = static_cast<uint8_t>(header >> 9);
    size_t length = header & 0x01ff;

    if (type == lldp::END) {
      break;
    }
    if (length > reader.bytes_remaining()) {
      error = "truncated LLDP TLV type " + std::to_string(type);
      return false;
    }

    FrameReader tlv(pdu.data() + reader.position(), length);
    reader.skip(length);

    switch (type) {
    case lldp::CHASSIS_ID: {
      if (length < 2) {
        error = "short chassis id TLV";
        return false;
      }
      uint8_t subtype = tlv.read_uint8();
      auto value = tlv.read_bytes(length - 1);
      if (subtype == lldp::CHASSIS_MAC && value.size() == 6) {
        out.chassis_mac = MacFromBytes(value);
        out.chassis_id = out.chassis_mac;
      } else if (subtype == lldp::CHASSIS_NETWORK_ADDRESS && value.size() > 1) {
        std::vector<uint8_t> addr(value.begin() + 1, value.end());
        out.chassis_id = AddressFromBytes(value[0], addr);
        SetManagementIp(out, out.chassis_id);
      } else {
        out.chassis_id = PrintableOrHex(value);
      }
      have_chassis = true;
      break;
    }
    case lldp::PORT_ID: {
      if (length < 2) {
        error = "short port id TLV";
        return false;
      }
      uint8_t subtype = tlv.read_uint8();
      auto value = tlv.read_bytes(length - 1);
      if (subtype == lldp::PORT_MAC && value.size() == 6) {
        out.port_id = MacFromBytes(value);
      } else if (subtype == lldp::PORT_NETWORK_ADDRESS && value.size() > 1) {
        std::vector<uint8_t> addr(value.begin() + 1, value.end());
        out.port_id = AddressFromBytes(value[0], addr);
      } else {
        out.port_id = PrintableOrHex(value);
      }
      have_port = true;
      break;
    }
    case lldp::TTL:
      if (length < 2) {
        error = "short TTL TLV";
        return false;
      }
      out.ttl = tlv.read_uint16();
      have_ttl = true;
      break;
    case lldp::PORT_DESCRIPTION:
      out.port_description = tlv.read_string(length);
      break;
    case lldp::SYSTEM_NAME:
      out.system_name = tlv.read_string(length);
      break;
    case lldp::SYSTEM_DESCRIPTION:
      out.system_description = tlv.read_string(length);
      break;
    case lldp::SYSTEM_CAPABILITIES: {
      if (length < 4) {
        break;
      }
      uint16_t system = tlv.read_uint16();
      uint16_t enabled = tlv.read_uint16();
      uint16_t caps = enabled != 0 ? enabled : system;
      if (caps & lldp::CAP_ROUTER)
        AddCapability(out.capabilities, "router");
      if (caps & lldp::CAP_BRIDGE)
        AddCapability(out.capabilities, "switch");
      if (caps & lldp::CAP_WLAN_AP)
        AddCapability(out.capabilities, "access_point");
      if (caps & lldp::CAP_TELEPHONE)
        AddCapability(out.capabilities, "phone");
      if (caps & lldp::CAP_STATION)
        AddCapability(out.capabilities, "host");
      break;
    }
    case lldp::MANAGEMENT_ADDRESS: {
      uint8_t addr_len = tlv.read_uint8();
      if (addr_len < 2 || tlv.has_error()) {
        break;
      }
      uint8_t family = tlv.read_uint8();
      auto addr = tlv.read_bytes(addr_len - 1);
      if (!tlv.has_error()) {
        SetManagementIp(out, AddressFromBytes(family, addr));
      }
      break;
    }
    default:
      // Organizationally specific and unknown TLVs are skipped
      break;
    }
  }

  if (!have_chassis || !have_port || !have_ttl) {
    error = "LLDPDU missing mandatory TLV";
    return false;
  }
  return true;
}

// ============================================================================
// CDP
// ============================================================================

bool DecodeCdpPdu(std::span<const uint8_t> pdu, NeighborAdvertisement &out,
                  std::string &error) {
  FrameReader reader(pdu);
  uint8_t version = reader.read_uint8();
  out.ttl = reader.read_uint8();
  reader.read_uint16(); // checksum
  if (reader.has_error()) {
    error = "truncated CDP header";
    return false;
  }
  if (version != 1 && version != 2) {
    error = "unsupported CDP version " + std::to_string(version);
    return false;
  }

  out.protocol = "cdp";
  bool have_device_id = false;

  while (reader.bytes_remaining() >= 4) {
    uint16_t type = reader.read_uint16();
    uint16_t length = reader.read_uint16();
    if (length < 4 || static_cast<size_t>(length - 4) > reader.bytes_remaining()) {
      error = "bad CDP TLV length " + std::to_string(length);
      return false;
    }
    size_t value_len = length - 4;
    FrameReader tlv(pdu.data() + reader.position(), value_len);
    reader.skip(value_len);

    switch (type) {
    case cdp::DEVICE_ID:
      out.chassis_id = tlv.read_string(value_len);
      out.system_name = out.chassis_id;
      have_device_id = !out.chassis_id.empty();
      break;
    case cdp::ADDRESSES: {
      uint32_t count = tlv.read_uint32();
      for (uint32_t i = 0; i < count && !tlv.has_error(); ++i) {
        uint8_t proto_type = tlv.read_uint8();
        uint8_t proto_len = tlv.read_uint8();
        auto proto = tlv.read_bytes(proto_len);
        uint16_t addr_len = tlv.read_uint16();
        auto addr = tlv.read_bytes(addr_len);
        if (tlv.has_error()) {
          break;
        }
        // NLPID 0xCC = IPv4
        if (proto_type == 1 && proto.size() == 1 && proto[0] == 0xcc) {
          SetManagementIp(out, AddressFromBytes(1, addr));
        } else if (proto_type == 2 && addr.size() == 16) {
          SetManagementIp(out, AddressFromBytes(2, addr));
        }
      }
      break;
    }
    case cdp::PORT_ID:
      out.port_id = tlv.read_string(value_len);
      break;
    case cdp::CAPABILITIES: {
      uint32_t caps = tlv.read_uint32();
      if (tlv.has_error()) {
        break;
      }
      if (caps & cdp::CAP_ROUTER)
        AddCapability(out.capabilities, "router");
      if (caps & (cdp::CAP_SWITCH | cdp::CAP_TRANS_BRIDGE | cdp::CAP_SRCROUTE_BRIDGE))
        AddCapability(out.capabilities, "switch");
      if (caps & cdp::CAP_PHONE)
        AddCapability(out.capabilities, "phone");
      if (caps & cdp::CAP_HOST)
        AddCapability(out.capabilities, "host");
      break;
    }
    case cdp::SOFTWARE_VERSION:
      out.system_description = tlv.read_string(value_len);
      break;
    case cdp::PLATFORM:
      out.platform = tlv.read_string(value_len);
      break;
    default:
      break;
    }
  }

  if (!have_device_id) {
    error = "CDP PDU missing device id";
    return false;
  }
  return true;
}

// ============================================================================
// Ethernet framing
// ============================================================================

bool IsDiscoveryFrame(std::span<const uint8_t> frame) {
  if (frame.size() < 14) {
    return false;
  }
  return std::equal(std::begin(LLDP_MULTICAST), std::end(LLDP_MULTICAST), frame.begin()) ||
         std::equal(std::begin(CDP_MULTICAST), std::end(CDP_MULTICAST), frame.begin());
}

bool DecodeDiscoveryFrame(std::span<const uint8_t> frame, NeighborAdvertisement &out,
                          std::string &error) {
  static constexpr uint8_t kCdpSnap[8] = {0xaa, 0xaa, 0x03, 0x00, 0x00, 0x0c, 0x20, 0x00};

  FrameReader reader(frame);
  reader.skip(6); // destination
  auto src = reader.read_bytes(6);
  uint16_t type = reader.read_uint16();
  if (type == ETHERTYPE_VLAN) {
    reader.skip(2); // TCI
    type = reader.read_uint16();
  }
  if (reader.has_error()) {
    error = "truncated Ethernet header";
    return false;
  }

  out = NeighborAdvertisement{};
  out.source_mac = MacFromBytes(src);
  auto rest = frame.subspan(reader.position());

  if (type == ETHERTYPE_LLDP) {
    return DecodeLldpdu(rest, out, error);
  }

  // 802.3 length field followed by LLC/SNAP
  if (type <= 1500 && rest.size() >= sizeof(kCdpSnap) &&
      std::equal(std::begin(kCdpSnap), std::end(kCdpSnap), rest.begin())) {
    size_t pdu_len = std::min<size_t>(type, rest.size());
    if (pdu_len < sizeof(kCdpSnap)) {
      error = "truncated CDP frame";
      return false;
    }
    return DecodeCdpPdu(rest.subspan(sizeof(kCdpSnap), pdu_len - sizeof(kCdpSnap)), out,
                        error);
  }

  error = "not an LLDP or CDP frame";
  return false;
}

} // namespace discovery
} // namespace topowatch
