// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/**
 * Link-layer discovery frame decoding (LLDP / CDP)
 *
 * Input is a complete Ethernet frame as delivered by a packet socket:
 *
 *   LLDP: dst(6) src(6) [0x8100 tag(4)] ethertype 0x88cc, TLV list
 *         TLV header: 7-bit type, 9-bit length (802.1AB)
 *   CDP:  dst(6) src(6) len(2) LLC/SNAP AA AA 03 00 00 0C 20 00,
 *         version(1) ttl(1) checksum(2), TLV list (type(2) len(2) incl. header)
 *
 * All multi-byte fields are big-endian. Decoding never reads past the frame.
 */

inline constexpr uint16_t ETHERTYPE_LLDP = 0x88cc;
inline constexpr uint16_t ETHERTYPE_VLAN = 0x8100;

// Multicast destinations the listener joins
inline constexpr uint8_t LLDP_MULTICAST[6] = {0x01, 0x80, 0xc2, 0x00, 0x00, 0x0e};
inline constexpr uint8_t CDP_MULTICAST[6] = {0x01, 0x00, 0x0c, 0xcc, 0xcc, 0xcc};

namespace lldp {
enum TlvType : uint8_t {
  END = 0,
  CHASSIS_ID = 1,
  PORT_ID = 2,
  TTL = 3,
  PORT_DESCRIPTION = 4,
  SYSTEM_NAME = 5,
  SYSTEM_DESCRIPTION = 6,
  SYSTEM_CAPABILITIES = 7,
  MANAGEMENT_ADDRESS = 8,
};

enum ChassisSubtype : uint8_t {
  CHASSIS_MAC = 4,
  CHASSIS_NETWORK_ADDRESS = 5,
};

enum PortSubtype : uint8_t {
  PORT_MAC = 3,
  PORT_NETWORK_ADDRESS = 4,
};

// System capability bits
inline constexpr uint16_t CAP_BRIDGE = 0x0004;
inline constexpr uint16_t CAP_WLAN_AP = 0x0008;
inline constexpr uint16_t CAP_ROUTER = 0x0010;
inline constexpr uint16_t CAP_TELEPHONE = 0x0020;
inline constexpr uint16_t CAP_STATION = 0x0080;
} // namespace lldp

namespace cdp {
enum TlvType : uint16_t {
  DEVICE_ID = 0x0001,
  ADDRESSES = 0x0002,
  PORT_ID = 0x0003,
  CAPABILITIES = 0x0004,
  SOFTWARE_VERSION = 0x0005,
  PLATFORM = 0x0006,
};

inline constexpr uint32_t CAP_ROUTER = 0x01;
inline constexpr uint32_t CAP_TRANS_BRIDGE = 0x02;
inline constexpr uint32_t CAP_SRCROUTE_BRIDGE = 0x04;
inline constexpr uint32_t CAP_SWITCH = 0x08;
inline constexpr uint32_t CAP_HOST = 0x10;
inline constexpr uint32_t CAP_PHONE = 0x80;
} // namespace cdp

/**
 * Big-endian bounds-checked reader
 *
 * Reads past the end set the error flag and return zero/empty; callers check
 * has_error() once after a group of reads.
 */
class FrameReader {
public:
  FrameReader(const uint8_t *data, size_t size);
  explicit FrameReader(std::span<const uint8_t> data);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  std::vector<uint8_t> read_bytes(size_t count);
  std::string read_string(size_t count);
  void skip(size_t count);

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

private:
  bool check_available(size_t bytes);

  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;
};

/**
 * Neighbor information carried by one LLDP or CDP advertisement
 */
struct NeighborAdvertisement {
  std::string protocol;            // "lldp" or "cdp"
  std::string source_mac;          // Ethernet source (the sending port)
  std::string chassis_id;          // Textual chassis id / CDP device id
  std::string chassis_mac;         // Set when the chassis id is a MAC
  std::string port_id;
  std::string port_description;
  std::string system_name;
  std::string system_description;  // LLDP system description / CDP software version
  std::string platform;            // CDP platform
  std::string management_ip;
  std::vector<std::string> capabilities;  // "router", "switch", "access_point", "phone", "host"
  uint32_t ttl{0};

  // Most specific role among the advertised capabilities ("" if none)
  std::string DeviceType() const;
};

// True when the destination is the LLDP or CDP multicast address
bool IsDiscoveryFrame(std::span<const uint8_t> frame);

/**
 * Decode one Ethernet frame carrying LLDP or CDP
 *
 * @return false with `error` set when the frame is neither protocol, is
 *         truncated, or lacks mandatory TLVs (LLDP: chassis id, port id, TTL;
 *         CDP: device id)
 */
bool DecodeDiscoveryFrame(std::span<const uint8_t> frame, NeighborAdvertisement &out,
                          std::string &error);

// Exposed for fuzzing: decode an LLDPDU (TLV list only, no Ethernet header)
bool DecodeLldpdu(std::span<const uint8_t> pdu, NeighborAdvertisement &out,
                  std::string &error);

// Exposed for fuzzing: decode a CDP PDU (from the version byte onward)
bool DecodeCdpPdu(std::span<const uint8_t> pdu, NeighborAdvertisement &out,
                  std::string &error);

} // namespace discovery
} // namespace topowatch
