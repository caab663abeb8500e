// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/byte_stream.hpp"
#include "discovery/probe.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace topowatch {
namespace discovery {
namespace routeros {

/*
 RouterOS API wire format

 A sentence is a sequence of words terminated by a zero-length word. Each
 word is prefixed with its length:

   0x00-0x7F         1 byte
   0x80-0x3FFF       2 bytes, high bits 10
   0x4000-0x1FFFFF   3 bytes, high bits 110
   0x200000-0xFFFFFFF 4 bytes, high bits 1110
   larger            0xF0 followed by 4 bytes
   0xF8-0xFF         reserved control bytes (rejected)

 Replies begin with !re (one row), !done, !trap (error) or !fatal (session
 closed by the router). Attribute words have the form =key=value.
*/

inline constexpr uint16_t DEFAULT_PORT = 8728;
inline constexpr uint32_t MAX_WORD_LENGTH = 1024 * 1024;

std::string EncodeLength(uint32_t length);

std::string EncodeSentence(const std::vector<std::string> &words);

enum class DecodeStatus { COMPLETE, NEED_MORE, MALFORMED };

// Decode one sentence from the front of `buffer`. On COMPLETE, `consumed`
// is the number of bytes it occupied.
DecodeStatus DecodeSentence(std::string_view buffer, std::vector<std::string> &words,
                            size_t &consumed);

using Attributes = std::map<std::string, std::string>;

struct Reply {
  std::string type;       // "!re", "!done", "!trap", "!fatal"
  Attributes attributes;  // From =key=value words
};

Reply ParseReply(const std::vector<std::string> &words);

/**
 * ApiClient - synchronous RouterOS API session over a ByteStream
 */
class ApiClient {
public:
  ApiClient(ByteStream &stream, const CancellationToken &token);

  // Plain-text login (RouterOS 6.43+). A !trap is AUTH_FAILURE.
  bool Login(const Credentials &credentials, ProbeError &error);

  // Run a print command and collect the !re rows
  bool Query(const std::string &command, std::vector<Attributes> &rows, ProbeError &error);

private:
  bool Send(const std::vector<std::string> &words, ProbeError &error);
  bool ReadReply(Reply &reply, ProbeError &error);

  ByteStream &stream_;
  CancellationToken token_;
  std::string buffer_;
};

} // namespace routeros

/**
 * VendorApiProbe ("routeros")
 *
 * Active probe for MikroTik routers: reads the identity, resources and
 * interfaces of the router and one link observation per /ip/neighbor entry.
 */
class VendorApiProbe : public Probe {
public:
  struct Options {
    double device_confidence{0.95};
    double neighbor_confidence{0.7};
  };

  explicit VendorApiProbe(StreamFactory factory);
  VendorApiProbe(StreamFactory factory, Options options);

  std::string id() const override { return "routeros"; }
  ProbeKind kind() const override { return ProbeKind::VENDOR_API; }

  ProbeResult Run(const Target &target, std::chrono::milliseconds timeout,
                  const CancellationToken &token) override;

private:
  StreamFactory factory_;
  Options options_;
};

} // namespace discovery
} // namespace topowatch
