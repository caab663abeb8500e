// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/byte_stream.hpp"
#include "discovery/probe.hpp"
#include <string>
#include <vector>

namespace topowatch {
namespace discovery {

/**
 * CliSession - line-mode telnet session against a network device CLI
 *
 * Handles option negotiation (every DO/WILL is refused), the
 * Username/Password exchange and prompt detection. Every call is bounded by
 * the token it was constructed with.
 */
class CliSession {
public:
  CliSession(ByteStream &stream, const CancellationToken &token);

  // Complete the login dialogue. AUTH_FAILURE if rejected or credentials are
  // required but absent.
  bool Login(const std::optional<Credentials> &credentials, ProbeError &error);

  // Run one command and return its output without echo and trailing prompt
  bool Execute(const std::string &command, std::string &output, ProbeError &error);

  // Hostname taken from the last prompt seen ("" before login)
  const std::string &prompt_hostname() const { return prompt_hostname_; }

  /**
   * Remove telnet command sequences from `raw` and return the terminal text.
   * Refusals for DO/WILL requests are appended to `reply`. An incomplete
   * sequence at the end is left in `raw` for the next read.
   */
  static std::string StripTelnetCommands(std::string &raw, std::string &reply);

  static constexpr size_t MAX_OUTPUT_SIZE = 1024 * 1024;

private:
  enum class Wait { PROMPT, USERNAME, PASSWORD, AUTH_REJECTED };

  // Read until a prompt, login prompt or rejection message ends the buffer
  bool ReadUntilPrompt(std::string &text, Wait &what, ProbeError &error);

  ByteStream &stream_;
  CancellationToken token_;
  std::string raw_;
  std::string prompt_hostname_;
  bool logged_in_{false};
};

/**
 * RemoteQueryProbe ("cli")
 *
 * Active probe: logs into Target::address (telnet, port 23 unless
 * Target::port is set), runs `terminal length 0`, `show version` and
 * `show cdp neighbors detail`, and reports the device itself plus one link
 * observation per CDP neighbor.
 */
class RemoteQueryProbe : public Probe {
public:
  struct Options {
    uint16_t default_port{23};
    double device_confidence{0.9};
    double neighbor_confidence{0.8};
  };

  explicit RemoteQueryProbe(StreamFactory factory);
  RemoteQueryProbe(StreamFactory factory, Options options);

  std::string id() const override { return "cli"; }
  ProbeKind kind() const override { return ProbeKind::REMOTE_QUERY; }

  ProbeResult Run(const Target &target, std::chrono::milliseconds timeout,
                  const CancellationToken &token) override;

private:
  StreamFactory factory_;
  Options options_;
};

} // namespace discovery
} // namespace topowatch
