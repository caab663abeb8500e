// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/remote_query_probe.hpp"
#include "discovery/cli_parser.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

namespace topowatch {
namespace discovery {

// ============================================================================
// CliSession
// ============================================================================

namespace {

constexpr uint8_t IAC = 255;
constexpr uint8_t DONT = 254;
constexpr uint8_t DO = 253;
constexpr uint8_t WONT = 252;
constexpr uint8_t WILL = 251;
constexpr uint8_t SB = 250;
constexpr uint8_t SE = 240;

const char *const kRejections[] = {
    "% login invalid", "% authentication failed", "authentication failed",
    "login incorrect", "access denied", "% bad passwords",
};

std::string LastLine(const std::string &text) {
  auto pos = text.find_last_of('\n');
  return pos == std::string::npos ? text : text.substr(pos + 1);
}

} // namespace

CliSession::CliSession(ByteStream &stream, const CancellationToken &token)
    : stream_(stream), token_(token) {}

std::string CliSession::StripTelnetCommands(std::string &raw, std::string &reply) {
  std::string text;
  size_t i = 0;
  while (i < raw.size()) {
    uint8_t c = static_cast<uint8_t>(raw[i]);
    if (c != IAC) {
      if (c != '\0') {
        text.push_back(raw[i]);
      }
      ++i;
      continue;
    }
    if (i + 1 >= raw.size()) {
      break; // incomplete
    }
    uint8_t cmd = static_cast<uint8_t>(raw[i + 1]);
    if (cmd == IAC) {
      text.push_back(raw[i]);
      i += 2;
    } else if (cmd == DO || cmd == DONT || cmd == WILL || cmd == WONT) {
      if (i + 2 >= raw.size()) {
        break;
      }
      char option = raw[i + 2];
      if (cmd == DO) {
        reply += {static_cast<char>(IAC), static_cast<char>(WONT), option};
      } else if (cmd == WILL) {
        reply += {static_cast<char>(IAC), static_cast<char>(DONT), option};
      }
      i += 3;
    } else if (cmd == SB) {
      size_t end = i + 2;
      while (end + 1 < raw.size() &&
             !(static_cast<uint8_t>(raw[end]) == IAC && static_cast<uint8_t>(raw[end + 1]) == SE)) {
        ++end;
      }
      if (end + 1 >= raw.size()) {
        break;
      }
      i = end + 2;
    } else {
      i += 2;
    }
  }
  raw.erase(0, i);
  return text;
}

bool CliSession::ReadUntilPrompt(std::string &text, Wait &what, ProbeError &error) {
  while (true) {
    if (!logged_in_) {
      const std::string lower = util::ToLower(text);
      for (const char *rejection : kRejections) {
        if (lower.find(rejection) != std::string::npos) {
          what = Wait::AUTH_REJECTED;
          return true;
        }
      }
    }

    const std::string tail = util::ToLower(util::Trim(LastLine(text)));
    if (!logged_in_ && (tail.ends_with("username:") || tail.ends_with("login:"))) {
      what = Wait::USERNAME;
      return true;
    }
    if (!logged_in_ && tail.ends_with("password:")) {
      what = Wait::PASSWORD;
      return true;
    }
    std::string host = HostnameFromPrompt(LastLine(text));
    if (!host.empty() && (prompt_hostname_.empty() || host == prompt_hostname_)) {
      prompt_hostname_ = host;
      what = Wait::PROMPT;
      return true;
    }

    if (text.size() > MAX_OUTPUT_SIZE) {
      error = ProbeError{ProbeErrorCode::MALFORMED_RESPONSE, "CLI output exceeds limit"};
      return false;
    }

    if (!stream_.ReadSome(raw_, token_, error)) {
      return false;
    }
    std::string reply;
    text += StripTelnetCommands(raw_, reply);
    if (!reply.empty() && !stream_.Write(reply, token_, error)) {
      return false;
    }
  }
}

bool CliSession::Login(const std::optional<Credentials> &credentials, ProbeError &error) {
  std::string text;
  Wait what = Wait::PROMPT;
  if (!ReadUntilPrompt(text, what, error)) {
    return false;
  }

  // Username, password, then the exec prompt
  for (int step = 0; step < 3; ++step) {
    switch (what) {
    case Wait::PROMPT:
      logged_in_ = true;
      return true;
    case Wait::AUTH_REJECTED:
      error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "login rejected"};
      return false;
    case Wait::USERNAME:
    case Wait::PASSWORD: {
      if (!credentials || credentials->empty()) {
        error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "device requires credentials"};
        return false;
      }
      if (step > 0 && what == Wait::USERNAME) {
        error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "login rejected"};
        return false;
      }
      const std::string &value =
          what == Wait::USERNAME ? credentials->username : credentials->password;
      if (!stream_.Write(value + "\r\n", token_, error)) {
        return false;
      }
      text.clear();
      if (!ReadUntilPrompt(text, what, error)) {
        return false;
      }
      break;
    }
    }
  }

  error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "login did not reach a prompt"};
  return false;
}

bool CliSession::Execute(const std::string &command, std::string &output, ProbeError &error) {
  if (!stream_.Write(command + "\r\n", token_, error)) {
    return false;
  }
  std::string text;
  Wait what = Wait::PROMPT;
  if (!ReadUntilPrompt(text, what, error)) {
    return false;
  }

  // Drop the echoed command and the trailing prompt
  std::string cleaned;
  for (char c : text) {
    if (c != '\r') {
      cleaned.push_back(c);
    }
  }
  auto first_nl = cleaned.find('\n');
  if (first_nl != std::string::npos && cleaned.substr(0, first_nl).find(command) != std::string::npos) {
    cleaned.erase(0, first_nl + 1);
  }
  auto last_nl = cleaned.find_last_of('\n');
  cleaned.erase(last_nl == std::string::npos ? 0 : last_nl + 1);
  output = std::move(cleaned);
  return true;
}

// ============================================================================
// RemoteQueryProbe
// ============================================================================

RemoteQueryProbe::RemoteQueryProbe(StreamFactory factory)
    : RemoteQueryProbe(std::move(factory), Options{}) {}

RemoteQueryProbe::RemoteQueryProbe(StreamFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {}

ProbeResult RemoteQueryProbe::Run(const Target &target, std::chrono::milliseconds timeout,
                                  const CancellationToken &token) {
  if (target.address.empty()) {
    return ProbeResult::Failure(ProbeErrorCode::INTERNAL,
                                "target " + target.id + " has no address");
  }

  CancellationToken attempt = token.Child(CancellationToken::Clock::now() + timeout);
  const uint16_t port = target.port != 0 ? target.port : options_.default_port;

  ProbeResult result;
  ProbeError error;
  auto stream = factory_();
  if (!stream->Connect(target.address, port, attempt, error)) {
    result.error = error;
    return result;
  }

  CliSession session(*stream, attempt);
  std::string version_text;
  if (!session.Login(target.credentials, error) ||
      !session.Execute("terminal length 0", version_text, error) ||
      !session.Execute("show version", version_text, error)) {
    stream->Close();
    result.error = error;
    return result;
  }

  CliDeviceInfo info = ParseShowVersion(version_text);
  if (info.hostname.empty()) {
    info.hostname = session.prompt_hostname();
  }

  // Identity of the queried device, repeated on every link it reports
  FieldMap self;
  self[fields::IP] = target.address;
  if (!info.hostname.empty())
    self[fields::HOSTNAME] = info.hostname;
  if (!info.base_mac.empty())
    self[fields::MAC] = info.base_mac;
  if (!info.serial.empty())
    self[fields::VENDOR_ID] = "serial:" + info.serial;

  const int64_t now = util::GetTime();
  DiscoveryRecord device;
  device.source_probe = id();
  device.probe_kind = kind();
  device.target = target.id;
  device.timestamp = now;
  device.confidence_hint = options_.device_confidence;
  device.payload = self;
  if (!info.model.empty())
    device.payload[fields::MODEL] = info.model;
  if (!info.os_version.empty())
    device.payload[fields::OS_VERSION] = info.os_version;
  if (!info.vendor.empty())
    device.payload[fields::VENDOR] = info.vendor;
  if (!target.network.empty())
    device.payload[fields::NETWORK] = target.network;
  if (!target.location.empty())
    device.payload[fields::LOCATION] = target.location;
  result.observations.push_back(std::move(device));

  if (info.empty()) {
    LOG_DISC_DEBUG("{}: unrecognised show version output", target.id);
  }

  std::string cdp_text;
  if (!session.Execute("show cdp neighbors detail", cdp_text, error)) {
    stream->Close();
    result.error = error;
    return result;
  }
  stream->Close();

  for (const auto &neighbor : ParseCdpNeighborsDetail(cdp_text)) {
    DiscoveryRecord link;
    link.source_probe = id();
    link.probe_kind = kind();
    link.target = target.id;
    link.timestamp = now;
    link.confidence_hint = options_.neighbor_confidence;
    link.link_type = "physical";
    link.payload = self;
    if (!neighbor.local_interface.empty())
      link.payload[fields::PORT] = neighbor.local_interface;

    FieldMap peer;
    peer[fields::HOSTNAME] = neighbor.device_id;
    if (!neighbor.ip.empty())
      peer[fields::IP] = neighbor.ip;
    if (!neighbor.platform.empty())
      peer[fields::MODEL] = neighbor.platform;
    if (auto type = DeviceTypeFromCapabilities(neighbor.capabilities); !type.empty())
      peer[fields::DEVICE_TYPE] = type;
    if (!neighbor.remote_port.empty())
      peer[fields::PORT] = neighbor.remote_port;
    if (!neighbor.version.empty())
      peer[fields::OS_VERSION] = neighbor.version;
    if (auto vendor = InferVendor(neighbor.platform + " " + neighbor.version); !vendor.empty())
      peer[fields::VENDOR] = vendor;
    link.peer = std::move(peer);
    result.observations.push_back(std::move(link));
  }

  LOG_DISC_DEBUG("{}: cli query returned {} observation(s)", target.id,
                 result.observations.size());
  return result;
}

} // namespace discovery
} // namespace topowatch
