// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/routeros_api.hpp"
#include "util/logging.hpp"
#include <optional>

namespace topowatch {
namespace discovery {
namespace routeros {

std::string EncodeLength(uint32_t length) {
  std::string out;
  if (length < 0x80) {
    out.push_back(static_cast<char>(length));
  } else if (length < 0x4000) {
    length |= 0x8000;
    out.push_back(static_cast<char>(length >> 8));
    out.push_back(static_cast<char>(length));
  } else if (length < 0x200000) {
    length |= 0xC00000;
    out.push_back(static_cast<char>(length >> 16));
    out.push_back(static_cast<char>(length >> 8));
    out.push_back(static_cast<char>(length));
  } else if (length < 0x10000000) {
    length |= 0xE0000000;
    out.push_back(static_cast<char>(length >> 24));
    out.push_back(static_cast<char>(length >> 16));
    out.push_back(static_cast<char>(length >> 8));
    out.push_back(static_cast<char>(length));
  } else {
    out.push_back(static_cast<char>(0xF0));
    out.push_back(static_cast<char>(length >> 24));
    out.push_back(static_cast<char>(length >> 16));
    out.push_back(static_cast<char>(length >> 8));
    out.push_back(static_cast<char>(length));
  }
  return out;
}

std::string EncodeSentence(const std::vector<std::string> &words) {
  std::string out;
  for (const auto &word : words) {
    out += EncodeLength(static_cast<uint32_t>(word.size()));
    out += word;
  }
  out.push_back('\0');
  return out;
}

namespace {

// Returns NEED_MORE if the prefix is incomplete
DecodeStatus DecodeLength(std::string_view buffer, size_t pos, uint32_t &length,
                          size_t &prefix_len) {
  if (pos >= buffer.size()) {
    return DecodeStatus::NEED_MORE;
  }
  auto byte = [&](size_t i) { return static_cast<uint8_t>(buffer[pos + i]); };
  uint8_t first = byte(0);

  if ((first & 0x80) == 0x00) {
    prefix_len = 1;
  } else if ((first & 0xC0) == 0x80) {
    prefix_len = 2;
  } else if ((first & 0xE0) == 0xC0) {
    prefix_len = 3;
  } else if ((first & 0xF0) == 0xE0) {
    prefix_len = 4;
  } else if (first == 0xF0) {
    prefix_len = 5;
  } else {
    return DecodeStatus::MALFORMED; // control byte
  }
  if (buffer.size() - pos < prefix_len) {
    return DecodeStatus::NEED_MORE;
  }

  switch (prefix_len) {
  case 1:
    length = first;
    break;
  case 2:
    length = (static_cast<uint32_t>(first & 0x3F) << 8) | byte(1);
    break;
  case 3:
    length = (static_cast<uint32_t>(first & 0x1F) << 16) |
             (static_cast<uint32_t>(byte(1)) << 8) | byte(2);
    break;
  case 4:
    length = (static_cast<uint32_t>(first & 0x0F) << 24) |
             (static_cast<uint32_t>(byte(1)) << 16) |
             (static_cast<uint32_t>(byte(2)) << 8) | byte(3);
    break;
  default:
    length = (static_cast<uint32_t>(byte(1)) << 24) |
             (static_cast<uint32_t>(byte(2)) << 16) |
             (static_cast<uint32_t>(byte(3)) << 8) | byte(4);
    break;
  }
  return DecodeStatus::COMPLETE;
}

} // namespace

DecodeStatus DecodeSentence(std::string_view buffer, std::vector<std::string> &words,
                            size_t &consumed) {
  words.clear();
  size_t pos = 0;
  while (true) {
    uint32_t length = 0;
    size_t prefix_len = 0;
    DecodeStatus status = DecodeLength(buffer, pos, length, prefix_len);
    if (status != DecodeStatus::COMPLETE) {
      return status;
    }
    if (length > MAX_WORD_LENGTH) {
      return DecodeStatus::MALFORMED;
    }
    pos += prefix_len;
    if (length == 0) {
      consumed = pos;
      return DecodeStatus::COMPLETE;
    }
    if (buffer.size() - pos < length) {
      return DecodeStatus::NEED_MORE;
    }
    words.emplace_back(buffer.substr(pos, length));
    pos += length;
  }
}

Reply ParseReply(const std::vector<std::string> &words) {
  Reply reply;
  if (words.empty()) {
    return reply;
  }
  reply.type = words.front();
  for (size_t i = 1; i < words.size(); ++i) {
    const std::string &word = words[i];
    if (word.size() < 2 || word[0] != '=') {
      continue; // .tag and API attributes
    }
    auto eq = word.find('=', 1);
    if (eq == std::string::npos) {
      reply.attributes[word.substr(1)] = "";
    } else {
      reply.attributes[word.substr(1, eq - 1)] = word.substr(eq + 1);
    }
  }
  return reply;
}

// ============================================================================
// ApiClient
// ============================================================================

ApiClient::ApiClient(ByteStream &stream, const CancellationToken &token)
    : stream_(stream), token_(token) {}

bool ApiClient::Send(const std::vector<std::string> &words, ProbeError &error) {
  return stream_.Write(EncodeSentence(words), token_, error);
}

bool ApiClient::ReadReply(Reply &reply, ProbeError &error) {
  std::vector<std::string> words;
  while (true) {
    size_t consumed = 0;
    switch (DecodeSentence(buffer_, words, consumed)) {
    case DecodeStatus::COMPLETE:
      buffer_.erase(0, consumed);
      if (words.empty()) {
        continue; // stray terminator
      }
      reply = ParseReply(words);
      return true;
    case DecodeStatus::MALFORMED:
      error = ProbeError{ProbeErrorCode::MALFORMED_RESPONSE, "invalid API length prefix"};
      return false;
    case DecodeStatus::NEED_MORE:
      break;
    }
    if (!stream_.ReadSome(buffer_, token_, error)) {
      return false;
    }
  }
}

bool ApiClient::Login(const Credentials &credentials, ProbeError &error) {
  if (!Send({"/login", "=name=" + credentials.username, "=password=" + credentials.password},
            error)) {
    return false;
  }
  Reply reply;
  if (!ReadReply(reply, error)) {
    return false;
  }
  if (reply.type == "!trap" || reply.type == "!fatal") {
    auto it = reply.attributes.find("message");
    error = ProbeError{ProbeErrorCode::AUTH_FAILURE,
                       it != reply.attributes.end() ? it->second : "login rejected"};
    return false;
  }
  if (reply.type != "!done") {
    error = ProbeError{ProbeErrorCode::MALFORMED_RESPONSE, "unexpected login reply " + reply.type};
    return false;
  }
  if (reply.attributes.count("ret")) {
    error = ProbeError{ProbeErrorCode::AUTH_FAILURE, "challenge login not supported"};
    return false;
  }
  return true;
}

bool ApiClient::Query(const std::string &command, std::vector<Attributes> &rows,
                      ProbeError &error) {
  if (!Send({command}, error)) {
    return false;
  }
  std::optional<ProbeError> trap;
  while (true) {
    Reply reply;
    if (!ReadReply(reply, error)) {
      return false;
    }
    if (reply.type == "!re") {
      rows.push_back(std::move(reply.attributes));
    } else if (reply.type == "!trap") {
      // A !done always follows a !trap
      auto it = reply.attributes.find("message");
      trap = ProbeError{ProbeErrorCode::MALFORMED_RESPONSE,
                        command + ": " + (it != reply.attributes.end() ? it->second : "trap")};
    } else if (reply.type == "!fatal") {
      error = ProbeError{ProbeErrorCode::UNREACHABLE, "router closed the API session"};
      return false;
    } else if (reply.type == "!done") {
      break;
    } else {
      LOG_DISC_TRACE("ignoring API reply {}", reply.type);
    }
  }
  if (trap) {
    error = *trap;
    return false;
  }
  return true;
}

} // namespace routeros
} // namespace discovery
} // namespace topowatch
