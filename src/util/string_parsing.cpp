// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace topowatch {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int64_t>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string Trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::string ToLower(std::string_view str) {
  std::string out(str);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> SplitString(std::string_view str, char delimiter) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string_view::npos) {
      next = str.size();
    }
    std::string piece = Trim(str.substr(pos, next - pos));
    if (!piece.empty()) {
      out.push_back(std::move(piece));
    }
    pos = next + 1;
  }
  return out;
}

} // namespace util
} // namespace topowatch
