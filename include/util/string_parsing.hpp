// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values, inventory fields and probe output
 - Returns std::nullopt on any parsing error (never throws)
 - Every numeric parser requires the whole input to be consumed
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topowatch {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Strip leading and trailing ASCII whitespace
 */
std::string Trim(std::string_view str);

/**
 * Lower-case ASCII copy
 */
std::string ToLower(std::string_view str);

/**
 * Split on a delimiter; empty pieces are dropped, pieces are trimmed
 *
 * Example: SplitString("network, graph,,app", ',') -> {"network","graph","app"}
 */
std::vector<std::string> SplitString(std::string_view str, char delimiter);

} // namespace util
} // namespace topowatch
