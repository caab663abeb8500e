// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace topowatch {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp.<random> suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. rename() over the original file
 *
 * Readers see either the old or the new document, never a torn write.
 */

/**
 * Write data to file atomically with the given permissions
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data,
                       int mode = 0644);

/**
 * Write string to file atomically with the given permissions
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file is missing, unreadable or larger than 100MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.topowatch, or ./.topowatch without HOME
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace topowatch
