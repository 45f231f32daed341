// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace torlink {
namespace util {

/**
 * Write a file so that readers see either the old or the new contents
 *
 * Writes to "<path>.tmp.<rand>", fsyncs the file and its directory, then
 * renames over `path`. Parent directories are created as needed.
 * Returns false on any failure (the temp file is removed).
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read a whole file
 *
 * Returns std::nullopt if the file cannot be opened or is larger than
 * `max_size` bytes. Tor cookie files and JSON configs both go through here.
 */
std::optional<std::string>
read_file_string(const std::filesystem::path &path,
                 size_t max_size = 16 * 1024 * 1024);

// Create directory (recursive). True if it exists afterwards.
bool ensure_directory(const std::filesystem::path &dir);

// ~/.torlink (or ./.torlink when HOME is unset)
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace torlink
