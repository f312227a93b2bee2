#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace katafetch {

/// Lowercase hex SHA-256 of a file's contents, or nullopt if it cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& path);

/// Lowercase hex SHA-256 of an in-memory buffer.
std::string sha256_hex(const std::string& data);

}  // namespace katafetch
