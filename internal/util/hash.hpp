#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace stateshift::util {

// Lowercase hex SHA-256 digest.
std::string Sha256Hex(std::string_view data);

// Throws std::runtime_error if the file cannot be read.
std::string Sha256File(const std::filesystem::path& path);

std::string ReadFile(const std::filesystem::path& path);

} // namespace stateshift::util
