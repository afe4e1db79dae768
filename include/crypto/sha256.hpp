#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace hotpush {

// Lowercase hex SHA-256 digests. An empty string means the digest failed.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view text);
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

} // namespace hotpush
