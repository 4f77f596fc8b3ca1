#pragma once

#include <cstdint>
#include <string>

namespace verirag::hash {

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(const std::string& content);

// First eight bytes of SHA-256(key), big-endian. Stable across processes,
// unlike std::hash.
std::uint64_t stable_id(const std::string& key);

}  // namespace verirag::hash
