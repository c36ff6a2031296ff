#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace gb {

constexpr std::size_t kFingerprintHexLen = 16;

// Lowercase hex SHA-256 of the input.
std::string sha256_hex(std::string_view bytes);

// One-way submitter fingerprint: first 16 hex digits of sha256(address).
std::string fingerprint(std::string_view remoteAddress);

} // namespace gb
