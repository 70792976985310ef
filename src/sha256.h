#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace bale {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256_bytes(void const *data, std::size_t size);

std::string sha256_hex(sha256_t const &digest);
inline std::string sha256_hex(std::string_view data) {
  return sha256_hex(sha256_bytes(data.data(), data.size()));
}

// Verify SHA256 hash matches expected hex string (case-insensitive)
// Throws integrity_error with detailed message if mismatch
void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash);

}  // namespace bale
