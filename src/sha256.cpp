#include "sha256.h"

#include "error.h"
#include "mbedtls/sha256.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace bale {
namespace {

using sha256_ctx_ptr = std::unique_ptr<mbedtls_sha256_context, decltype(&mbedtls_sha256_free)>;

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  sha256_ctx_ptr ctx_scope{ &ctx, &mbedtls_sha256_free };

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) {
      if (mbedtls_sha256_update(&ctx, buffer.data(), read_bytes)) {
        throw std::runtime_error("sha256: mbedtls_sha256_update failed");
      }
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  sha256_t digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }

  return digest;
}

sha256_t sha256_bytes(void const *data, std::size_t size) {
  sha256_t digest{};
  if (mbedtls_sha256(static_cast<unsigned char const *>(data), size, digest.data(), 0)) {
    throw std::runtime_error("sha256_bytes: mbedtls_sha256 failed");
  }
  return digest;
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

void sha256_verify(std::string const &expected_hex, sha256_t const &actual_hash) {
  auto const actual_hex{ sha256_hex(actual_hash) };

  std::string expected_lower{ expected_hex };
  std::ranges::transform(expected_lower, expected_lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (expected_lower.size() != 64 ||
      std::ranges::any_of(expected_lower, [](char c) { return util_hex_char_to_int(c) < 0; })) {
    throw integrity_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                          actual_hex + " (malformed expected digest)");
  }

  if (expected_lower != actual_hex) {
    throw integrity_error("SHA256 mismatch: expected " + expected_hex + " but got " +
                          actual_hex);
  }
}

}  // namespace bale
