#include "base64.h"

#include "mbedtls/base64.h"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace bale {

std::string base64_encode(std::string_view plain) {
  std::size_t len{ 0 };
  auto const *src{ reinterpret_cast<unsigned char const *>(plain.data()) };
  static_cast<void>(mbedtls_base64_encode(nullptr, 0, &len, src, plain.size()));  // sizes only

  std::vector<unsigned char> out(len);
  if (int const rc{ mbedtls_base64_encode(out.data(), out.size(), &len, src, plain.size()) };
      rc != 0) {
    throw std::runtime_error("base64_encode: mbedtls_base64_encode failed");
  }
  return std::string{ out.begin(), out.begin() + static_cast<std::ptrdiff_t>(len) };
}

std::string base64_decode(std::string_view encoded, char const *what) {
  std::size_t len{ 0 };
  auto const *src{ reinterpret_cast<unsigned char const *>(encoded.data()) };
  if (int const rc{ mbedtls_base64_decode(nullptr, 0, &len, src, encoded.size()) };
      rc != 0 && rc != MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL) {
    throw std::runtime_error(std::string{ what } + ": invalid base64");
  }

  std::vector<unsigned char> out(len);
  if (int const rc{ mbedtls_base64_decode(out.data(), out.size(), &len, src, encoded.size()) };
      rc != 0) {
    throw std::runtime_error(std::string{ what } + ": invalid base64");
  }
  return std::string{ out.begin(), out.begin() + static_cast<std::ptrdiff_t>(len) };
}

}  // namespace bale
