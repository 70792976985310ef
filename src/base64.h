#pragma once

#include <string>
#include <string_view>

namespace bale {

std::string base64_encode(std::string_view plain);

// Throws std::runtime_error naming `what` on malformed input.
std::string base64_decode(std::string_view encoded, char const *what = "base64_decode");

}  // namespace bale
