#pragma once

#include <string_view>

namespace bale {

// Version of this build, set by the build system.
std::string_view version_string();

// Returns true if `candidate` is a strictly newer semver than `current`.
// Returns true if `current` fails to parse (treat corrupt/missing as "nothing").
// Returns false if `candidate` fails to parse.
// Returns false if equal.
bool version_is_newer(std::string_view candidate, std::string_view current);

}  // namespace bale
