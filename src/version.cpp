#include "version.h"

#include "util.h"

#include "semver.hpp"

#include <string_view>

#ifndef BALE_VERSION_STR
#error "BALE_VERSION_STR must be defined by the build system"
#endif

namespace bale {

std::string_view version_string() { return BALE_VERSION_STR; }

bool version_is_newer(std::string_view candidate, std::string_view current) {
  candidate = util_trim(candidate);
  current = util_trim(current);

  semver::version<> cand;
  if (!semver::parse(candidate, cand)) { return false; }

  semver::version<> cur;
  if (!semver::parse(current, cur)) { return true; }

  return cand > cur;
}

}  // namespace bale
