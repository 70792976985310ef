#include "version.h"

#include "doctest/doctest.h"

namespace {

using bale::version_is_newer;

TEST_CASE("version_string is set") { CHECK_FALSE(bale::version_string().empty()); }

TEST_CASE("version_is_newer: numeric ordering") {
  CHECK(version_is_newer("1.0.1", "1.0.0"));
  CHECK(version_is_newer("1.1.0", "1.0.0"));
  CHECK(version_is_newer("2.0.0", "1.9.9"));
  CHECK(version_is_newer("1.0.0", "0.99.99"));
}

TEST_CASE("version_is_newer: equal versions") {
  CHECK_FALSE(version_is_newer("1.2.3", "1.2.3"));
  CHECK_FALSE(version_is_newer(" 1.2.3\n", "1.2.3"));
}

TEST_CASE("version_is_newer: pre-release ordering") {
  CHECK(version_is_newer("1.0.0-beta", "1.0.0-alpha"));
  CHECK(version_is_newer("1.0.0", "1.0.0-alpha"));
  CHECK_FALSE(version_is_newer("2.0.0-rc1", "2.0.0"));
}

TEST_CASE("version_is_newer: unparseable input") {
  CHECK(version_is_newer("1.0.0", "not-a-version"));
  CHECK_FALSE(version_is_newer("latest", "1.0.0"));
}

}  // namespace
