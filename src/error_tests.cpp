#include "error.h"

#include "doctest/doctest.h"

#include <stdexcept>
#include <string>

namespace {

void fail_with_chain() {
  try {
    try {
      throw bale::integrity_error{ "SHA256 mismatch: expected aa but got bb" };
    } catch (...) { bale::error_rethrow_with_context("https://example.com/a.bin"); }
  } catch (...) { bale::error_rethrow_with_context("unable to add component \"web\""); }
}

}  // namespace

TEST_CASE("error_describe flattens nested exceptions") {
  try {
    fail_with_chain();
    FAIL("expected exception");
  } catch (std::exception const &e) {
    CHECK(bale::error_describe(e) ==
          "unable to add component \"web\": https://example.com/a.bin: "
          "SHA256 mismatch: expected aa but got bb");
  }
}

TEST_CASE("error_describe of a flat exception is its message") {
  CHECK(bale::error_describe(std::runtime_error{ "plain" }) == "plain");
}

TEST_CASE("error_has_cause finds the root type anywhere in the chain") {
  try {
    fail_with_chain();
    FAIL("expected exception");
  } catch (std::exception const &e) {
    CHECK(bale::error_has_cause<bale::integrity_error>(e));
    CHECK_FALSE(bale::error_has_cause<bale::config_error>(e));
  }
}

TEST_CASE("config_error and integrity_error are runtime errors") {
  CHECK_THROWS_AS(throw bale::config_error{ "bad" }, std::runtime_error);
  CHECK_THROWS_WITH(throw bale::integrity_error{ "digest" }, "digest");
}
