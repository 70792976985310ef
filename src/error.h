#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace bale {

// Invalid package definitions, illegal imports, malformed references.
struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Checksum and digest mismatches.
struct integrity_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Flattens a nested exception chain to "outer: inner: root".
std::string error_describe(std::exception const &e);

// Must be called from inside a catch block; throws a std::runtime_error carrying
// `context` with the in-flight exception nested beneath it.
[[noreturn]] void error_rethrow_with_context(std::string const &context);

template <typename T>
bool error_has_cause(std::exception const &e) {
  if (dynamic_cast<T const *>(&e)) { return true; }
  try {
    std::rethrow_if_nested(e);
  } catch (std::exception const &inner) { return error_has_cause<T>(inner); }
  return false;
}

}  // namespace bale
