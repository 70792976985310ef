#include "error.h"

namespace bale {

std::string error_describe(std::exception const &e) {
  std::string result{ e.what() };
  try {
    std::rethrow_if_nested(e);
  } catch (std::exception const &inner) { result += ": " + error_describe(inner); }
  return result;
}

void error_rethrow_with_context(std::string const &context) {
  std::throw_with_nested(std::runtime_error{ context });
}

}  // namespace bale
