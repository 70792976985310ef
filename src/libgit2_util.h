#pragma once

#include "util.h"

#include <string>

namespace bale {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// Message of the most recent libgit2 error, prefixed with `context`.
std::string libgit2_error_message(std::string const &context);

}  // namespace bale
