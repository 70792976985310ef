#include "libgit2_util.h"

#include <git2.h>

namespace bale {

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

std::string libgit2_error_message(std::string const &context) {
  std::string msg{ context };
  if (git_error const *err{ git_error_last() }; err && err->message) {
    msg += ": ";
    msg += err->message;
  }
  return msg;
}

}  // namespace bale
