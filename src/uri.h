#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace bale {

enum class uri_scheme {
  HTTP,
  HTTPS,
  OCI,
  GIT,
  SSH,
  LOCAL_FILE_ABSOLUTE,
  LOCAL_FILE_RELATIVE,
  UNKNOWN
};

struct uri_info {
  uri_scheme scheme;
  std::string canonical;
};

// Git sources may carry a trailing "@ref" after the repository path
// (https://host/org/repo.git@v1.2.0); it does not affect classification.
uri_info uri_classify(std::string_view value);

bool uri_is_remote(uri_scheme scheme);

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor);

// Extract the filename component from a URI (everything after the last '/' before
// any query or fragment). Returns empty string if no filename component exists.
std::string uri_extract_filename(std::string_view uri);

}  // namespace bale
