#pragma once

#include "fetch_progress.h"
#include "uri.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace bale {

struct fetch_request_http {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

struct fetch_request_https {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
};

// Local file fetch request with file_root for relative sources
struct fetch_request_file {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
  std::optional<std::filesystem::path> file_root;
};

// Git fetch request with ref (committish: tag, branch, or SHA). An empty ref
// checks out the remote's default branch with full history.
// Note: Submodules are not yet supported
struct fetch_request_git {
  std::string source;
  std::filesystem::path destination;
  fetch_progress_cb_t progress{};
  std::string ref;
};

using fetch_request = std::variant<fetch_request_http,
                                   fetch_request_https,
                                   fetch_request_file,
                                   fetch_request_git>;

struct fetch_result {
  uri_scheme scheme;
  std::filesystem::path resolved_source;
  std::filesystem::path resolved_destination;
};

// Builds the request variant matching the source's scheme. Git sources carry
// their ref as "url@ref". Throws config_error for unsupported schemes.
fetch_request fetch_request_for(std::string const &source,
                                std::filesystem::path const &destination,
                                std::optional<std::filesystem::path> const &file_root,
                                fetch_progress_cb_t progress = {});

fetch_result fetch_single(fetch_request const &request);

}  // namespace bale
