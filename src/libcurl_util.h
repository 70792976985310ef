#pragma once

#include "fetch_progress.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

void libcurl_ensure_initialized();

// Downloads into a hidden sibling of destination and renames it into place on
// success. Partial files are removed on failure or abort.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       fetch_progress_cb_t const &progress = {});

struct http_request {
  std::string method{ "GET" };
  std::string url;
  std::vector<std::string> headers;  // "Name: value"
  std::optional<std::string> body;
  std::optional<std::filesystem::path> body_file;    // streamed upload
  std::optional<std::filesystem::path> output_file;  // streamed download
  bool follow_redirects{ true };
  fetch_progress_cb_t progress;
};

struct http_response {
  long status{ 0 };
  std::string body;  // empty when output_file was used
  std::map<std::string, std::string> headers;  // lowercase names, last value wins

  std::optional<std::string> header(std::string const &lowercase_name) const;
};

// Transport errors throw; HTTP error statuses are returned to the caller.
http_response libcurl_request(http_request const &request);

}  // namespace bale
