#include "uri.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bale {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool iends_with(std::string_view value, std::string_view suffix) {
  if (suffix.size() > value.size()) { return false; }
  return std::ranges::equal(suffix,
                            value | std::views::drop(value.size() - suffix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool iequals(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, to_lower, to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

// "repo.git@ref" -> "repo.git"; only an '@' after the last '/' starts a ref.
std::string_view strip_git_ref(std::string_view uri) {
  auto const slash{ uri.rfind('/') };
  auto const at{ uri.rfind('@') };
  if (at == std::string_view::npos || slash == std::string_view::npos || at < slash) {
    return uri;
  }
  return uri.substr(0, at);
}

bool looks_like_scp_uri(std::string_view uri) {
  if (uri.find("://") != std::string_view::npos) { return false; }

  auto const colon{ uri.find(':') };
  if (colon == std::string_view::npos || colon + 1 >= uri.size()) { return false; }

  auto const user_host{ uri.substr(0, colon) };
  auto const at{ user_host.find('@') };

  return at != std::string_view::npos && at > 0;
}

bool is_drive_letter_path(std::string_view path) {
  if (path.size() < 2) { return false; }

  if (std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') { return true; }
  if (path.size() < 3) { return false; }

  if ((path[0] == '/' || path[0] == '\\') &&
      std::isalpha(static_cast<unsigned char>(path[1])) && path[2] == ':') {
    return true;
  }

  return false;
}

std::string strip_file_scheme(std::string_view uri) {
  std::string cand{ uri.substr(7) };

  if (!cand.empty() && cand[0] == '/' && cand.size() >= 3 &&
      std::isalpha(static_cast<unsigned char>(cand[1])) && cand[2] == ':') {
    cand.erase(cand.begin());
    return cand;
  }

  if (is_drive_letter_path(cand)) { return cand; }

  if (!cand.empty() && cand[0] == '/' && cand.size() > 1 && cand[1] == '/') {
    return cand;
  }

  auto const slash{ cand.find('/') };
  if (slash == std::string::npos) { return cand; }

  std::string_view const host{ std::string_view{ cand }.substr(0, slash) };
  std::string_view const tail{ std::string_view{ cand }.substr(slash) };

  if (host.empty() || iequals(host, "localhost")) { return std::string{ tail }; }
  if (host.find(':') != std::string_view::npos) { return cand; }

  return std::string{ "//" }.append(host).append(tail);
}

std::filesystem::path base_directory(std::optional<std::filesystem::path> const &root) {
  if (root && !root->empty()) { return std::filesystem::absolute(*root); }
  return std::filesystem::current_path();
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ util_trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  auto const path_segment{ strip_git_ref(strip_query_and_fragment(canonical)) };
  if (iends_with(path_segment, ".git")) {
    return uri_info{ uri_scheme::GIT, std::move(canonical) };
  }
  if (istarts_with(canonical, "git://") || istarts_with(canonical, "git+ssh://")) {
    return uri_info{ uri_scheme::GIT, std::move(canonical) };
  }
  if (istarts_with(canonical, "oci://")) {
    return uri_info{ uri_scheme::OCI, std::move(canonical) };
  }
  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }
  if (istarts_with(canonical, "scp://") || istarts_with(canonical, "ssh://")) {
    return uri_info{ uri_scheme::SSH, std::move(canonical) };
  }
  if (looks_like_scp_uri(canonical)) {
    return uri_info{ uri_scheme::SSH, std::move(canonical) };
  }

  std::string local_source{};

  if (istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else {
    if (canonical.find("://") != std::string_view::npos) {
      return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
    }
    local_source = canonical;
  }

  auto const scheme{ std::filesystem::path{ local_source }.is_absolute()
                         ? uri_scheme::LOCAL_FILE_ABSOLUTE
                         : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, std::move(local_source) };
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const trimmed{ util_trim(local_file) };
  if (trimmed.empty()) { throw std::invalid_argument("resolve_local_uri: empty value"); }

  auto const info{ uri_classify(trimmed) };
  auto const scheme{ info.scheme };
  if (scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("resolve_local_uri: value is not a local file");
  }

  auto const &raw_path{ info.canonical };
  if (raw_path.empty()) {
    throw std::invalid_argument("resolve_local_uri: resolved path is empty");
  }

  std::filesystem::path resolved{ raw_path };
  if (scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    auto const base{ base_directory(anchor) };
    resolved = std::filesystem::absolute(base / resolved);
  }

  return resolved.lexically_normal();
}

bool uri_is_remote(uri_scheme scheme) {
  switch (scheme) {
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::OCI:
    case uri_scheme::GIT:
    case uri_scheme::SSH: return true;
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
    case uri_scheme::UNKNOWN: return false;
  }
  return false;
}

std::string uri_extract_filename(std::string_view uri) {
  auto const path{ strip_query_and_fragment(util_trim(uri)) };
  auto const scheme_end{ path.find("://") };
  auto const body{ scheme_end == std::string_view::npos ? path
                                                         : path.substr(scheme_end + 3) };
  auto const slash{ body.rfind('/') };
  if (slash == std::string_view::npos) {
    // "host" alone has no filename; a bare relative name does
    return scheme_end == std::string_view::npos ? std::string{ body } : std::string{};
  }
  return std::string{ body.substr(slash + 1) };
}

}  // namespace bale
