#include "image_ref.h"

#include "error.h"
#include "util.h"

#include <algorithm>
#include <cctype>

namespace bale {
namespace {

bool looks_like_registry(std::string_view component) {
  return component.find_first_of(".:") != std::string_view::npos ||
         component == "localhost";
}

bool valid_repository(std::string_view repo) {
  if (repo.empty() || repo.front() == '/' || repo.back() == '/') { return false; }
  return std::ranges::all_of(repo, [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' ||
           c == '-' || c == '/';
  });
}

bool valid_tag(std::string_view tag) {
  if (tag.empty() || tag.size() > 128 || tag.front() == '.' || tag.front() == '-') {
    return false;
  }
  return std::ranges::all_of(tag, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
  });
}

bool valid_digest(std::string_view digest) {
  constexpr std::string_view prefix{ "sha256:" };
  if (!digest.starts_with(prefix) || digest.size() != prefix.size() + 64) { return false; }
  return std::ranges::all_of(digest.substr(prefix.size()),
                             [](char c) { return util_hex_char_to_int(c) >= 0; });
}

// Splits "host/path:tag@digest" into its parts without applying defaults.
image_ref split_reference(std::string_view value, std::string_view func) {
  std::string_view rest{ util_trim(value) };
  if (rest.empty()) { throw config_error(std::string{ func } + ": empty reference"); }

  image_ref ref;
  if (auto const at{ rest.find('@') }; at != std::string_view::npos) {
    ref.digest = std::string{ rest.substr(at + 1) };
    rest = rest.substr(0, at);
    if (!valid_digest(ref.digest)) {
      throw config_error(std::string{ func } + ": invalid digest in '" +
                         std::string{ value } + "'");
    }
  }

  // A ':' after the last '/' separates the tag; earlier ones belong to a port
  auto const slash{ rest.rfind('/') };
  if (auto const colon{ rest.rfind(':') };
      colon != std::string_view::npos && (slash == std::string_view::npos || colon > slash)) {
    ref.tag = std::string{ rest.substr(colon + 1) };
    rest = rest.substr(0, colon);
    if (!valid_tag(ref.tag)) {
      throw config_error(std::string{ func } + ": invalid tag in '" + std::string{ value } +
                         "'");
    }
  }

  if (auto const first_slash{ rest.find('/') };
      first_slash != std::string_view::npos &&
      looks_like_registry(rest.substr(0, first_slash))) {
    ref.registry = std::string{ rest.substr(0, first_slash) };
    rest = rest.substr(first_slash + 1);
  }

  ref.repository = std::string{ rest };
  return ref;
}

}  // namespace

std::string image_ref::name() const { return registry + "/" + repository; }

std::string image_ref::reference() const { return digest.empty() ? tag : digest; }

std::string image_ref::str() const {
  std::string out{ name() };
  if (!tag.empty()) { out += ":" + tag; }
  if (!digest.empty()) { out += "@" + digest; }
  return out;
}

image_ref image_ref_parse(std::string_view value) {
  auto ref{ split_reference(value, "image_ref_parse") };

  if (ref.registry.empty() || ref.registry == "index.docker.io" ||
      ref.registry == "registry-1.docker.io") {
    ref.registry = std::string{ kDockerHubRegistry };
  }
  if (ref.registry == kDockerHubRegistry && ref.repository.find('/') == std::string::npos) {
    ref.repository = "library/" + ref.repository;
  }
  if (ref.tag.empty() && ref.digest.empty()) { ref.tag = "latest"; }

  if (!valid_repository(ref.repository)) {
    throw config_error("image_ref_parse: invalid repository in '" + std::string{ value } +
                       "'");
  }
  return ref;
}

image_ref oci_ref_parse(std::string_view url) {
  if (!is_oci_url(url)) {
    throw config_error("oci_ref_parse: '" + std::string{ url } + "' must start with oci://");
  }

  auto ref{ split_reference(url.substr(kOciScheme.size()), "oci_ref_parse") };
  if (ref.registry.empty()) {
    throw config_error("oci_ref_parse: '" + std::string{ url } + "' has no registry host");
  }
  if (!valid_repository(ref.repository)) {
    throw config_error("oci_ref_parse: invalid repository in '" + std::string{ url } + "'");
  }
  return ref;
}

bool is_oci_url(std::string_view value) { return value.starts_with(kOciScheme); }

}  // namespace bale
