#pragma once

#include <string>
#include <string_view>

namespace bale {

inline constexpr std::string_view kDockerHubRegistry{ "docker.io" };
inline constexpr std::string_view kOciScheme{ "oci://" };

// Normalized (registry, repository, tag-or-digest) container reference.
struct image_ref {
  std::string registry;
  std::string repository;
  std::string tag;     // empty when pinned only by digest
  std::string digest;  // "sha256:<hex>" or empty

  // registry/repository
  std::string name() const;

  // Tag or digest as used in a manifests/<reference> request; digest wins.
  std::string reference() const;

  // registry/repository[:tag][@digest], the deduplication key
  std::string str() const;

  bool operator==(image_ref const &) const = default;
};

// Docker-style normalization: "nginx" -> docker.io/library/nginx:latest.
// Throws config_error on malformed input.
image_ref image_ref_parse(std::string_view value);

// Package reference "oci://registry/repository[:tag|@digest]". The registry is
// mandatory and no Docker Hub defaults are applied; tag may be empty.
image_ref oci_ref_parse(std::string_view url);

bool is_oci_url(std::string_view value);

}  // namespace bale
