#pragma once

#include "image_ref.h"
#include "oci.h"
#include "package.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace bale {

class progress_reporter;

inline constexpr std::string_view kAnnotationRefName{ "org.opencontainers.image.ref.name" };

struct pulled_image {
  image_ref ref;
  oci::descriptor manifest;  // platform manifest stored under images/blobs
  bool has_layers{ false };
};

// Source rewrites keyed by the "registry[/repository]" prefix they replace.
using registry_overrides = std::map<std::string, std::string>;

// Parses "from=to" entries. Throws config_error on a malformed entry.
registry_overrides images_parse_registry_overrides(std::vector<std::string> const &entries);

// Where `ref` is pulled from: the longest override prefix matching its name on
// a path boundary is replaced. Returns `ref` unchanged when none matches.
image_ref images_pull_source(image_ref const &ref, registry_overrides const &overrides);

struct image_pull_options {
  std::vector<std::string> archs;  // first match wins for multi-arch indexes
  registry_overrides overrides;
};

// Pull mechanics below the layer-transfer contract. Results are returned in
// the order of `images` and keep the requested references.
class image_puller {
 public:
  virtual ~image_puller() = default;
  virtual std::vector<pulled_image> pull(std::vector<image_ref> const &images,
                                         std::filesystem::path const &images_dir,
                                         image_pull_options const &options,
                                         std::stop_token stop) = 0;
};

// Resolves each reference through the OCI transport, narrows an index to the
// first matching architecture and copies manifest, config and layer blobs into
// <images_dir>/blobs/sha256. Images are pulled concurrently. An overridden
// image is fetched from its override but annotated with its own reference.
class registry_image_puller : public image_puller {
 public:
  registry_image_puller(oci::remote_factory factory,
                        int concurrency,
                        progress_reporter *reporter = nullptr);

  std::vector<pulled_image> pull(std::vector<image_ref> const &images,
                                 std::filesystem::path const &images_dir,
                                 image_pull_options const &options,
                                 std::stop_token stop) override;

 private:
  oci::remote_factory factory_;
  int concurrency_;
  progress_reporter *reporter_;
};

struct aggregate_options {
  int attempts{ 3 };
  std::chrono::milliseconds delay{ std::chrono::seconds{ 5 } };
  std::vector<std::string> archs;
  registry_overrides overrides;
  std::stop_token stop;
};

// Every image of every component, normalized and deduplicated in first-seen
// order.
std::vector<image_ref> images_collect(std::vector<component> const &components);

// Pulls `images` with whole-batch retries, then writes the OCI layout
// (index.json, oci-layout) under images_dir. Exhausted attempts raise
// "unable to pull images after N attempts (<refs>)" with the last error nested.
std::vector<pulled_image> images_aggregate(image_puller &puller,
                                           std::vector<image_ref> const &images,
                                           std::filesystem::path const &images_dir,
                                           aggregate_options const &options);

void images_write_layout(std::filesystem::path const &images_dir,
                         std::vector<pulled_image> const &images);

}  // namespace bale
