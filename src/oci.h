#pragma once

#include "fetch_progress.h"
#include "image_ref.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

class package_paths;
class progress_reporter;
struct package_definition;

}  // namespace bale

namespace bale::oci {

inline constexpr std::string_view kMediaTypeImageManifest{
  "application/vnd.oci.image.manifest.v1+json"
};
inline constexpr std::string_view kMediaTypeImageIndex{
  "application/vnd.oci.image.index.v1+json"
};
inline constexpr std::string_view kMediaTypeArtifactManifest{
  "application/vnd.oci.artifact.manifest.v1+json"
};
inline constexpr std::string_view kMediaTypeDockerManifest{
  "application/vnd.docker.distribution.manifest.v2+json"
};
inline constexpr std::string_view kMediaTypeDockerManifestList{
  "application/vnd.docker.distribution.manifest.list.v2+json"
};
inline constexpr std::string_view kMediaTypePackageConfig{ "application/vnd.bale.config.v1+json" };
inline constexpr std::string_view kAnnotationTitle{ "org.opencontainers.image.title" };

struct platform {
  std::string os;
  std::string architecture;
  std::string variant;
};

struct descriptor {
  std::string media_type;
  std::string digest;  // "sha256:<hex>"; empty for the empty descriptor
  std::int64_t size{ 0 };
  std::map<std::string, std::string> annotations;
  std::optional<oci::platform> platform;

  bool empty() const { return digest.empty(); }
  std::string title() const;
  std::string encoded() const;  // digest without its algorithm prefix
};

struct manifest {
  std::string media_type;
  oci::descriptor config;
  std::vector<oci::descriptor> layers;  // "blobs" for artifact manifests
  std::map<std::string, std::string> annotations;

  // Layer whose title annotation equals `title`, or the empty descriptor.
  oci::descriptor locate(std::string_view title) const;
};

// Parses an image or artifact manifest; throws std::runtime_error on bad JSON.
manifest manifest_parse(std::string_view body, std::string_view media_type);
std::string manifest_serialize(manifest const &m);

// Entries of an image index / manifest list.
std::vector<descriptor> index_parse(std::string_view body);
std::string index_serialize(std::vector<descriptor> const &manifests);

bool is_index_media_type(std::string_view media_type);

// Descriptor for in-memory content (sha256 digest and size filled in).
descriptor descriptor_for_bytes(std::string_view media_type, std::string_view bytes);
descriptor descriptor_for_file(std::string_view media_type, std::filesystem::path const &file);

// Layer media type chosen from a build directory file's extension.
std::string layer_media_type(std::filesystem::path const &file);

platform platform_for_arch(std::string_view arch);

// Per-repository endpoint. Implementations move raw bytes; digest checks and
// atomic placement happen in the free functions below.
class remote {
 public:
  virtual ~remote() = default;

  virtual image_ref const &ref() const = 0;

  // Descriptor of the manifest a tag or digest points at.
  virtual descriptor resolve(std::string const &reference) = 0;
  virtual std::string fetch_manifest(descriptor const &desc) = 0;
  virtual void fetch_blob(descriptor const &desc,
                          std::filesystem::path const &destination,
                          fetch_progress_cb_t const &progress) = 0;
  virtual bool exists(descriptor const &desc) = 0;
  virtual void push_blob(descriptor const &desc, std::filesystem::path const &source) = 0;
  virtual void push_manifest(std::string const &reference,
                             std::string const &media_type,
                             std::string const &body) = 0;
};

// Builds the endpoint for a repository; injected so callers can be tested
// without a registry.
using remote_factory = std::function<std::unique_ptr<remote>(image_ref const &)>;

struct copy_options {
  int concurrency{ 3 };
  progress_reporter *reporter{ nullptr };
  std::stop_token stop;
  std::vector<std::string> only_titles;  // empty copies every layer
};

// Fetches a blob into a hidden partial file beside destination, checks its size
// and sha256 against the descriptor, then renames it into place.
void copy_blob(remote &r,
               descriptor const &desc,
               std::filesystem::path const &destination,
               fetch_progress_cb_t const &progress = {});

// Manifest body of `desc`; throws integrity_error when it does not hash to
// the descriptor's digest.
std::string fetch_manifest_verified(remote &r, descriptor const &desc);

// Descriptor of the remote's tagged manifest; an index is narrowed to the
// entry matching `target`.
descriptor resolve_root(remote &r, platform const &target);
manifest fetch_root(remote &r, platform const &target);

struct pull_result {
  manifest root;
  std::vector<std::filesystem::path> written;
  std::vector<std::filesystem::path> skipped;  // already present with matching size
};

// Writes every layer to <destination>/<title>.
pull_result pull(remote &r,
                 std::filesystem::path const &destination,
                 platform const &target,
                 copy_options const &options);

// Tag a package is published under: <version>-<arch>, or <version>-skeleton.
std::string package_tag(package_definition const &pkg);

// Pushes every file of the build directory as a layer, a config blob built from
// the metadata, and the manifest under package_tag(). Layers that already
// exist remotely are not uploaded again. Returns the manifest descriptor.
descriptor publish(remote &r,
                   package_paths const &paths,
                   package_definition const &pkg,
                   copy_options const &options);

}  // namespace bale::oci
