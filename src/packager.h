#pragma once

#include "image_ref.h"
#include "oci.h"
#include "package.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace bale {

class chart_packager;
class git_client;
class image_puller;
class kustomize_builder;
class oci_cache;
class progress_reporter;
class sbom_cataloger;

// Collaborators shared by the package operations. Commands wire in the
// defaults; tests substitute fakes.
struct packager_services {
  oci::remote_factory remotes;
  oci_cache *cache{ nullptr };
  chart_packager *charts{ nullptr };
  kustomize_builder *kustomize{ nullptr };
  git_client *git{ nullptr };
  image_puller *images{ nullptr };
  sbom_cataloger *sbom{ nullptr };  // null skips SBOM generation
  progress_reporter *reporter{ nullptr };
  std::stop_token stop;
  int concurrency{ 3 };
  std::chrono::milliseconds image_retry_delay{ std::chrono::seconds{ 5 } };
};

struct create_options {
  std::filesystem::path base_dir;    // directory holding bale.yaml
  std::filesystem::path output_dir;  // archive destination, unused when publishing
  std::string publish_url;           // oci://registry/namespace publishes instead
  std::string architecture;          // overrides metadata.architecture
  std::string flavor;
  std::vector<std::string> registry_overrides;        // "from=to" image source rewrites
  std::optional<std::filesystem::path> differential;  // earlier package archive
  std::optional<std::filesystem::path> signing_key;
  std::string signing_key_password;
  int max_package_size_mb{ 0 };
};

struct create_result {
  package_definition pkg;
  std::string aggregate;
  std::filesystem::path archive;  // empty when published
  std::optional<oci::descriptor> published;
};

// Composes, assembles, aggregates images, catalogs, checksums and finalizes a
// package, then writes it as an archive or publishes it. Failures are wrapped
// as "unable to create package", "unable to archive package" or "unable to
// publish package".
create_result package_create(create_options const &options, packager_services const &services);

struct publish_options {
  std::filesystem::path source;  // package archive, one of its parts, or a definition directory
  std::string url;               // oci://registry/namespace
  std::optional<std::filesystem::path> signing_key;
  std::string signing_key_password;
};

// A definition directory is published as an importable skeleton under
// <version>-skeleton; an archive is unpacked and published as is.
oci::descriptor package_publish(publish_options const &options,
                                packager_services const &services);

// <namespace>/<name>:<package tag> below the registry of `url`.
image_ref package_publish_ref(std::string const &url, package_definition const &pkg);

struct pull_options {
  std::string url;  // oci://registry/repository:tag
  std::filesystem::path output_dir;
  std::string architecture;  // defaults to the host
};

// Pulls every layer into output_dir and verifies checksums.txt against the
// manifest's aggregate checksum.
package_definition package_pull(pull_options const &options, packager_services const &services);

struct inspect_options {
  std::string source;  // archive path, split part, or oci:// reference
  std::optional<std::filesystem::path> key;       // verifies bale.yaml.sig
  std::optional<std::filesystem::path> sbom_out;  // extracts sboms.tar here
  std::string architecture;
};

// Returns the package's bale.yaml text.
std::string package_inspect(inspect_options const &options, packager_services const &services);

// Creates `file`, or updates it, with metadata.name set to `name`.
package_definition package_generate(std::string const &name, std::filesystem::path const &file);

}  // namespace bale
