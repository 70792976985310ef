#pragma once

#include "yaml-cpp/yaml.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

inline constexpr std::string_view kPackageKind{ "BalePackageConfig" };
inline constexpr std::string_view kPackageFileName{ "bale.yaml" };
inline constexpr std::string_view kSkeletonArch{ "skeleton" };

// Every struct below keeps the mapping it was parsed from in `raw`. Emission
// starts from a clone of that mapping and overwrites the modeled keys, so keys
// this model does not know about survive a load/save cycle unchanged.

struct package_metadata {
  std::string name;
  std::string description;
  std::string version;
  std::string url;
  std::string image;
  std::string authors;
  std::string documentation;
  std::string source;
  std::string vendor;
  std::string architecture;
  std::string aggregate_checksum;
  bool uncompressed{ false };
  YAML::Node raw;
};

struct package_build {
  std::string terminal;
  std::string user;
  std::string architecture;
  std::string timestamp;
  std::string version;
  std::vector<std::string> migrations;
  bool differential{ false };
  std::string differential_package_version;
  std::vector<std::string> differential_missing;
  std::vector<std::string> registry_overrides;  // "from=to"
  std::string flavor;
  YAML::Node raw;
};

struct component_only {
  std::string local_os;
  std::string cluster_architecture;
  std::vector<std::string> cluster_distros;
  std::string flavor;
  YAML::Node raw;
};

struct component_import {
  std::string name;
  std::string path;
  std::string url;
  YAML::Node raw;

  bool empty() const { return name.empty() && path.empty() && url.empty(); }
};

struct component_file {
  std::string source;
  std::string shasum;
  std::string target;
  bool executable{ false };
  std::vector<std::string> symlinks;
  std::string extract_path;
  YAML::Node raw;
};

struct data_injection_target {
  std::string namespace_;
  std::string selector;
  std::string container;
  std::string path;
  YAML::Node raw;
};

struct component_data_injection {
  std::string source;
  data_injection_target target;
  bool compress{ false };
  YAML::Node raw;
};

struct component_manifest {
  std::string name;
  std::string namespace_;
  std::vector<std::string> files;
  std::vector<std::string> kustomizations;
  bool kustomize_allow_any_directory{ false };
  bool no_wait{ false };
  YAML::Node raw;
};

struct component_chart {
  std::string name;
  std::string release_name;
  std::string version;
  std::string namespace_;
  std::string url;
  std::string repo_name;
  std::string git_path;
  std::string local_path;
  std::vector<std::string> values_files;
  bool no_wait{ false };
  YAML::Node raw;
};

struct component_action {
  std::string cmd;
  std::string description;
  std::optional<std::string> dir;
  std::vector<std::string> env;  // "KEY=value"
  std::optional<std::string> shell;
  std::optional<int> max_retries;
  std::optional<int> max_total_seconds;
  std::optional<bool> mute;
  std::vector<std::string> set_variables;  // names receiving trimmed stdout
  bool wait{ false };                      // carries a wait condition, no cmd
  YAML::Node raw;
};

struct action_defaults {
  bool mute{ false };
  int max_total_seconds{ 0 };
  int max_retries{ 0 };
  std::string dir;
  std::vector<std::string> env;
  std::string shell;
  YAML::Node raw;
};

struct action_set {
  action_defaults defaults;
  std::vector<component_action> before;
  std::vector<component_action> after;
  std::vector<component_action> on_success;
  std::vector<component_action> on_failure;
  YAML::Node raw;
};

// onDeploy and onRemove are deploy-time concerns; they ride along in raw.
struct component_actions {
  action_set on_create;
  YAML::Node raw;
};

struct component {
  std::string name;
  std::string description;
  bool default_{ false };
  std::optional<bool> required;
  component_only only;
  component_import import;
  std::vector<component_file> files;
  std::vector<component_data_injection> data_injections;
  std::vector<component_manifest> manifests;
  std::vector<component_chart> charts;
  std::vector<std::string> repos;
  std::vector<std::string> images;
  component_actions actions;
  YAML::Node raw;
};

struct package_definition {
  std::string kind{ kPackageKind };
  package_metadata metadata;
  package_build build;
  std::vector<component> components;
  std::vector<YAML::Node> constants;
  std::vector<YAML::Node> variables;
  YAML::Node raw;

  bool is_skeleton() const { return metadata.architecture == kSkeletonArch; }
};

// Throws config_error naming `origin` on malformed YAML or a wrong kind.
package_definition package_parse(std::string_view yaml, std::string const &origin);
package_definition package_load(std::filesystem::path const &path);

std::string package_emit(package_definition const &pkg);
void package_save(package_definition const &pkg,
                  std::filesystem::path const &path,
                  std::filesystem::perms mode = std::filesystem::perms::owner_read |
                                                std::filesystem::perms::owner_write);

// Rejects a missing package name or component name.
void package_validate(package_definition const &pkg);

// Rejects duplicate component names. Variants sharing a name are legal in a
// definition as long as flavor and architecture filtering leaves only one.
void package_validate_unique_components(package_definition const &pkg);

// Name of a variable or constant entry; empty when the entry has none.
std::string package_entry_name(YAML::Node const &entry);

}  // namespace bale
