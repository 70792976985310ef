#pragma once

#include "oci.h"
#include "package.h"
#include "util.h"

#include "yaml-cpp/yaml.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bale {

class oci_cache;

struct compose_options {
  std::filesystem::path base_dir;  // directory holding the head package's bale.yaml
  std::string arch;                // matched against only.cluster.architecture
  std::string flavor;              // matched against only.flavor
  oci::remote_factory remotes;     // needed only for oci:// imports
  oci_cache *cache{ nullptr };     // needed only for oci:// imports
};

// One component along an import chain, as declared in its own package.
struct import_node : unmovable {
  import_node(component c,
              std::size_t index,
              std::string package_name,
              std::vector<YAML::Node> variables,
              std::vector<YAML::Node> constants,
              std::filesystem::path relative_to_head);

  component c;
  std::size_t index;  // position within its package
  std::string package_name;
  std::vector<YAML::Node> variables;
  std::vector<YAML::Node> constants;

  // Directory of this node's package relative to the head package's directory.
  std::filesystem::path const relative_to_head;

  import_node *prev{ nullptr };
  import_node *next{ nullptr };
};

// Head component followed by every component it imports, depth first. A
// remote (oci://) import may only appear on the node before the tail; the
// tail is built once its skeleton has been materialized in the cache.
class import_chain : unmovable {
 public:
  import_chain(component head,
               std::size_t index,
               package_definition const &pkg,
               compose_options const &options);

  import_node const &head() const { return *nodes_.front(); }
  import_node const &tail() const { return *nodes_.back(); }
  std::size_t size() const { return nodes_.size(); }

  // oci:// URL of the remote import, empty for purely local chains.
  std::string const &remote_url() const { return remote_url_; }

  // Folds the chain from tail to head. Relative paths of each node are
  // rewritten to be relative to the head package; the parent's identity
  // fields win and its content is appended.
  component compose() const;

  // Variables and constants of every node; on a name clash the node closest to
  // the head wins.
  std::vector<YAML::Node> merged_variables() const;
  std::vector<YAML::Node> merged_constants() const;

 private:
  void append(std::unique_ptr<import_node> node);
  void add_remote_tail(std::string const &url,
                       std::string const &name,
                       compose_options const &options);

  std::vector<std::unique_ptr<import_node>> nodes_;
  std::string remote_url_;
};

struct composed_package {
  std::vector<component> components;
  std::vector<YAML::Node> variables;
  std::vector<YAML::Node> constants;
  bool used_oci{ false };
};

// Resolves every compatible component of `pkg` through its import chain.
composed_package compose_package(package_definition const &pkg, compose_options const &options);

}  // namespace bale
