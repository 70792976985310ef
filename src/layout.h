#pragma once

#include "util.h"

#include <filesystem>
#include <set>
#include <string>

namespace bale {

// Directories owned by one component while it is assembled.
struct component_paths {
  std::filesystem::path base;
  std::filesystem::path files;
  std::filesystem::path data;
  std::filesystem::path manifests;
  std::filesystem::path charts;
  std::filesystem::path values;
  std::filesystem::path repos;
  std::filesystem::path temp;
};

// Layout of a package build directory:
//   bale.yaml  bale.yaml.sig  checksums.txt  sboms.tar
//   components/<name>/{files,data,manifests,charts,values,repos,temp}
//   components/<name>.tar
//   images/{index.json,oci-layout,blobs/sha256/...}
class package_paths : unmovable {
 public:
  explicit package_paths(std::filesystem::path base);

  std::filesystem::path const &base() const { return base_; }
  std::filesystem::path manifest() const;
  std::filesystem::path signature() const;
  std::filesystem::path checksums() const;
  std::filesystem::path components_dir() const;
  std::filesystem::path images_dir() const;
  std::filesystem::path sboms_dir() const;
  std::filesystem::path sboms_archive() const;

  // Paths for a component without touching the filesystem.
  component_paths component(std::string const &name) const;
  std::filesystem::path component_tarball(std::string const &name) const;

  // Creates the component's directories. Each name may be created once per
  // build; a second request is a config_error.
  component_paths create_component(std::string const &name);

 private:
  std::filesystem::path base_;
  std::set<std::string> created_;
};

}  // namespace bale
