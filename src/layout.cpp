#include "layout.h"

#include "error.h"
#include "package.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace bale {

package_paths::package_paths(std::filesystem::path base) : base_{ std::move(base) } {}

std::filesystem::path package_paths::manifest() const { return base_ / kPackageFileName; }

std::filesystem::path package_paths::signature() const {
  return base_ / (std::string{ kPackageFileName } + ".sig");
}

std::filesystem::path package_paths::checksums() const { return base_ / "checksums.txt"; }

std::filesystem::path package_paths::components_dir() const { return base_ / "components"; }

std::filesystem::path package_paths::images_dir() const { return base_ / "images"; }

std::filesystem::path package_paths::sboms_dir() const { return base_ / "sboms"; }

std::filesystem::path package_paths::sboms_archive() const { return base_ / "sboms.tar"; }

component_paths package_paths::component(std::string const &name) const {
  auto const root{ components_dir() / name };
  return component_paths{ .base = root,
                          .files = root / "files",
                          .data = root / "data",
                          .manifests = root / "manifests",
                          .charts = root / "charts",
                          .values = root / "values",
                          .repos = root / "repos",
                          .temp = root / "temp" };
}

std::filesystem::path package_paths::component_tarball(std::string const &name) const {
  return components_dir() / (name + ".tar");
}

component_paths package_paths::create_component(std::string const &name) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
    throw config_error("package_paths: invalid component name '" + name + "'");
  }
  if (!created_.insert(name).second) {
    throw config_error("package_paths: component \"" + name + "\" already has a directory");
  }

  auto paths{ component(name) };
  for (auto const *dir : { &paths.files,
                           &paths.data,
                           &paths.manifests,
                           &paths.charts,
                           &paths.values,
                           &paths.repos,
                           &paths.temp }) {
    std::error_code ec;
    std::filesystem::create_directories(*dir, ec);
    if (ec) {
      throw std::runtime_error("package_paths: failed to create " + dir->string() + ": " +
                               ec.message());
    }
  }
  return paths;
}

}  // namespace bale
