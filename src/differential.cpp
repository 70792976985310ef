#include "differential.h"

#include "archiver.h"
#include "error.h"
#include "git.h"
#include "image_ref.h"
#include "tui.h"
#include "version.h"

#include <algorithm>

namespace bale {
namespace {

bool keeps_image(image_ref const &ref, differential_reference const &reference) {
  if (ref.digest.empty() && ref.tag == "latest") { return true; }
  return !reference.images.contains(ref.str());
}

bool keeps_repo(std::string const &url, differential_reference const &reference) {
  if (git_url_ref(url).empty()) { return true; }
  return !reference.repos.contains(url);
}

}  // namespace

void differential_validate(std::string const &base_version, std::string const &target_version) {
  if (base_version.empty() || target_version.empty()) {
    throw config_error("differential package has no version set (base \"" + base_version +
                       "\", new \"" + target_version + "\")");
  }
  if (base_version == target_version) {
    throw config_error("differential package has the same version as the new package: " +
                       base_version);
  }
  if (version_is_newer(base_version, target_version)) {
    tui::warn("differential package %s is newer than %s",
              base_version.c_str(),
              target_version.c_str());
  }
}

differential_reference differential_reference_of(package_definition const &pkg) {
  differential_reference ref{ .version = pkg.metadata.version };
  for (auto const &c : pkg.components) {
    ref.components.push_back(c.name);
    for (auto const &image : c.images) { ref.images.insert(image_ref_parse(image).str()); }
    ref.repos.insert(c.repos.begin(), c.repos.end());
  }
  return ref;
}

differential_reference differential_load(std::filesystem::path const &archive,
                                         std::filesystem::path const &temp_dir) {
  if (!std::filesystem::exists(archive) &&
      !std::filesystem::exists(archive.string() + ".part000")) {
    throw config_error("differential package " + archive.string() + " does not exist");
  }
  auto const joined{ archive_join_parts(archive, temp_dir) };
  return differential_reference_of(
      package_parse(archive_read_manifest(joined), joined.string()));
}

void differential_filter(package_definition &pkg, differential_reference const &ref) {
  std::size_t dropped_images{ 0 };
  std::size_t dropped_repos{ 0 };

  for (auto &c : pkg.components) {
    auto const images_before{ c.images.size() };
    std::erase_if(c.images,
                  [&](std::string const &i) { return !keeps_image(image_ref_parse(i), ref); });
    dropped_images += images_before - c.images.size();

    auto const repos_before{ c.repos.size() };
    std::erase_if(c.repos, [&](std::string const &r) { return !keeps_repo(r, ref); });
    dropped_repos += repos_before - c.repos.size();
  }

  std::vector<std::string> missing;
  for (auto const &name : ref.components) {
    if (std::none_of(pkg.components.begin(), pkg.components.end(), [&](component const &c) {
          return c.name == name;
        })) {
      missing.push_back(name);
    }
  }

  pkg.build.differential = true;
  pkg.build.differential_package_version = ref.version;
  pkg.build.differential_missing = std::move(missing);

  tui::info("differential against %s: skipping %zu images and %zu repos",
            ref.version.c_str(),
            dropped_images,
            dropped_repos);
}

}  // namespace bale
