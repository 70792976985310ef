#pragma once

#include "package.h"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace bale {

// What an earlier package already carries.
struct differential_reference {
  std::string version;
  std::set<std::string> images;  // normalized image_ref::str()
  std::set<std::string> repos;   // "url@ref" as declared
  std::vector<std::string> components;
};

// Throws config_error unless both versions are set and differ.
void differential_validate(std::string const &base_version, std::string const &target_version);

differential_reference differential_reference_of(package_definition const &pkg);

// Reads bale.yaml from a package archive; split archives are joined under
// temp_dir first.
differential_reference differential_load(std::filesystem::path const &archive,
                                         std::filesystem::path const &temp_dir);

// Drops images and tagged repos the reference already carries and records the
// differential build fields. "latest" tags and repos without a ref are kept.
void differential_filter(package_definition &pkg, differential_reference const &ref);

}  // namespace bale
