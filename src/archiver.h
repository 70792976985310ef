#pragma once

#include "package.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bale {

class package_paths;

inline constexpr std::string_view kMigrationScriptsToActions{ "scripts-to-actions" };
inline constexpr std::string_view kMigrationPluralizeSetVariable{ "pluralize-set-variable" };

// Tars every component directory as components/<name>.tar (entries prefixed
// "<name>/") and removes the directory. A component without regular files
// leaves no tarball.
void archive_components(package_paths const &paths, std::vector<component> const &components);

// Records the aggregate checksum and migrations, then writes bale.yaml with
// mode 0400.
void archive_finalize(package_definition &pkg,
                      package_paths const &paths,
                      std::string const &aggregate);

// bale-package-<name>-<arch>[-<version>].tar.zst, or .tar when uncompressed.
std::string archive_name(package_definition const &pkg);

// Header stored in <archive>.part000 when an archive is split.
struct archive_split_header {
  std::string sha256sum;  // of the whole archive
  std::uint64_t bytes{ 0 };
  std::uint64_t count{ 0 };  // number of data parts
};

// Writes the build directory as a deterministic archive into output_dir. When
// max_size_mb is positive and the archive is larger, it is split into
// <archive>.part001..N plus a JSON header in <archive>.part000, and the
// .part000 path is returned.
std::filesystem::path archive_package(package_paths const &paths,
                                      package_definition const &pkg,
                                      std::filesystem::path const &output_dir,
                                      int max_size_mb = 0);

// Returns `archive` itself, or for a split archive (any of its parts) the
// reassembled file written to temp_dir after its size and sha256 are checked.
std::filesystem::path archive_join_parts(std::filesystem::path const &archive,
                                         std::filesystem::path const &temp_dir);

// bale.yaml of a package archive.
std::string archive_read_manifest(std::filesystem::path const &archive);

}  // namespace bale
