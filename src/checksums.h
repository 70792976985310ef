#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

class package_paths;

struct checksum_entry {
  std::string path;  // '/'-separated, relative to the build directory
  std::string sha256;
};

struct checksum_manifest {
  std::vector<checksum_entry> entries;  // sorted by path
  std::string aggregate;                // sha256 of render_entries()

  // "<sha256>  <path>\n" for every entry.
  std::string render_entries() const;
  // render_entries() followed by "# aggregate: <sha256>\n".
  std::string render() const;
};

// Hashes every file of the build directory except bale.yaml, its signature and
// checksums.txt, and writes checksums.txt.
checksum_manifest checksums_generate(package_paths const &paths);

// Throws integrity_error on malformed lines or a stated aggregate that does not
// match the entries.
checksum_manifest checksums_parse(std::string_view text);

// Checks checksums.txt under `dir` against `expected_aggregate` and every listed
// file against its digest. Files listed in `skip` (absent by request) are not
// hashed.
void checksums_verify(std::filesystem::path const &dir,
                      std::string const &expected_aggregate,
                      std::vector<std::string> const &skip = {});

}  // namespace bale
