#pragma once

#include "fetch_progress.h"
#include "oci.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace bale {

// Content-addressed store for OCI content shared by every build:
//   <root>/oci/blobs/sha256/<encoded digest>
//   <root>/oci/dirs/<encoded digest | sha256(url + name)>
// Entries are written under a unique temporary name and renamed into place, so
// a present entry is always complete and is trusted without re-hashing.
class oci_cache : unmovable {
 public:
  using path = std::filesystem::path;

  explicit oci_cache(std::optional<path> root = std::nullopt);
  ~oci_cache();

  path const &root() const;
  path blob_path(oci::descriptor const &desc) const;
  path dir_path(std::string const &id) const;

  // Returns the cached blob, fetching it through `r` only when absent.
  path ensure_blob(oci::remote &r,
                   oci::descriptor const &desc,
                   fetch_progress_cb_t const &progress = {});

  std::string read_blob(oci::remote &r, oci::descriptor const &desc);

  // Directory holding the extracted component tarball `tarball` (leading path
  // component stripped). An empty descriptor yields an empty directory keyed by
  // sha256(url + name).
  path ensure_dir(oci::remote &r,
                  oci::descriptor const &tarball,
                  std::string const &url,
                  std::string const &name);

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace bale
