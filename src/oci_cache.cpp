#include "oci_cache.h"

#include "extract.h"
#include "platform.h"
#include "sha256.h"
#include "tui.h"

#include <sstream>
#include <stdexcept>
#include <system_error>

using path = std::filesystem::path;

namespace bale {

struct oci_cache::impl {
  path root_;

  path blobs_dir() const { return root_ / "oci" / "blobs" / "sha256"; }
  path dirs_dir() const { return root_ / "oci" / "dirs"; }
};

namespace {

bool is_populated(path const &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it{ dir, ec };
  return !ec && it != std::filesystem::directory_iterator{};
}

void create_dirs(path const &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("oci_cache: failed to create " + dir.string() + ": " +
                             ec.message());
  }
}

}  // namespace

oci_cache::oci_cache(std::optional<path> root) : m{ std::make_unique<impl>() } {
  if (std::optional<path> maybe_root{ root ? root : platform::get_default_cache_root() }) {
    m->root_ = *maybe_root;
    return;
  }

  std::ostringstream oss;
  oss << "Unable to determine default cache root: "
      << platform::get_default_cache_root_env_vars() << " not set";
  throw std::runtime_error(oss.str());
}

oci_cache::~oci_cache() = default;

path const &oci_cache::root() const { return m->root_; }

path oci_cache::blob_path(oci::descriptor const &desc) const {
  return m->blobs_dir() / desc.encoded();
}

path oci_cache::dir_path(std::string const &id) const { return m->dirs_dir() / id; }

path oci_cache::ensure_blob(oci::remote &r,
                            oci::descriptor const &desc,
                            fetch_progress_cb_t const &progress) {
  if (desc.empty()) { throw std::runtime_error("oci_cache: empty descriptor"); }

  auto const target{ blob_path(desc) };
  if (platform::file_exists(target)) {
    tui::debug("oci_cache: hit %s", desc.digest.c_str());
    return target;
  }

  tui::debug("oci_cache: miss %s, fetching from %s", desc.digest.c_str(),
             r.ref().name().c_str());
  oci::copy_blob(r, desc, target, progress);
  return target;
}

std::string oci_cache::read_blob(oci::remote &r, oci::descriptor const &desc) {
  return util_load_text(ensure_blob(r, desc));
}

path oci_cache::ensure_dir(oci::remote &r,
                           oci::descriptor const &tarball,
                           std::string const &url,
                           std::string const &name) {
  if (tarball.empty()) {
    auto const dir{ dir_path(sha256_hex(std::string_view{ url + name })) };
    create_dirs(dir);
    return dir;
  }

  auto const dir{ dir_path(tarball.encoded()) };
  if (is_populated(dir)) {
    tui::debug("oci_cache: %s already extracted", tarball.digest.c_str());
    return dir;
  }

  auto const blob{ ensure_blob(r, tarball) };
  create_dirs(m->dirs_dir());

  scoped_path_cleanup staging{ util_partial_path(dir) };
  create_dirs(staging.path());
  extract(blob,
          staging.path(),
          extract_options{ .strip_components = 1, .member = {}, .progress = {} });

  std::error_code ec;
  std::filesystem::remove(dir, ec);  // only succeeds when empty
  try {
    platform::atomic_rename(staging.path(), dir);
  } catch (std::system_error const &) {
    // a concurrent build extracted the same digest first
    if (!is_populated(dir)) { throw; }
    return dir;
  }
  staging.reset();
  return dir;
}

}  // namespace bale
