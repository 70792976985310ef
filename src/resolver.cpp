#include "resolver.h"

#include "error.h"
#include "extract.h"
#include "fetch.h"
#include "platform.h"
#include "sha256.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include <stdexcept>
#include <system_error>

namespace bale {
namespace {

bool is_local(uri_scheme scheme) {
  return scheme == uri_scheme::LOCAL_FILE_ABSOLUTE || scheme == uri_scheme::LOCAL_FILE_RELATIVE;
}

// Fetches an archive and extracts `member` from it into `staged`.
void resolve_member(std::string const &source,
                    std::filesystem::path const &staged,
                    resolve_options const &options,
                    fetch_progress_cb_t const &progress) {
  if (options.temp_dir.empty()) {
    throw std::invalid_argument("resolve: extractPath needs a temp directory");
  }

  auto const info{ uri_classify(source) };
  std::filesystem::path archive;
  if (is_local(info.scheme)) {
    archive = uri_resolve_local_file_relative(info.canonical, options.file_root);
  } else {
    auto name{ uri_extract_filename(source) };
    if (name.empty()) { name = "archive"; }
    auto const key{ sha256_hex(std::string_view{ source }).substr(0, 12) };
    archive = options.temp_dir / ("download-" + key) / name;
    fetch_single(fetch_request_for(source, archive, options.file_root, progress));
  }

  scoped_path_cleanup const unpacked{ util_partial_path(options.temp_dir / "extract") };
  std::filesystem::create_directories(unpacked.path());
  extract(archive,
          unpacked.path(),
          extract_options{ .strip_components = 0,
                           .member = options.extract_path,
                           .progress = {} });

  auto const member{ unpacked.path() /
                     std::filesystem::path{ options.extract_path }.relative_path() };
  std::error_code ec;
  if (!std::filesystem::exists(member, ec)) {
    throw std::runtime_error("resolve: " + options.extract_path + " not found in " +
                             archive.string());
  }
  platform::atomic_rename(member, staged);
}

}  // namespace

void resolve(std::string const &source,
             std::filesystem::path const &destination,
             resolve_options const &options) {
  auto const stop{ options.stop };
  fetch_progress_cb_t const progress{ [stop, &options](fetch_progress_t const &p) {
    if (stop.stop_requested()) { return false; }
    return options.progress ? options.progress(p) : true;
  } };

  scoped_path_cleanup staged{ util_partial_path(destination) };

  try {
    if (auto const parent{ destination.parent_path() }; !parent.empty()) {
      std::filesystem::create_directories(parent);
    }

    tui::debug("resolve: %s -> %s", source.c_str(), destination.string().c_str());
    if (options.extract_path.empty()) {
      fetch_single(fetch_request_for(source, staged.path(), options.file_root, progress));
    } else {
      resolve_member(source, staged.path(), options, progress);
    }

    if (stop.stop_requested()) { throw std::runtime_error("resolve: cancelled"); }

    if (!options.checksum.empty()) {
      if (!std::filesystem::is_regular_file(staged.path())) {
        throw config_error("resolve: a checksum can only verify a single file");
      }
      sha256_verify(options.checksum, sha256(staged.path()));
    }
  } catch (integrity_error const &e) {
    throw integrity_error(std::string{ e.what() } + " (source: " + source + ")");
  } catch (config_error const &) {
    throw;
  } catch (std::exception const &) {
    error_rethrow_with_context("unable to resolve " + source);
  }

  std::error_code ec;
  std::filesystem::remove_all(destination, ec);
  if (ec) {
    throw std::runtime_error("resolve: failed to replace " + destination.string() + ": " +
                             ec.message());
  }
  platform::atomic_rename(staged.path(), destination);
  staged.reset();
}

}  // namespace bale
