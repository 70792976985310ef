#pragma once

#include "fetch_progress.h"

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace bale {

struct resolve_options {
  std::string checksum;      // sha256 hex; empty skips verification
  std::string extract_path;  // member of the fetched archive to keep
  std::filesystem::path temp_dir;  // holds archives downloaded for extraction
  std::optional<std::filesystem::path> file_root;  // anchor for relative local sources
  fetch_progress_cb_t progress;
  std::stop_token stop;
};

// Materializes `source` (local path, http(s) URL or git URL[@ref]) at
// `destination`. Content is staged beside the destination and renamed into
// place only after the checksum passes, replacing anything already there. A
// checksum mismatch raises integrity_error naming the source; other failures
// are wrapped with "unable to resolve <source>". Never retried.
void resolve(std::string const &source,
             std::filesystem::path const &destination,
             resolve_options const &options);

}  // namespace bale
