#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace bale {

struct extract_progress {
  std::uint64_t bytes_processed{ 0 };
  std::optional<std::uint64_t> total_bytes;
  std::uint64_t files_processed{ 0 };
  std::optional<std::uint64_t> total_files;
  std::filesystem::path current_entry;
  bool is_regular_file{ false };
};

using extract_progress_cb_t = std::function<bool(extract_progress const &)>;

struct extract_options {
  int strip_components{ 0 };
  // When set, only this entry (or the subtree below it) is extracted. Paths keep
  // their archive-relative layout under the destination.
  std::optional<std::string> member;
  extract_progress_cb_t progress;
};

// Returns the number of regular files extracted. Throws when nothing was
// extracted, or when `member` names no entry.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options = {});

// Reads a single regular-file entry into memory; nullopt when absent.
std::optional<std::string> extract_read_member(std::filesystem::path const &archive_path,
                                               std::string const &member);

bool extract_is_archive_extension(std::filesystem::path const &path);

enum class archive_compression { none, gzip, zstd };

struct archive_create_options {
  archive_compression compression{ archive_compression::none };
  // Entries are written as "<prefix>/<relative path>" when non-empty.
  std::string prefix;
};

// Writes every regular file and symlink below source_dir into a tar archive.
// Entries are sorted bytewise with mtime, uid and gid zeroed, so identical
// trees produce identical bytes. The archive is staged and renamed into place.
void archive_create(std::filesystem::path const &source_dir,
                    std::filesystem::path const &archive_path,
                    archive_create_options const &options = {});

}  // namespace bale
