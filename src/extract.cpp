#include "extract.h"

#include "platform.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bale {
namespace {

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_all(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_disk_writer : unmovable {
  archive_disk_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_disk_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_tar_writer : unmovable {
  archive_tar_writer() : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
  }

  ~archive_tar_writer() {
    if (handle) { archive_write_free(handle); }
  }

  archive *handle{ nullptr };
};

struct archive_entry_ptr : unmovable {
  archive_entry_ptr() : handle(archive_entry_new()) {
    if (!handle) { throw std::runtime_error("archive_entry_new failed"); }
  }
  ~archive_entry_ptr() { archive_entry_free(handle); }

  archive_entry *handle{ nullptr };
};

bool member_matches(std::string_view entry, std::string_view member) {
  while (entry.starts_with("./")) { entry.remove_prefix(2); }
  while (member.starts_with("./")) { member.remove_prefix(2); }
  while (member.ends_with('/')) { member.remove_suffix(1); }
  if (member.empty()) { return true; }
  if (entry.ends_with('/')) { entry.remove_suffix(1); }
  return entry == member ||
         (entry.size() > member.size() && entry.starts_with(member) &&
          entry[member.size()] == '/');
}

void ensure_directory(std::filesystem::path const &path) {
  auto const dir{ path.parent_path() };
  if (dir.empty()) { return; }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error(std::string("Failed to create directory ") + dir.string() +
                             ": " + ec.message());
  }
}

std::optional<std::string> strip_path_components(char const *path, int strip_count) {
  if (!path) { return std::nullopt; }
  if (strip_count <= 0) { return std::string(path); }

  char const *p{ path };
  int components_stripped{ 0 };

  // Skip leading slashes
  while (*p == '/') { ++p; }

  // Skip the specified number of path components
  while (components_stripped < strip_count) {
    if (*p == '\0') {
      // Path has fewer components than requested strip count
      return std::nullopt;
    }
    if (*p == '/') {
      ++components_stripped;
      // Skip multiple consecutive slashes
      while (*p == '/') { ++p; }
    } else {
      ++p;
    }
  }

  if (*p == '\0') {
    // Nothing left after stripping
    return std::nullopt;
  }

  return std::string(p);
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  archive_reader reader;
  archive_disk_writer writer;

  if (archive_read_open_filename(reader.handle, archive_path.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    throw std::runtime_error(std::string("Failed to open archive: ") +
                             archive_error_string(reader.handle));
  }

  archive_entry *entry{ nullptr };
  std::uint64_t processed{ 0 };
  std::uint64_t files_extracted{ 0 };
  bool matched_member{ false };

  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }

    if (r != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to read archive header: ") +
                               archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path) { throw std::runtime_error("Archive entry has null pathname"); }

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };

    if (options.member && !member_matches(entry_path, *options.member)) {
      if (archive_read_data_skip(reader.handle) != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Failed to skip archive entry: ") +
                                 archive_error_string(reader.handle));
      }
      continue;
    }
    matched_member = true;

    // Apply strip-components if configured
    std::string stripped_path;
    if (options.strip_components > 0) {
      auto stripped{ strip_path_components(entry_path, options.strip_components) };
      if (!stripped) {
        // Skip this entry - it was stripped to nothing
        continue;
      }
      stripped_path = *stripped;
      entry_path = stripped_path.c_str();
    }

    std::filesystem::path const full_path{ destination / entry_path };
    ensure_directory(full_path);

    {
      std::string const full_path_str{ full_path.string() };
      archive_entry_copy_pathname(entry, full_path_str.c_str());
    }

    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      std::string hardlink_str{ hardlink };

      // Strip components from hardlink target too
      if (options.strip_components > 0) {
        auto stripped{ strip_path_components(hardlink, options.strip_components) };
        if (stripped) { hardlink_str = *stripped; }
      }

      std::string const hardlink_full{ (destination / hardlink_str).string() };
      archive_entry_copy_hardlink(entry, hardlink_full.c_str());
    }

    if (options.progress &&
        !options.progress(extract_progress{ .bytes_processed = processed,
                                            .total_bytes = std::nullopt,
                                            .files_processed = 0,
                                            .total_files = std::nullopt,
                                            .current_entry = full_path,
                                            .is_regular_file = is_regular_file })) {
      throw std::runtime_error("extract: aborted by progress callback");
    }

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    if (archive_entry_size(entry) > 0) {
      std::vector<char> buffer(1024 * 1024);

      la_ssize_t bytes_read{ 0 };
      while ((bytes_read =
                  archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
        if (la_ssize_t const bytes_written{
                archive_write_data(writer.handle,
                                   buffer.data(),
                                   static_cast<size_t>(bytes_read)) };
            bytes_written < 0) {
          throw std::runtime_error(std::string("Failed to write entry data: ") +
                                   archive_error_string(writer.handle));
        }

        processed += static_cast<std::uint64_t>(bytes_read);

        if (options.progress &&
            !options.progress(extract_progress{ .bytes_processed = processed,
                                                .total_bytes = std::nullopt,
                                                .files_processed = 0,
                                                .total_files = std::nullopt,
                                                .current_entry = full_path,
                                                .is_regular_file = is_regular_file })) {
          throw std::runtime_error("extract: aborted by progress callback");
        }
      }

      if (bytes_read < 0) {
        throw std::runtime_error(std::string("Failed to read entry data: ") +
                                 archive_error_string(reader.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish entry: ") +
                               archive_error_string(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (options.member && !matched_member) {
    throw std::runtime_error("extract: " + *options.member + " not found in " +
                             archive_path.filename().string());
  }

  if (files_extracted == 0) {
    std::string msg{ "Archive extraction failed: 0 files extracted from " +
                     archive_path.filename().string() };
    if (options.strip_components > 0) {
      msg += " with strip=" + std::to_string(options.strip_components) +
             ". Check if strip value matches archive structure";
    }
    msg += " (archive may be empty, corrupt, or unsupported format)";
    throw std::runtime_error(msg);
  }

  return files_extracted;
}

bool extract_is_archive_extension(std::filesystem::path const &path) {
  static std::unordered_set<std::string> const archive_extensions{
    ".tar",     ".tgz", ".tar.gz", ".tar.xz", ".tar.bz2",
    ".tar.zst", ".zip", ".7z",     ".rar",    ".iso"
  };

  std::string const ext{ path.extension().string() };
  if (archive_extensions.contains(ext)) { return true; }

  return path.stem().has_extension() &&
         archive_extensions.contains(path.stem().extension().string() + ext);
}

std::optional<std::string> extract_read_member(std::filesystem::path const &archive_path,
                                               std::string const &member) {
  archive_reader reader;
  if (archive_read_open_filename(reader.handle, archive_path.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    throw std::runtime_error(std::string("extract_read_member: failed to open ") +
                             archive_path.string() + ": " +
                             archive_error_string(reader.handle));
  }

  archive_entry *entry{ nullptr };
  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { return std::nullopt; }
    if (r != ARCHIVE_OK) {
      throw std::runtime_error(std::string("extract_read_member: header error in ") +
                               archive_path.string() + ": " +
                               archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path || archive_entry_filetype(entry) != AE_IFREG) { continue; }

    std::string_view name{ entry_path };
    while (name.starts_with("./")) { name.remove_prefix(2); }
    if (name != member) { continue; }

    std::string content;
    std::vector<char> buffer(64 * 1024);
    la_ssize_t bytes_read{ 0 };
    while ((bytes_read = archive_read_data(reader.handle, buffer.data(), buffer.size())) >
           0) {
      content.append(buffer.data(), static_cast<std::size_t>(bytes_read));
    }
    if (bytes_read < 0) {
      throw std::runtime_error(std::string("extract_read_member: read failed for ") +
                               member + ": " + archive_error_string(reader.handle));
    }
    return content;
  }
}

void archive_create(std::filesystem::path const &source_dir,
                    std::filesystem::path const &archive_path,
                    archive_create_options const &options) {
  auto const files{ util_list_files(source_dir) };

  if (auto const parent{ archive_path.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  auto const staging{ util_partial_path(archive_path) };
  scoped_path_cleanup staging_cleanup{ staging };

  {
    archive_tar_writer writer;
    auto const check = [&](int rc, char const *what) {
      if (rc != ARCHIVE_OK) {
        throw std::runtime_error(std::string("archive_create: ") + what + ": " +
                                 archive_error_string(writer.handle));
      }
    };

    check(archive_write_set_format_pax_restricted(writer.handle), "set format");
    switch (options.compression) {
      case archive_compression::none: break;
      case archive_compression::gzip:
        check(archive_write_add_filter_gzip(writer.handle), "gzip filter");
        check(archive_write_set_filter_option(writer.handle, "gzip", "timestamp", nullptr),
              "gzip timestamp");
        break;
      case archive_compression::zstd:
        check(archive_write_add_filter_zstd(writer.handle), "zstd filter");
        break;
    }
    check(archive_write_open_filename(writer.handle, staging.c_str()), "open");

    std::vector<char> buffer(1024 * 1024);
    for (auto const &rel : files) {
      auto const full{ source_dir / rel };
      auto const status{ std::filesystem::symlink_status(full) };
      std::string const name{ options.prefix.empty() ? rel : options.prefix + "/" + rel };

      archive_entry_ptr entry;
      archive_entry_set_pathname(entry.handle, name.c_str());
      archive_entry_set_mtime(entry.handle, 0, 0);
      archive_entry_set_uid(entry.handle, 0);
      archive_entry_set_gid(entry.handle, 0);
      archive_entry_set_perm(entry.handle,
                             static_cast<mode_t>(status.permissions() &
                                                      std::filesystem::perms::mask));

      if (std::filesystem::is_symlink(status)) {
        auto const target{ std::filesystem::read_symlink(full).string() };
        archive_entry_set_filetype(entry.handle, AE_IFLNK);
        archive_entry_set_symlink(entry.handle, target.c_str());
        archive_entry_set_size(entry.handle, 0);
        check(archive_write_header(writer.handle, entry.handle), "write header");
        continue;
      }

      auto const size{ std::filesystem::file_size(full) };
      archive_entry_set_filetype(entry.handle, AE_IFREG);
      archive_entry_set_size(entry.handle, static_cast<la_int64_t>(size));
      check(archive_write_header(writer.handle, entry.handle), "write header");

      auto file{ util_open_file(full, "rb") };
      if (!file) {
        throw std::runtime_error("archive_create: failed to open " + full.string());
      }
      while (auto const n{ std::fread(buffer.data(), 1, buffer.size(), file.get()) }) {
        if (archive_write_data(writer.handle, buffer.data(), n) < 0) {
          throw std::runtime_error(std::string("archive_create: write failed for ") + rel +
                                   ": " + archive_error_string(writer.handle));
        }
      }
      if (std::ferror(file.get())) {
        throw std::runtime_error("archive_create: read failed for " + full.string());
      }
    }

    check(archive_write_close(writer.handle), "close");
  }

  platform::atomic_rename(staging, archive_path);
  staging_cleanup.reset();
}

}  // namespace bale
