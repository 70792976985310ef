#include "archiver.h"

#include "error.h"
#include "extract.h"
#include "layout.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace bale {
namespace {

namespace fs = std::filesystem;

constexpr std::uint64_t kMegabyte{ 1024 * 1024 };
constexpr std::string_view kPartSuffix{ ".part" };

bool has_regular_files(fs::path const &dir) {
  std::error_code ec;
  for (fs::recursive_directory_iterator it{ dir, ec }, end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file()) { return true; }
  }
  if (ec) {
    throw std::runtime_error("archive_components: failed to walk " + dir.string() + ": " +
                             ec.message());
  }
  return false;
}

void remove_tree(fs::path const &dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    throw std::runtime_error("archive_components: failed to remove " + dir.string() + ": " +
                             ec.message());
  }
}

std::string part_name(fs::path const &archive, std::uint64_t index) {
  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "%03llu", static_cast<unsigned long long>(index));
  return archive.filename().string() + std::string{ kPartSuffix } + suffix;
}

// "pkg.tar.zst.part003" -> "pkg.tar.zst"; empty when `path` is not a part.
fs::path archive_of_part(fs::path const &path) {
  auto const name{ path.filename().string() };
  auto const pos{ name.rfind(kPartSuffix) };
  if (pos == std::string::npos || name.size() - pos != kPartSuffix.size() + 3) { return {}; }
  return path.parent_path() / name.substr(0, pos);
}

void copy_stream(std::FILE *in, std::FILE *out, std::uint64_t limit, fs::path const &what) {
  std::vector<unsigned char> buffer(1024 * 1024);
  std::uint64_t remaining{ limit };
  while (remaining > 0) {
    auto const want{ static_cast<std::size_t>(
        std::min<std::uint64_t>(remaining, buffer.size())) };
    auto const got{ std::fread(buffer.data(), 1, want, in) };
    if (got == 0) {
      if (std::ferror(in)) { throw std::runtime_error("archive: read failed: " + what.string()); }
      break;
    }
    if (std::fwrite(buffer.data(), 1, got, out) != got) {
      throw std::runtime_error("archive: write failed: " + what.string());
    }
    remaining -= got;
  }
}

std::vector<fs::path> split(fs::path const &archive, std::uint64_t part_size) {
  auto const total{ fs::file_size(archive) };
  auto const count{ (total + part_size - 1) / part_size };
  archive_split_header const header{ .sha256sum = sha256_hex(sha256(archive)),
                                     .bytes = total,
                                     .count = count };

  file_ptr_t in{ util_open_file(archive, "rb") };
  if (!in) { throw std::runtime_error("archive_package: failed to open " + archive.string()); }

  std::vector<fs::path> parts;
  for (std::uint64_t i{ 1 }; i <= count; ++i) {
    auto const part{ archive.parent_path() / part_name(archive, i) };
    file_ptr_t out{ util_open_file(part, "wb") };
    if (!out) { throw std::runtime_error("archive_package: failed to create " + part.string()); }
    copy_stream(in.get(), out.get(), part_size, part);
    parts.push_back(part);
  }
  in.reset();

  nlohmann::json const j{ { "sha256sum", header.sha256sum },
                          { "bytes", header.bytes },
                          { "count", header.count } };
  auto const head{ archive.parent_path() / part_name(archive, 0) };
  util_write_file(head, j.dump());
  fs::remove(archive);

  tui::info("package is larger than %s, split into %llu parts",
            util_format_bytes(part_size).c_str(),
            static_cast<unsigned long long>(count));
  parts.insert(parts.begin(), head);
  return parts;
}

}  // namespace

void archive_components(package_paths const &paths, std::vector<component> const &components) {
  for (auto const &c : components) {
    auto const cp{ paths.component(c.name) };
    if (!fs::exists(cp.base)) { continue; }
    remove_tree(cp.temp);

    if (!has_regular_files(cp.base)) {
      tui::debug("archive_components: %s has no content", c.name.c_str());
      remove_tree(cp.base);
      continue;
    }

    archive_create(cp.base,
                   paths.component_tarball(c.name),
                   { .compression = archive_compression::none, .prefix = c.name });
    remove_tree(cp.base);
  }
}

void archive_finalize(package_definition &pkg,
                      package_paths const &paths,
                      std::string const &aggregate) {
  pkg.metadata.aggregate_checksum = aggregate;
  pkg.build.migrations = { std::string{ kMigrationScriptsToActions },
                           std::string{ kMigrationPluralizeSetVariable } };
  package_save(pkg, paths.manifest(), fs::perms::owner_read);
}

std::string archive_name(package_definition const &pkg) {
  auto const arch{ pkg.build.architecture.empty() ? pkg.metadata.architecture
                                                  : pkg.build.architecture };
  std::string name{ "bale-package-" + pkg.metadata.name + "-" + arch };
  if (!pkg.metadata.version.empty()) { name += "-" + pkg.metadata.version; }
  return name + (pkg.metadata.uncompressed ? ".tar" : ".tar.zst");
}

fs::path archive_package(package_paths const &paths,
                         package_definition const &pkg,
                         fs::path const &output_dir,
                         int max_size_mb) {
  fs::create_directories(output_dir);
  auto const archive{ output_dir / archive_name(pkg) };

  // stale parts of an earlier split would shadow the new archive
  for (std::uint64_t i{ 0 };; ++i) {
    auto const part{ output_dir / part_name(archive, i) };
    if (!fs::exists(part)) { break; }
    fs::remove(part);
  }

  archive_create(paths.base(),
                 archive,
                 { .compression = pkg.metadata.uncompressed ? archive_compression::none
                                                            : archive_compression::zstd,
                   .prefix = {} });

  auto const limit{ static_cast<std::uint64_t>(max_size_mb) * kMegabyte };
  if (max_size_mb > 0 && fs::file_size(archive) > limit) { return split(archive, limit).front(); }
  return archive;
}

fs::path archive_join_parts(fs::path const &archive, fs::path const &temp_dir) {
  auto original{ archive_of_part(archive) };
  if (original.empty()) {
    if (fs::exists(archive) || !fs::exists(archive.parent_path() / part_name(archive, 0))) {
      return archive;
    }
    original = archive;
  }

  auto const head_path{ original.parent_path() / part_name(original, 0) };
  archive_split_header header;
  try {
    auto const j{ nlohmann::json::parse(util_load_text(head_path)) };
    header = archive_split_header{ .sha256sum = j.at("sha256sum").get<std::string>(),
                                   .bytes = j.at("bytes").get<std::uint64_t>(),
                                   .count = j.at("count").get<std::uint64_t>() };
  } catch (nlohmann::json::exception const &e) {
    throw std::runtime_error("archive_join_parts: invalid header " + head_path.string() + ": " +
                             e.what());
  }

  fs::create_directories(temp_dir);
  auto const joined{ temp_dir / original.filename() };
  {
    file_ptr_t out{ util_open_file(joined, "wb") };
    if (!out) {
      throw std::runtime_error("archive_join_parts: failed to create " + joined.string());
    }
    for (std::uint64_t i{ 1 }; i <= header.count; ++i) {
      auto const part{ original.parent_path() / part_name(original, i) };
      file_ptr_t in{ util_open_file(part, "rb") };
      if (!in) { throw std::runtime_error("archive_join_parts: missing part " + part.string()); }
      copy_stream(in.get(), out.get(), fs::file_size(part), part);
    }
  }

  if (auto const size{ fs::file_size(joined) }; size != header.bytes) {
    throw integrity_error("archive_join_parts: joined size " + std::to_string(size) +
                          " does not match expected " + std::to_string(header.bytes));
  }
  sha256_verify(header.sha256sum, sha256(joined));
  return joined;
}

std::string archive_read_manifest(fs::path const &archive) {
  auto const text{ extract_read_member(archive, std::string{ kPackageFileName }) };
  if (!text) {
    throw std::runtime_error("archive_read_manifest: " + archive.string() + " has no " +
                             std::string{ kPackageFileName });
  }
  return *text;
}

}  // namespace bale
