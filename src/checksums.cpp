#include "checksums.h"

#include "error.h"
#include "layout.h"
#include "package.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <set>

namespace bale {
namespace {

constexpr std::string_view kAggregatePrefix{ "# aggregate: " };

bool is_hex_digest(std::string_view value) {
  return value.size() == 64 && std::ranges::all_of(value, [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

}  // namespace

std::string checksum_manifest::render_entries() const {
  std::string out;
  for (auto const &e : entries) { out += e.sha256 + "  " + e.path + "\n"; }
  return out;
}

std::string checksum_manifest::render() const {
  return render_entries() + std::string{ kAggregatePrefix } + aggregate + "\n";
}

checksum_manifest checksums_generate(package_paths const &paths) {
  auto const &base{ paths.base() };
  std::set<std::string> const excluded{
    paths.manifest().lexically_relative(base).generic_string(),
    paths.signature().lexically_relative(base).generic_string(),
    paths.checksums().lexically_relative(base).generic_string(),
  };

  checksum_manifest manifest;
  for (auto const &rel : util_list_files(base)) {
    if (excluded.contains(rel)) { continue; }
    manifest.entries.push_back({ .path = rel, .sha256 = sha256_hex(sha256(base / rel)) });
  }
  manifest.aggregate = sha256_hex(std::string_view{ manifest.render_entries() });

  util_write_file(paths.checksums(), manifest.render());
  tui::debug("checksums: %zu entries, aggregate %s",
             manifest.entries.size(),
             manifest.aggregate.c_str());
  return manifest;
}

checksum_manifest checksums_parse(std::string_view text) {
  checksum_manifest manifest;
  std::string stated;

  std::size_t pos{ 0 };
  while (pos < text.size()) {
    auto const end{ text.find('\n', pos) };
    auto const line{ text.substr(pos, end == std::string_view::npos ? end : end - pos) };
    pos = end == std::string_view::npos ? text.size() : end + 1;
    if (line.empty()) { continue; }

    if (line.starts_with(kAggregatePrefix)) {
      stated = std::string{ util_trim(line.substr(kAggregatePrefix.size())) };
      continue;
    }

    auto const sep{ line.find("  ") };
    if (sep == std::string_view::npos || !is_hex_digest(line.substr(0, sep)) ||
        sep + 2 >= line.size()) {
      throw integrity_error("checksums_parse: malformed line '" + std::string{ line } + "'");
    }
    manifest.entries.push_back({ .path = std::string{ line.substr(sep + 2) },
                                 .sha256 = std::string{ line.substr(0, sep) } });
  }

  manifest.aggregate = sha256_hex(std::string_view{ manifest.render_entries() });
  if (!stated.empty() && stated != manifest.aggregate) {
    throw integrity_error("checksums_parse: aggregate line " + stated +
                          " does not match the entries (" + manifest.aggregate + ")");
  }
  return manifest;
}

void checksums_verify(std::filesystem::path const &dir,
                      std::string const &expected_aggregate,
                      std::vector<std::string> const &skip) {
  auto const manifest{ checksums_parse(util_load_text(dir / "checksums.txt")) };
  if (manifest.aggregate != expected_aggregate) {
    throw integrity_error("checksums_verify: aggregate checksum mismatch: expected " +
                          expected_aggregate + " but got " + manifest.aggregate);
  }

  for (auto const &entry : manifest.entries) {
    if (std::ranges::find(skip, entry.path) != skip.end()) { continue; }
    try {
      sha256_verify(entry.sha256, sha256(dir / entry.path));
    } catch (integrity_error const &e) {
      throw integrity_error(entry.path + ": " + e.what());
    }
  }
}

}  // namespace bale
