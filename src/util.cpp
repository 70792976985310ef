#include "util.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace bale {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

int util_hex_char_to_int(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_text(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) { throw std::runtime_error("util_load_text: failed to open " + path.string()); }

  std::string content;
  std::array<char, 64 * 1024> chunk;
  for (;;) {
    std::size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.append(chunk.data(), n);
    if (n < chunk.size()) { break; }
  }
  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_text: failed to read " + path.string());
  }
  return content;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  if (auto const parent{ path.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("util_write_file: failed to create " + parent.string() +
                               ": " + ec.message());
    }
  }

  auto const staging{ util_partial_path(path) };
  {
    std::ofstream out{ staging, std::ios::binary | std::ios::trunc };
    if (!out) {
      throw std::runtime_error("util_write_file: failed to open " + staging.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out.flush()) {
      throw std::runtime_error("util_write_file: failed to write " + staging.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    std::filesystem::remove(staging, ec);
    throw std::runtime_error("util_write_file: failed to rename into " + path.string());
  }
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

std::string_view util_trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

std::filesystem::path util_partial_path(std::filesystem::path const &target) {
  // pid + counter keeps concurrent writers of the same target apart
  static std::atomic<unsigned> counter{ 0 };
  auto const id{ std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) };
  return target.parent_path() / ("." + target.filename().string() + "." + id + ".partial");
}

std::vector<std::string> util_list_files(std::filesystem::path const &root) {
  std::vector<std::string> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it{ root, ec };
  if (ec) {
    throw std::runtime_error("util_list_files: failed to open " + root.string() + ": " +
                             ec.message());
  }

  for (auto const end{ std::filesystem::recursive_directory_iterator{} }; it != end;
       it.increment(ec)) {
    if (ec) {
      throw std::runtime_error("util_list_files: failed to walk " + root.string() +
                               ": " + ec.message());
    }
    if (it->is_symlink() || it->is_regular_file()) {
      files.push_back(it->path().lexically_relative(root).generic_string());
    }
  }
  if (ec) {
    throw std::runtime_error("util_list_files: failed to walk " + root.string() + ": " +
                             ec.message());
  }

  std::ranges::sort(files);
  return files;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace bale
