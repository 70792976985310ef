#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bale {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Convert single hex character to value (0-15). Returns -1 if invalid.
int util_hex_char_to_int(char c);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Whole file as bytes in a string. Throws std::runtime_error if it cannot be read.
std::string util_load_text(std::filesystem::path const &path);

// Writes content to path through a sibling temp file and an atomic rename, so
// readers never observe a partially written file. Creates parent directories.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

std::string_view util_trim(std::string_view value);

// Sibling path used to stage content before it is renamed over `target`,
// e.g. "dir/.name.partial".
std::filesystem::path util_partial_path(std::filesystem::path const &target);

// Relative path of every regular file and symlink under root, '/'-separated and
// sorted bytewise. Throws on I/O errors.
std::vector<std::string> util_list_files(std::filesystem::path const &root);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});  // removes the current target now
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace bale
