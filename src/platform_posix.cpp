#include "platform.h"

#include <pwd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

extern "C" char **environ;

namespace bale::platform {

std::optional<std::filesystem::path> get_default_cache_root() {
  // BALE_CACHE_ROOT takes precedence
  if (char const *env_root{ std::getenv("BALE_CACHE_ROOT") }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "bale";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }; xdg_cache && *xdg_cache) {
    return std::filesystem::path{ xdg_cache } / "bale";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "bale";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "BALE_CACHE_ROOT or HOME";
#else
  return "BALE_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

std::optional<std::filesystem::path> home_dir() {
  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home };
  }
  if (passwd const *pw{ ::getpwuid(::getuid()) }; pw && pw->pw_dir) {
    return std::filesystem::path{ pw->pw_dir };
  }
  return std::nullopt;
}

std::string hostname() {
  char buf[256]{};
  if (::gethostname(buf, sizeof buf - 1) != 0) { return {}; }
  return buf;
}

std::string user_name() {
  if (passwd const *pw{ ::getpwuid(::getuid()) }; pw && pw->pw_name) {
    return pw->pw_name;
  }
  if (char const *user{ std::getenv("USER") }) { return user; }
  return {};
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

bool file_exists(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

std::filesystem::path make_temp_dir(std::string_view prefix) {
  auto tmpl{ (std::filesystem::temp_directory_path() / (std::string{ prefix } + "-XXXXXX"))
                 .string() };
  if (::mkdtemp(tmpl.data()) == nullptr) {
    throw std::system_error(errno, std::system_category(), "Failed to create " + tmpl);
  }
  return tmpl;
}

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

std::string_view arch_name() {
#if defined(__aarch64__) || defined(__arm64__)
  return "arm64";
#elif defined(__x86_64__)
  return "amd64";
#else
#error "unsupported architecture"
#endif
}

std::vector<std::string> get_environment() {
  std::vector<std::string> result;
  for (char **ep = environ; *ep; ++ep) { result.emplace_back(*ep); }
  return result;
}

}  // namespace bale::platform
