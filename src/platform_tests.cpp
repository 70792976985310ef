#include "platform.h"

#include "doctest/doctest.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace bale {
namespace {

// Overrides an environment variable for the scope of a test case.
class env_override {
 public:
  env_override(char const *name, char const *value) : name_{ name } {
    if (char const *prev{ std::getenv(name) }) { previous_ = prev; }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~env_override() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

}  // namespace

TEST_CASE("platform::get_default_cache_root prefers BALE_CACHE_ROOT") {
  env_override root{ "BALE_CACHE_ROOT", "/tmp/bale-explicit" };
  env_override xdg{ "XDG_CACHE_HOME", "/tmp/xdg" };

  auto const result{ platform::get_default_cache_root() };
  REQUIRE(result.has_value());
  CHECK(*result == std::filesystem::path{ "/tmp/bale-explicit" });
}

#ifndef __APPLE__
TEST_CASE("platform::get_default_cache_root falls back to XDG_CACHE_HOME") {
  env_override root{ "BALE_CACHE_ROOT", nullptr };
  env_override xdg{ "XDG_CACHE_HOME", "/tmp/xdg" };

  auto const result{ platform::get_default_cache_root() };
  REQUIRE(result.has_value());
  CHECK(*result == std::filesystem::path{ "/tmp/xdg" } / "bale");
}

TEST_CASE("platform::get_default_cache_root falls back to HOME") {
  env_override root{ "BALE_CACHE_ROOT", nullptr };
  env_override xdg{ "XDG_CACHE_HOME", nullptr };
  env_override home{ "HOME", "/home/someone" };

  auto const result{ platform::get_default_cache_root() };
  REQUIRE(result.has_value());
  CHECK(*result == std::filesystem::path{ "/home/someone" } / ".cache" / "bale");
}
#endif

TEST_CASE("platform::home_dir honors HOME") {
  env_override home{ "HOME", "/home/tester" };
  auto const result{ platform::home_dir() };
  REQUIRE(result.has_value());
  CHECK(*result == std::filesystem::path{ "/home/tester" });
}

TEST_CASE("platform::arch_name uses OCI vocabulary") {
  auto const arch{ platform::arch_name() };
  CHECK((arch == "amd64" || arch == "arm64"));
}

TEST_CASE("platform::atomic_rename moves files and reports failures") {
  auto const dir{ std::filesystem::temp_directory_path() / "bale-platform-rename" };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto const from{ dir / "from" };
  std::FILE *f{ std::fopen(from.c_str(), "w") };
  REQUIRE(f != nullptr);
  std::fclose(f);

  platform::atomic_rename(from, dir / "to");
  CHECK_FALSE(platform::file_exists(from));
  CHECK(platform::file_exists(dir / "to"));

  CHECK_THROWS_AS(platform::atomic_rename(dir / "missing", dir / "other"),
                  std::system_error);
  std::filesystem::remove_all(dir);
}

TEST_CASE("platform::get_environment returns KEY=VALUE entries") {
  env_override marker{ "BALE_PLATFORM_TEST_MARKER", "yes" };
  bool found{ false };
  for (auto const &entry : platform::get_environment()) {
    if (entry == "BALE_PLATFORM_TEST_MARKER=yes") { found = true; }
  }
  CHECK(found);
}

TEST_CASE("platform::make_temp_dir creates distinct directories") {
  auto const a{ platform::make_temp_dir("bale-platform") };
  auto const b{ platform::make_temp_dir("bale-platform") };
  CHECK(a != b);
  CHECK(std::filesystem::is_directory(a));
  CHECK(a.filename().string().starts_with("bale-platform-"));
  std::filesystem::remove_all(a);
  std::filesystem::remove_all(b);
}

}  // namespace bale
