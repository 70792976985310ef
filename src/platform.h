#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#define BALE_UNREACHABLE() __builtin_unreachable()

namespace bale::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
bool file_exists(std::filesystem::path const &path);

// Fresh private directory "<tmp>/<prefix>-XXXXXX"; the caller removes it.
std::filesystem::path make_temp_dir(std::string_view prefix);

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

std::optional<std::filesystem::path> home_dir();

// Build metadata helpers. Architecture names use the OCI platform vocabulary
// (amd64, arm64).
std::string hostname();
std::string user_name();
std::string_view os_name();
std::string_view arch_name();

std::vector<std::string> get_environment();

bool is_tty();

}  // namespace bale::platform
