#include "cmd_version.h"

#include "platform.h"
#include "tui.h"
#include "version.h"

#include "CLI11.hpp"
#include "archive.h"
#include "curl/curl.h"
#include "git2.h"
#include "mbedtls/version.h"
#include "nlohmann/json.hpp"
#include "semver.hpp"
#include "tbb/version.h"
#include "zstd.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace bale {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, cmd_globals const & /*globals*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("bale version %s (%s/%s)",
            std::string{ version_string() }.c_str(),
            std::string{ platform::os_name() }.c_str(),
            std::string{ platform::arch_name() }.c_str());
  tui::info("");
  tui::info("Third-party component versions:");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::info("  libgit2: %d.%d.%d", git_major, git_minor, git_revision);

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_ZSTD) { curl_features.push_back("zstd"); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    tui::info("  libcurl: %s (%s)", curl_info->version, features.c_str());
  } else {
    tui::info("  libcurl: %s", curl_info->version);
  }

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  zstd: %s", ZSTD_versionString());
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  nlohmann/json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace bale
