#include "git.h"

#include "resolver.h"
#include "sha256.h"
#include "tui.h"

#include <string_view>
#include <utility>

namespace bale {
namespace {

// "https://host/org/repo.git@v1" -> ("https://host/org/repo.git", "v1")
std::pair<std::string, std::string> split_ref(std::string const &url) {
  auto const slash{ url.rfind('/') };
  auto const at{ url.find('@', slash == std::string::npos ? 0 : slash) };
  if (at == std::string::npos) { return { url, {} }; }
  return { url.substr(0, at), url.substr(at + 1) };
}

}  // namespace

std::string git_url_ref(std::string const &url) { return split_ref(url).second; }

std::string git_repo_dir_name(std::string const &url) {
  auto const base{ split_ref(url).first };

  std::string_view name{ base };
  while (!name.empty() && name.back() == '/') { name.remove_suffix(1); }
  if (auto const slash{ name.rfind('/') }; slash != std::string_view::npos) {
    name.remove_prefix(slash + 1);
  }
  if (name.ends_with(".git")) { name.remove_suffix(4); }

  return std::string{ name } + "-" + sha256_hex(std::string_view{ base }).substr(0, 10);
}

std::filesystem::path libgit2_client::pull(std::string const &url,
                                           std::filesystem::path const &repos_dir,
                                           fetch_progress_cb_t const &progress,
                                           std::stop_token stop) {
  auto const checkout{ repos_dir / git_repo_dir_name(url) };
  tui::debug("git: cloning %s into %s", url.c_str(), checkout.string().c_str());
  resolve(url, checkout, { .checksum = {},
                           .extract_path = {},
                           .temp_dir = {},
                           .file_root = std::nullopt,
                           .progress = progress,
                           .stop = std::move(stop) });
  return checkout;
}

}  // namespace bale
