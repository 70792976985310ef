#pragma once

#include "fetch_progress.h"

#include <filesystem>
#include <stop_token>
#include <string>

namespace bale {

// Clones repository URLs ("url[@ref]") into a component's repos directory.
class git_client {
 public:
  virtual ~git_client() = default;

  // Returns the checkout directory, repos_dir / git_repo_dir_name(url).
  virtual std::filesystem::path pull(std::string const &url,
                                     std::filesystem::path const &repos_dir,
                                     fetch_progress_cb_t const &progress,
                                     std::stop_token stop) = 0;
};

class libgit2_client : public git_client {
 public:
  std::filesystem::path pull(std::string const &url,
                             std::filesystem::path const &repos_dir,
                             fetch_progress_cb_t const &progress,
                             std::stop_token stop) override;
};

// "<repo-name>-<hash>": the last path segment without ".git" and a short
// sha256 of the URL without its ref, so one repository at different refs
// shares a directory name.
std::string git_repo_dir_name(std::string const &url);

// Ref part of "url@ref", or empty.
std::string git_url_ref(std::string const &url);

}  // namespace bale
