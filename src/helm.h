#pragma once

#include "fetch_progress.h"
#include "package.h"

#include <filesystem>
#include <optional>
#include <stop_token>

namespace bale {

struct chart_context {
  std::filesystem::path charts_dir;  // packaged charts land here
  std::filesystem::path temp_dir;
  std::optional<std::filesystem::path> file_root;
  fetch_progress_cb_t progress;
  std::stop_token stop;
};

// Produces a packaged chart (<name>-<version>.tgz) for a component chart.
class chart_packager {
 public:
  virtual ~chart_packager() = default;
  virtual std::filesystem::path package(component_chart const &chart,
                                        chart_context const &ctx) = 0;
};

// Local chart directories, charts inside git repositories (gitPath), and HTTP
// Helm repositories located through their index.yaml.
class default_chart_packager : public chart_packager {
 public:
  std::filesystem::path package(component_chart const &chart,
                                chart_context const &ctx) override;
};

// Tars a chart directory as <charts_dir>/<name>-<version>.tgz with the chart
// name as the top-level directory. Name and version come from Chart.yaml;
// a declared version that disagrees is a config_error.
std::filesystem::path helm_package_dir(std::filesystem::path const &chart_dir,
                                       std::filesystem::path const &charts_dir,
                                       std::string const &expected_version = {});

// Download URL for `name` at `version` from a Helm repository index document.
std::string helm_index_lookup(std::string_view index_yaml,
                              std::string const &repo_url,
                              std::string const &name,
                              std::string const &version);

}  // namespace bale
