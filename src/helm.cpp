#include "helm.h"

#include "error.h"
#include "extract.h"
#include "resolver.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include "yaml-cpp/yaml.h"

#include <stdexcept>

namespace bale {
namespace {

std::string scalar(YAML::Node const &node, char const *key) {
  if (!node || !node.IsMap()) { return {}; }
  auto const value{ node[key] };
  return value && value.IsScalar() ? value.as<std::string>() : std::string{};
}

std::filesystem::path package_git_chart(component_chart const &chart, chart_context const &ctx) {
  auto source{ chart.url };
  // a chart version doubles as the git ref when the URL names none
  if (auto const slash{ source.rfind('/') };
      source.find('@', slash == std::string::npos ? 0 : slash) == std::string::npos &&
      !chart.version.empty()) {
    source += "@" + chart.version;
  }

  auto const checkout{ ctx.temp_dir / ("chart-" + chart.name) };
  resolve(source, checkout, { .checksum = {},
                              .extract_path = {},
                              .temp_dir = ctx.temp_dir,
                              .file_root = ctx.file_root,
                              .progress = ctx.progress,
                              .stop = ctx.stop });
  return helm_package_dir(checkout / chart.git_path, ctx.charts_dir);
}

std::filesystem::path package_repo_chart(component_chart const &chart, chart_context const &ctx) {
  auto const name{ chart.repo_name.empty() ? chart.name : chart.repo_name };
  if (chart.version.empty()) {
    throw config_error("helm: chart " + chart.name + " from " + chart.url + " needs a version");
  }

  std::string download{ chart.url };
  if (!extract_is_archive_extension(chart.url)) {
    auto repo{ chart.url };
    while (!repo.empty() && repo.back() == '/') { repo.pop_back(); }
    auto const index_path{ ctx.temp_dir / ("index-" + chart.name + ".yaml") };
    resolve(repo + "/index.yaml", index_path, { .checksum = {},
                                                .extract_path = {},
                                                .temp_dir = ctx.temp_dir,
                                                .file_root = std::nullopt,
                                                .progress = ctx.progress,
                                                .stop = ctx.stop });
    download = helm_index_lookup(util_load_text(index_path), repo, name, chart.version);
  }

  auto const target{ ctx.charts_dir / (chart.name + "-" + chart.version + ".tgz") };
  resolve(download, target, { .checksum = {},
                              .extract_path = {},
                              .temp_dir = ctx.temp_dir,
                              .file_root = std::nullopt,
                              .progress = ctx.progress,
                              .stop = ctx.stop });
  return target;
}

}  // namespace

std::filesystem::path helm_package_dir(std::filesystem::path const &chart_dir,
                                       std::filesystem::path const &charts_dir,
                                       std::string const &expected_version) {
  auto const chart_yaml{ chart_dir / "Chart.yaml" };
  if (!std::filesystem::is_regular_file(chart_yaml)) {
    throw config_error("helm: " + chart_dir.string() + " has no Chart.yaml");
  }

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(chart_yaml.string());
  } catch (YAML::Exception const &e) {
    throw config_error("helm: " + chart_yaml.string() + ": " + e.what());
  }

  auto const name{ scalar(doc, "name") };
  auto const version{ scalar(doc, "version") };
  if (name.empty() || version.empty()) {
    throw config_error("helm: " + chart_yaml.string() + " must set name and version");
  }
  if (!expected_version.empty() && expected_version != version) {
    throw config_error("helm: chart " + name + " is version " + version + ", expected " +
                       expected_version);
  }

  std::filesystem::create_directories(charts_dir);
  auto const target{ charts_dir / (name + "-" + version + ".tgz") };
  archive_create(chart_dir,
                 target,
                 { .compression = archive_compression::gzip, .prefix = name });
  tui::debug("helm: packaged %s", target.string().c_str());
  return target;
}

std::string helm_index_lookup(std::string_view index_yaml,
                              std::string const &repo_url,
                              std::string const &name,
                              std::string const &version) {
  YAML::Node index;
  try {
    index = YAML::Load(std::string{ index_yaml });
  } catch (YAML::Exception const &e) {
    throw std::runtime_error("helm: invalid index.yaml from " + repo_url + ": " + e.what());
  }

  auto const entries{ index.IsMap() ? index["entries"] : YAML::Node{} };
  auto const versions{ entries && entries.IsMap() ? entries[name] : YAML::Node{} };
  if (!versions || !versions.IsSequence()) {
    throw std::runtime_error("helm: chart " + name + " not found in " + repo_url);
  }

  for (auto const &entry : versions) {
    if (scalar(entry, "version") != version) { continue; }
    auto const urls{ entry["urls"] };
    if (!urls || !urls.IsSequence() || urls.size() == 0) { break; }

    auto url{ urls[0].as<std::string>() };
    if (!uri_is_remote(uri_classify(url).scheme)) { url = repo_url + "/" + url; }
    return url;
  }

  throw std::runtime_error("helm: chart " + name + " version " + version + " not found in " +
                           repo_url);
}

std::filesystem::path default_chart_packager::package(component_chart const &chart,
                                                      chart_context const &ctx) {
  if (!chart.local_path.empty()) {
    auto const dir{ uri_resolve_local_file_relative(chart.local_path, ctx.file_root) };
    return helm_package_dir(dir, ctx.charts_dir, chart.version);
  }
  if (chart.url.empty()) {
    throw config_error("helm: chart " + chart.name + " needs a url or localPath");
  }

  switch (uri_classify(chart.url).scheme) {
    case uri_scheme::GIT: return package_git_chart(chart, ctx);
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
      if (!chart.git_path.empty()) {
        throw config_error("helm: chart " + chart.name + " sets gitPath but " + chart.url +
                           " is not a git URL");
      }
      return package_repo_chart(chart, ctx);
    default:
      throw config_error("helm: chart " + chart.name + " has unsupported url " + chart.url);
  }
}

}  // namespace bale
