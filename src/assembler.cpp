#include "assembler.h"

#include "actions.h"
#include "error.h"
#include "git.h"
#include "helm.h"
#include "kustomize.h"
#include "progress.h"
#include "resolver.h"
#include "tui.h"
#include "uri.h"

#include <stdexcept>
#include <system_error>

namespace bale {
namespace {

namespace fs = std::filesystem;

bool is_local(std::string const &source) {
  auto const scheme{ uri_classify(source).scheme };
  return scheme == uri_scheme::LOCAL_FILE_ABSOLUTE || scheme == uri_scheme::LOCAL_FILE_RELATIVE;
}

std::string target_name(std::string const &target, std::string const &source) {
  auto name{ fs::path{ target }.filename().string() };
  if (name.empty()) { name = uri_extract_filename(source); }
  if (name.empty()) { name = fs::path{ source }.filename().string(); }
  if (name.empty()) { throw config_error("cannot derive a file name for " + source); }
  return name;
}

void set_mode(fs::path const &path, bool executable) {
  std::error_code ec;
  bool const is_dir{ fs::is_directory(path, ec) };
  auto const mode{ executable || is_dir ? fs::perms::owner_all
                                        : fs::perms::owner_read | fs::perms::owner_write };
  fs::permissions(path, mode, fs::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("assemble: failed to set mode on " + path.string() + ": " +
                             ec.message());
  }
}

class component_assembly {
 public:
  component_assembly(component const &c, component_paths paths, assemble_context &ctx)
      : c_{ c },
        paths_{ std::move(paths) },
        ctx_{ ctx },
        reporter_{ ctx.reporter } {}

  void charts() {
    if (!c_.charts.empty() && !ctx_.charts) {
      throw std::invalid_argument("assemble: no chart packager configured");
    }
    for (auto const &chart : c_.charts) {
      spin("packaging chart " + chart.name);
      ctx_.charts->package(chart, { .charts_dir = paths_.charts,
                                    .temp_dir = paths_.temp,
                                    .file_root = ctx_.base_dir,
                                    .progress = transfer("chart " + chart.name),
                                    .stop = ctx_.stop });

      for (std::size_t i{ 0 }; i < chart.values_files.size(); ++i) {
        resolve(chart.values_files[i],
                paths_.values / (chart.name + "-" + std::to_string(i)),
                options({}, {}));
      }
    }
  }

  void files() {
    for (std::size_t i{ 0 }; i < c_.files.size(); ++i) {
      auto const &file{ c_.files[i] };
      auto const dest{ paths_.files / std::to_string(i) / target_name(file.target, file.source) };
      spin("resolving " + file.source);
      resolve(file.source, dest, options(file.shasum, file.extract_path));
      set_mode(dest, file.executable);
    }
  }

  void data_injections() {
    for (std::size_t i{ 0 }; i < c_.data_injections.size(); ++i) {
      auto const &data{ c_.data_injections[i] };
      auto const dest{ paths_.data / std::to_string(i) /
                       target_name(data.target.path, data.source) };
      spin("resolving " + data.source);
      resolve(data.source, dest, options({}, {}));
    }
  }

  void manifests() {
    for (auto const &m : c_.manifests) {
      for (std::size_t i{ 0 }; i < m.files.size(); ++i) {
        resolve(m.files[i],
                paths_.manifests / (m.name + "-" + std::to_string(i) + ".yaml"),
                options({}, {}));
      }

      if (!m.kustomizations.empty() && !ctx_.kustomize) {
        throw std::invalid_argument("assemble: no kustomize builder configured");
      }
      for (std::size_t i{ 0 }; i < m.kustomizations.size(); ++i) {
        auto const &k{ m.kustomizations[i] };
        auto const source{ is_local(k) ? uri_resolve_local_file_relative(k, ctx_.base_dir).string()
                                       : k };
        spin("building kustomization " + k);
        ctx_.kustomize->build(source,
                              paths_.manifests / ("kustomization-" + m.name + "-" +
                                                  std::to_string(i) + ".yaml"),
                              m.kustomize_allow_any_directory);
      }
    }
  }

  void repos() {
    if (!c_.repos.empty() && !ctx_.git) {
      throw std::invalid_argument("assemble: no git client configured");
    }
    for (auto const &url : c_.repos) {
      spin("cloning " + url);
      ctx_.git->pull(url, paths_.repos, transfer(url), ctx_.stop);
    }
  }

 private:
  resolve_options options(std::string checksum, std::string extract_path) {
    return resolve_options{ .checksum = std::move(checksum),
                            .extract_path = std::move(extract_path),
                            .temp_dir = paths_.temp,
                            .file_root = ctx_.base_dir,
                            .progress = transfer(c_.name),
                            .stop = ctx_.stop };
  }

  fetch_progress_cb_t transfer(std::string what) {
    return transfer_tracker{ reporter_, std::move(what), ctx_.stop };
  }

  void spin(std::string text) {
    if (reporter_) { reporter_->spin(std::move(text)); }
  }

  component const &c_;
  component_paths paths_;
  assemble_context &ctx_;
  progress_reporter *reporter_;
};

void collect(fs::path const &path, std::vector<fs::path> &out) {
  if (!fs::exists(path)) {
    throw std::runtime_error("assemble_sbom_files: " + path.string() + " does not exist");
  }
  if (!fs::is_directory(path)) {
    out.push_back(path);
    return;
  }
  for (auto const &entry : fs::recursive_directory_iterator{ path }) {
    if (entry.is_regular_file()) { out.push_back(entry.path()); }
  }
}

// Copies a local source to `dest` and returns `dest` relative to `base`.
std::string localize(std::string const &source,
                     fs::path const &dest,
                     fs::path const &base,
                     fs::path const &base_dir,
                     std::string const &checksum = {}) {
  resolve(source, dest, { .checksum = checksum,
                          .extract_path = {},
                          .temp_dir = {},
                          .file_root = base_dir,
                          .progress = {},
                          .stop = {} });
  return dest.lexically_relative(base).generic_string();
}

}  // namespace

void assemble_component(component const &c, package_paths &paths, assemble_context &ctx) {
  auto const cpaths{ paths.create_component(c.name) };
  auto const &on_create{ c.actions.on_create };

  action_context actions{ .base_dir = ctx.base_dir,
                          .variables = ctx.variables,
                          .reporter = ctx.reporter };

  tui::info("assembling component %s", c.name.c_str());
  try {
    actions_run(on_create.defaults, on_create.before, actions);

    component_assembly assembly{ c, cpaths, ctx };
    assembly.charts();
    assembly.files();
    assembly.data_injections();
    assembly.manifests();
    assembly.repos();

    actions_run(on_create.defaults, on_create.after, actions);
  } catch (std::exception const &) {
    if (auto const failed{
            actions_run_failure(on_create.defaults, on_create.on_failure, actions) }) {
      tui::debug("component %s: onFailure actions failed: %s", c.name.c_str(), failed->c_str());
    }
    error_rethrow_with_context("unable to add component \"" + c.name + "\"");
  }

  if (auto const failed{ actions_run_failure(on_create.defaults, on_create.on_success, actions) }) {
    if (auto const cleanup{ actions_run_failure(on_create.defaults,
                                                on_create.on_failure,
                                                actions) }) {
      tui::debug("component %s: onFailure actions failed: %s", c.name.c_str(), cleanup->c_str());
    }
    throw std::runtime_error("unable to run component success action: " + *failed);
  }

  ctx.variables = std::move(actions.variables);
}

std::vector<fs::path> assemble_sbom_files(component const &c, component_paths const &paths) {
  std::vector<fs::path> out;
  for (std::size_t i{ 0 }; i < c.files.size(); ++i) {
    collect(paths.files / std::to_string(i) / target_name(c.files[i].target, c.files[i].source),
            out);
  }
  for (std::size_t i{ 0 }; i < c.data_injections.size(); ++i) {
    auto const &data{ c.data_injections[i] };
    collect(paths.data / std::to_string(i) / target_name(data.target.path, data.source), out);
  }
  return out;
}

void assemble_skeleton(component &c, package_paths &paths, fs::path const &base_dir) {
  auto const cpaths{ paths.create_component(c.name) };
  auto const &base{ cpaths.base };

  for (std::size_t i{ 0 }; i < c.files.size(); ++i) {
    auto &file{ c.files[i] };
    if (!is_local(file.source)) { continue; }
    // An archive keeps its own name; the shasum describes the extracted member.
    bool const archive{ !file.extract_path.empty() };
    auto const name{ archive ? fs::path{ file.source }.filename().string()
                             : target_name(file.target, file.source) };
    file.source = localize(file.source,
                           cpaths.files / std::to_string(i) / name,
                           base,
                           base_dir,
                           archive ? std::string{} : file.shasum);
  }

  for (std::size_t i{ 0 }; i < c.charts.size(); ++i) {
    auto &chart{ c.charts[i] };
    if (!chart.local_path.empty()) {
      chart.local_path = localize(chart.local_path,
                                  cpaths.charts / (chart.name + "-" + std::to_string(i)),
                                  base,
                                  base_dir);
    }
    for (std::size_t v{ 0 }; v < chart.values_files.size(); ++v) {
      auto &values{ chart.values_files[v] };
      if (!is_local(values)) { continue; }
      values = localize(values,
                        cpaths.values / (chart.name + "-" + std::to_string(i) + "-" +
                                         std::to_string(v)),
                        base,
                        base_dir);
    }
  }

  for (std::size_t i{ 0 }; i < c.data_injections.size(); ++i) {
    auto &data{ c.data_injections[i] };
    if (!is_local(data.source)) { continue; }
    data.source = localize(data.source,
                           cpaths.data / std::to_string(i) /
                               target_name(data.target.path, data.source),
                           base,
                           base_dir);
  }

  for (auto &m : c.manifests) {
    for (std::size_t i{ 0 }; i < m.files.size(); ++i) {
      if (!is_local(m.files[i])) { continue; }
      m.files[i] = localize(m.files[i],
                            cpaths.manifests / (m.name + "-" + std::to_string(i) + ".yaml"),
                            base,
                            base_dir);
    }
    for (std::size_t i{ 0 }; i < m.kustomizations.size(); ++i) {
      if (!is_local(m.kustomizations[i])) { continue; }
      m.kustomizations[i] = localize(m.kustomizations[i],
                                     cpaths.manifests / ("kustomization-" + m.name + "-" +
                                                         std::to_string(i)),
                                     base,
                                     base_dir);
    }
  }
}

}  // namespace bale
