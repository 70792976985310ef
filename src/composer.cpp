#include "composer.h"

#include "error.h"
#include "image_ref.h"
#include "oci_cache.h"
#include "tui.h"
#include "uri.h"

#include <algorithm>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace bale {
namespace {

namespace fs = std::filesystem;

bool compatible(component const &c, compose_options const &options) {
  if (!c.only.cluster_architecture.empty() && !options.arch.empty() &&
      c.only.cluster_architecture != options.arch) {
    return false;
  }
  return c.only.flavor.empty() || c.only.flavor == options.flavor;
}

void validate_import(component const &c) {
  auto const &imp{ c.import };
  auto const where{ "component \"" + c.name + "\": " };
  if (!imp.path.empty() && !imp.url.empty()) {
    throw config_error(where + "import path and url are mutually exclusive");
  }
  if (imp.path.empty() && imp.url.empty()) {
    throw config_error(where + "import requires a path or a url");
  }
  if (!imp.url.empty() && !is_oci_url(imp.url)) {
    throw config_error(where + "import url must start with " + std::string{ kOciScheme });
  }
  if (!imp.path.empty() && fs::path{ imp.path }.is_absolute()) {
    throw config_error(where + "import path must be relative: " + imp.path);
  }
}

std::size_t find_component(package_definition const &pkg,
                           std::string const &name,
                           compose_options const &options,
                           std::string const &origin) {
  std::optional<std::size_t> found;
  for (std::size_t i{ 0 }; i < pkg.components.size(); ++i) {
    auto const &c{ pkg.components[i] };
    if (c.name != name || !compatible(c, options)) { continue; }
    if (found) {
      throw config_error("multiple components named \"" + name + "\" in " + origin +
                         " match arch '" + options.arch + "' and flavor '" + options.flavor +
                         "'");
    }
    found = i;
  }
  if (!found) {
    throw config_error("component \"" + name + "\" not found in " + origin);
  }
  return *found;
}

std::string rebase(std::string const &value, fs::path const &rel) {
  if (value.empty() || rel.empty()) { return value; }
  if (uri_classify(value).scheme != uri_scheme::LOCAL_FILE_RELATIVE) { return value; }
  return (rel / value).lexically_normal().generic_string();
}

void rebase_actions(action_set &set, fs::path const &rel) {
  set.defaults.dir = rebase(set.defaults.dir, rel);
  for (auto *list : { &set.before, &set.after, &set.on_success, &set.on_failure }) {
    for (auto &action : *list) {
      if (action.dir) { action.dir = rebase(*action.dir, rel); }
    }
  }
}

component rebased(component c, fs::path const &rel) {
  if (rel.empty()) { return c; }
  for (auto &f : c.files) { f.source = rebase(f.source, rel); }
  for (auto &chart : c.charts) {
    chart.local_path = rebase(chart.local_path, rel);
    for (auto &values : chart.values_files) { values = rebase(values, rel); }
  }
  for (auto &m : c.manifests) {
    for (auto &file : m.files) { file = rebase(file, rel); }
    for (auto &k : m.kustomizations) { k = rebase(k, rel); }
  }
  for (auto &d : c.data_injections) { d.source = rebase(d.source, rel); }
  rebase_actions(c.actions.on_create, rel);
  return c;
}

template <typename T, typename Fn>
void append_by_name(std::vector<T> &into, std::vector<T> const &from, Fn merge_same) {
  for (auto const &item : from) {
    auto it{ std::find_if(into.begin(), into.end(), [&](T const &existing) {
      return existing.name == item.name;
    }) };
    if (it == into.end()) {
      into.push_back(item);
    } else {
      merge_same(*it, item);
    }
  }
}

template <typename T>
void append_all(std::vector<T> &into, std::vector<T> const &from) {
  into.insert(into.end(), from.begin(), from.end());
}

// `child` is the composed import so far, `parent` the component importing it.
component merge(component child, component const &parent) {
  child.name = parent.name;
  if (!parent.description.empty()) { child.description = parent.description; }
  child.default_ = parent.default_;
  if (parent.required) { child.required = parent.required; }

  if (!parent.only.local_os.empty()) { child.only.local_os = parent.only.local_os; }
  if (!parent.only.cluster_architecture.empty()) {
    child.only.cluster_architecture = parent.only.cluster_architecture;
  }
  if (!parent.only.cluster_distros.empty()) {
    child.only.cluster_distros = parent.only.cluster_distros;
  }
  if (!parent.only.flavor.empty()) { child.only.flavor = parent.only.flavor; }
  if (parent.only.raw && parent.only.raw.IsMap()) { child.only.raw = parent.only.raw; }

  child.import = {};

  append_all(child.files, parent.files);
  append_all(child.data_injections, parent.data_injections);
  append_by_name(child.charts,
                 parent.charts,
                 [](component_chart &into, component_chart const &from) {
                   append_all(into.values_files, from.values_files);
                 });
  append_by_name(child.manifests,
                 parent.manifests,
                 [](component_manifest &into, component_manifest const &from) {
                   append_all(into.files, from.files);
                   append_all(into.kustomizations, from.kustomizations);
                 });
  append_all(child.images, parent.images);
  append_all(child.repos, parent.repos);

  auto &actions{ child.actions.on_create };
  auto const &overrides{ parent.actions.on_create };
  if (overrides.defaults.raw && overrides.defaults.raw.IsMap()) {
    actions.defaults = overrides.defaults;
  }
  append_all(actions.before, overrides.before);
  append_all(actions.after, overrides.after);
  append_all(actions.on_success, overrides.on_success);
  append_all(actions.on_failure, overrides.on_failure);
  if (parent.actions.raw && parent.actions.raw.IsMap()) {
    child.actions.raw = parent.actions.raw;
  }

  if (parent.raw && parent.raw.IsMap()) { child.raw = parent.raw; }
  return child;
}

void merge_entries(std::vector<YAML::Node> &into, std::vector<YAML::Node> const &from) {
  std::set<std::string> names;
  for (auto const &entry : into) { names.insert(package_entry_name(entry)); }
  for (auto const &entry : from) {
    auto const name{ package_entry_name(entry) };
    if (name.empty() || names.insert(name).second) { into.push_back(entry); }
  }
}

}  // namespace

import_node::import_node(component c,
                         std::size_t index,
                         std::string package_name,
                         std::vector<YAML::Node> variables,
                         std::vector<YAML::Node> constants,
                         std::filesystem::path relative_to_head)
    : c{ std::move(c) },
      index{ index },
      package_name{ std::move(package_name) },
      variables{ std::move(variables) },
      constants{ std::move(constants) },
      relative_to_head{ std::move(relative_to_head) } {}

import_chain::import_chain(component head,
                           std::size_t index,
                           package_definition const &pkg,
                           compose_options const &options) {
  append(std::make_unique<import_node>(std::move(head),
                                       index,
                                       pkg.metadata.name,
                                       pkg.variables,
                                       pkg.constants,
                                       fs::path{}));

  std::set<fs::path> visited{ fs::weakly_canonical(options.base_dir / kPackageFileName) };
  for (;;) {
    auto const &node{ *nodes_.back() };
    if (node.c.import.empty()) { break; }
    validate_import(node.c);

    auto const &imp{ node.c.import };
    auto const name{ imp.name.empty() ? node.c.name : imp.name };
    if (!imp.url.empty()) {
      add_remote_tail(imp.url, name, options);
      break;
    }

    auto const rel{ (node.relative_to_head / imp.path).lexically_normal() };
    auto const file{ fs::weakly_canonical(options.base_dir / rel / kPackageFileName) };
    if (!visited.insert(file).second) {
      throw config_error("component \"" + node.c.name + "\": circular import of " +
                         file.string());
    }

    tui::debug("import_chain: %s imports %s from %s",
               node.c.name.c_str(),
               name.c_str(),
               file.string().c_str());
    auto const imported{ package_load(file) };
    auto const i{ find_component(imported, name, options, file.string()) };
    append(std::make_unique<import_node>(imported.components[i],
                                         i,
                                         imported.metadata.name,
                                         imported.variables,
                                         imported.constants,
                                         rel));
  }
}

void import_chain::append(std::unique_ptr<import_node> node) {
  if (!nodes_.empty()) {
    node->prev = nodes_.back().get();
    nodes_.back()->next = node.get();
  }
  nodes_.push_back(std::move(node));
}

void import_chain::add_remote_tail(std::string const &url,
                                   std::string const &name,
                                   compose_options const &options) {
  if (!options.remotes || !options.cache) {
    throw std::invalid_argument("import_chain: " + url + " needs a remote factory and a cache");
  }

  auto const remote{ options.remotes(oci_ref_parse(url)) };
  auto const root{ oci::fetch_root(*remote, oci::platform_for_arch(kSkeletonArch)) };
  auto const definition{ root.locate(kPackageFileName) };
  if (definition.empty()) {
    throw std::runtime_error("import_chain: " + url + " has no " +
                             std::string{ kPackageFileName });
  }

  auto const pkg{ package_parse(options.cache->read_blob(*remote, definition), url) };
  auto const index{ find_component(pkg, name, options, url) };
  auto const &c{ pkg.components[index] };

  if (!c.import.url.empty()) {
    throw config_error("component \"" + c.name + "\" in " + url +
                       ": nested remote import is not supported");
  }
  if (!c.import.path.empty()) {
    throw config_error("component \"" + c.name + "\" in " + url +
                       ": cannot import local components from remote components");
  }

  auto const tarball{ root.locate("components/" + c.name + ".tar") };
  auto const dir{ options.cache->ensure_dir(*remote, tarball, url, c.name) };

  remote_url_ = url;
  append(std::make_unique<import_node>(c,
                                       index,
                                       pkg.metadata.name,
                                       pkg.variables,
                                       pkg.constants,
                                       fs::relative(dir, fs::absolute(options.base_dir))));
}

component import_chain::compose() const {
  auto composed{ rebased(tail().c, tail().relative_to_head) };
  for (auto const *node{ tail().prev }; node; node = node->prev) {
    composed = merge(std::move(composed), rebased(node->c, node->relative_to_head));
  }
  return composed;
}

std::vector<YAML::Node> import_chain::merged_variables() const {
  std::vector<YAML::Node> out;
  for (auto const &node : nodes_) { merge_entries(out, node->variables); }
  return out;
}

std::vector<YAML::Node> import_chain::merged_constants() const {
  std::vector<YAML::Node> out;
  for (auto const &node : nodes_) { merge_entries(out, node->constants); }
  return out;
}

composed_package compose_package(package_definition const &pkg, compose_options const &options) {
  composed_package out{ .components = {},
                        .variables = pkg.variables,
                        .constants = pkg.constants,
                        .used_oci = false };

  for (std::size_t i{ 0 }; i < pkg.components.size(); ++i) {
    auto const &c{ pkg.components[i] };
    if (!compatible(c, options)) {
      tui::debug("compose: skipping %s (arch '%s', flavor '%s')",
                 c.name.c_str(),
                 options.arch.c_str(),
                 options.flavor.c_str());
      continue;
    }

    import_chain const chain{ c, i, pkg, options };
    if (!chain.remote_url().empty()) { out.used_oci = true; }
    out.components.push_back(chain.compose());
    merge_entries(out.variables, chain.merged_variables());
    merge_entries(out.constants, chain.merged_constants());
  }
  return out;
}

}  // namespace bale
