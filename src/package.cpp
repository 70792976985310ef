#include "package.h"

#include "error.h"
#include "util.h"

#include <set>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bale {
namespace {

// ==== reading ====

std::string scalar_or_empty(YAML::Node const &node, char const *key) {
  if (!node || !node.IsMap()) { return {}; }
  auto const value{ node[key] };
  return value && value.IsScalar() ? value.as<std::string>() : std::string{};
}

void expect_map(YAML::Node const &node, std::string const &where) {
  if (node && !node.IsNull() && !node.IsMap()) {
    throw config_error(where + " must be a mapping");
  }
}

std::string read_string(YAML::Node const &node, char const *key, std::string const &where) {
  if (!node || !node.IsMap()) { return {}; }
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return {}; }
  if (!value.IsScalar()) {
    throw config_error(where + "." + key + " must be a scalar");
  }
  return value.as<std::string>();
}

bool read_bool(YAML::Node const &node, char const *key, std::string const &where) {
  if (!node || !node.IsMap()) { return false; }
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return false; }
  try {
    return value.as<bool>();
  } catch (YAML::Exception const &) {
    throw config_error(where + "." + key + " must be a boolean");
  }
}

std::optional<bool> read_opt_bool(YAML::Node const &node,
                                  char const *key,
                                  std::string const &where) {
  if (!node || !node.IsMap()) { return std::nullopt; }
  if (auto const value{ node[key] }; !value || value.IsNull()) { return std::nullopt; }
  return read_bool(node, key, where);
}

std::optional<int> read_opt_int(YAML::Node const &node,
                                char const *key,
                                std::string const &where) {
  if (!node || !node.IsMap()) { return std::nullopt; }
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return std::nullopt; }
  try {
    return value.as<int>();
  } catch (YAML::Exception const &) {
    throw config_error(where + "." + key + " must be an integer");
  }
}

std::vector<std::string> read_strings(YAML::Node const &node,
                                      char const *key,
                                      std::string const &where) {
  std::vector<std::string> result;
  if (!node || !node.IsMap()) { return result; }
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return result; }
  if (!value.IsSequence()) { throw config_error(where + "." + key + " must be a list"); }

  for (auto const &item : value) {
    if (!item.IsScalar()) {
      throw config_error(where + "." + key + " entries must be scalars");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

template <typename T, typename Fn>
std::vector<T> read_list(YAML::Node const &node,
                         char const *key,
                         std::string const &where,
                         Fn parse_item) {
  std::vector<T> result;
  if (!node || !node.IsMap()) { return result; }
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return result; }
  if (!value.IsSequence()) { throw config_error(where + "." + key + " must be a list"); }

  std::size_t idx{ 0 };
  for (auto const &item : value) {
    auto const item_where{ where + "." + key + "[" + std::to_string(idx++) + "]" };
    expect_map(item, item_where);
    result.push_back(parse_item(item, item_where));
  }
  return result;
}

package_metadata parse_metadata(YAML::Node const &node) {
  expect_map(node, "metadata");
  return package_metadata{
    .name = read_string(node, "name", "metadata"),
    .description = read_string(node, "description", "metadata"),
    .version = read_string(node, "version", "metadata"),
    .url = read_string(node, "url", "metadata"),
    .image = read_string(node, "image", "metadata"),
    .authors = read_string(node, "authors", "metadata"),
    .documentation = read_string(node, "documentation", "metadata"),
    .source = read_string(node, "source", "metadata"),
    .vendor = read_string(node, "vendor", "metadata"),
    .architecture = read_string(node, "architecture", "metadata"),
    .aggregate_checksum = read_string(node, "aggregateChecksum", "metadata"),
    .uncompressed = read_bool(node, "uncompressed", "metadata"),
    .raw = node,
  };
}

package_build parse_build(YAML::Node const &node) {
  expect_map(node, "build");
  return package_build{
    .terminal = read_string(node, "terminal", "build"),
    .user = read_string(node, "user", "build"),
    .architecture = read_string(node, "architecture", "build"),
    .timestamp = read_string(node, "timestamp", "build"),
    .version = read_string(node, "version", "build"),
    .migrations = read_strings(node, "migrations", "build"),
    .differential = read_bool(node, "differential", "build"),
    .differential_package_version =
        read_string(node, "differentialPackageVersion", "build"),
    .differential_missing = read_strings(node, "differentialMissing", "build"),
    .registry_overrides = read_strings(node, "registryOverrides", "build"),
    .flavor = read_string(node, "flavor", "build"),
    .raw = node,
  };
}

component_action parse_action(YAML::Node const &node, std::string const &where) {
  component_action action{
    .cmd = read_string(node, "cmd", where),
    .description = read_string(node, "description", where),
    .dir = std::nullopt,
    .env = read_strings(node, "env", where),
    .shell = std::nullopt,
    .max_retries = read_opt_int(node, "maxRetries", where),
    .max_total_seconds = read_opt_int(node, "maxTotalSeconds", where),
    .mute = read_opt_bool(node, "mute", where),
    .set_variables = {},
    .wait = static_cast<bool>(node["wait"]),
    .raw = node,
  };

  if (auto const dir{ node["dir"] }; dir && dir.IsScalar()) {
    action.dir = dir.as<std::string>();
  }

  // shell is either a plain name or a per-OS mapping; only the POSIX keys apply
  if (auto const shell{ node["shell"] }; shell && shell.IsScalar()) {
    action.shell = shell.as<std::string>();
  } else if (shell && shell.IsMap()) {
#if defined(__APPLE__)
    action.shell = read_string(shell, "darwin", where + ".shell");
#else
    action.shell = read_string(shell, "linux", where + ".shell");
#endif
    if (action.shell->empty()) { action.shell.reset(); }
  }

  if (auto const vars{ node["setVariables"] }; vars && vars.IsSequence()) {
    for (auto const &var : vars) {
      if (auto name{ read_string(var, "name", where + ".setVariables") }; !name.empty()) {
        action.set_variables.push_back(std::move(name));
      }
    }
  }

  if (action.cmd.empty() && !action.wait) {
    throw config_error(where + " must define cmd or wait");
  }

  return action;
}

action_set parse_action_set(YAML::Node const &node, std::string const &where) {
  expect_map(node, where);
  auto const defaults_node{ node["defaults"] };
  auto const defaults_where{ where + ".defaults" };
  expect_map(defaults_node, defaults_where);

  return action_set{
    .defaults = action_defaults{ .mute = read_bool(defaults_node, "mute", defaults_where),
                                 .max_total_seconds = read_opt_int(defaults_node,
                                                                   "maxTotalSeconds",
                                                                   defaults_where)
                                                          .value_or(0),
                                 .max_retries =
                                     read_opt_int(defaults_node, "maxRetries", defaults_where)
                                         .value_or(0),
                                 .dir = read_string(defaults_node, "dir", defaults_where),
                                 .env = read_strings(defaults_node, "env", defaults_where),
                                 .shell = scalar_or_empty(defaults_node, "shell"),
                                 .raw = defaults_node },
    .before = read_list<component_action>(node, "before", where, parse_action),
    .after = read_list<component_action>(node, "after", where, parse_action),
    .on_success = read_list<component_action>(node, "onSuccess", where, parse_action),
    .on_failure = read_list<component_action>(node, "onFailure", where, parse_action),
    .raw = node,
  };
}

component parse_component(YAML::Node const &node, std::string const &where) {
  auto const only_node{ node["only"] };
  expect_map(only_node, where + ".only");
  auto const cluster{ only_node ? only_node["cluster"] : YAML::Node{} };

  auto const import_node{ node["import"] };
  expect_map(import_node, where + ".import");

  auto const actions_node{ node["actions"] };
  expect_map(actions_node, where + ".actions");

  component c{
    .name = read_string(node, "name", where),
    .description = read_string(node, "description", where),
    .default_ = read_bool(node, "default", where),
    .required = read_opt_bool(node, "required", where),
    .only = {},
    .import = {},
    .files = read_list<component_file>(
        node,
        "files",
        where,
        [](YAML::Node const &item, std::string const &w) {
          return component_file{ .source = read_string(item, "source", w),
                                 .shasum = read_string(item, "shasum", w),
                                 .target = read_string(item, "target", w),
                                 .executable = read_bool(item, "executable", w),
                                 .symlinks = read_strings(item, "symlinks", w),
                                 .extract_path = read_string(item, "extractPath", w),
                                 .raw = item };
        }),
    .data_injections = read_list<component_data_injection>(
        node,
        "dataInjections",
        where,
        [](YAML::Node const &item, std::string const &w) {
          auto const target{ item["target"] };
          expect_map(target, w + ".target");
          return component_data_injection{
            .source = read_string(item, "source", w),
            .target = data_injection_target{ .namespace_ = read_string(target, "namespace", w),
                                             .selector = read_string(target, "selector", w),
                                             .container = read_string(target, "container", w),
                                             .path = read_string(target, "path", w),
                                             .raw = target },
            .compress = read_bool(item, "compress", w),
            .raw = item,
          };
        }),
    .manifests = read_list<component_manifest>(
        node,
        "manifests",
        where,
        [](YAML::Node const &item, std::string const &w) {
          return component_manifest{
            .name = read_string(item, "name", w),
            .namespace_ = read_string(item, "namespace", w),
            .files = read_strings(item, "files", w),
            .kustomizations = read_strings(item, "kustomizations", w),
            .kustomize_allow_any_directory =
                read_bool(item, "kustomizeAllowAnyDirectory", w),
            .no_wait = read_bool(item, "noWait", w),
            .raw = item,
          };
        }),
    .charts = read_list<component_chart>(
        node,
        "charts",
        where,
        [](YAML::Node const &item, std::string const &w) {
          return component_chart{ .name = read_string(item, "name", w),
                                  .release_name = read_string(item, "releaseName", w),
                                  .version = read_string(item, "version", w),
                                  .namespace_ = read_string(item, "namespace", w),
                                  .url = read_string(item, "url", w),
                                  .repo_name = read_string(item, "repoName", w),
                                  .git_path = read_string(item, "gitPath", w),
                                  .local_path = read_string(item, "localPath", w),
                                  .values_files = read_strings(item, "valuesFiles", w),
                                  .no_wait = read_bool(item, "noWait", w),
                                  .raw = item };
        }),
    .repos = read_strings(node, "repos", where),
    .images = read_strings(node, "images", where),
    .actions = {},
    .raw = node,
  };

  if (only_node) {
    expect_map(cluster, where + ".only.cluster");
    c.only = component_only{
      .local_os = read_string(only_node, "localOS", where + ".only"),
      .cluster_architecture =
          cluster ? read_string(cluster, "architecture", where + ".only.cluster") : "",
      .cluster_distros = cluster ? read_strings(cluster, "distros", where + ".only.cluster")
                                 : std::vector<std::string>{},
      .flavor = read_string(only_node, "flavor", where + ".only"),
      .raw = only_node,
    };
  }

  if (import_node) {
    c.import = component_import{ .name = read_string(import_node, "name", where + ".import"),
                                 .path = read_string(import_node, "path", where + ".import"),
                                 .url = read_string(import_node, "url", where + ".import"),
                                 .raw = import_node };
  }

  if (actions_node) {
    c.actions.raw = actions_node;
    if (auto const on_create{ actions_node["onCreate"] }) {
      c.actions.on_create = parse_action_set(on_create, where + ".actions.onCreate");
    }
  }

  return c;
}

std::vector<YAML::Node> read_entries(YAML::Node const &node, char const *key) {
  std::vector<YAML::Node> result;
  auto const value{ node[key] };
  if (!value || value.IsNull()) { return result; }
  if (!value.IsSequence()) { throw config_error(std::string{ key } + " must be a list"); }
  for (auto const &item : value) { result.push_back(item); }
  return result;
}

// ==== writing ====

YAML::Node start_from(YAML::Node const &raw) {
  if (raw && raw.IsMap()) { return YAML::Clone(raw); }
  return YAML::Node{ YAML::NodeType::Map };
}

void put(YAML::Node &node, char const *key, std::string const &value) {
  if (value.empty()) {
    node.remove(key);
  } else {
    node[key] = value;
  }
}

void put(YAML::Node &node, char const *key, bool value) {
  if (value) {
    node[key] = true;
  } else {
    node.remove(key);
  }
}

void put(YAML::Node &node, char const *key, std::vector<std::string> const &values) {
  if (values.empty()) {
    node.remove(key);
    return;
  }
  YAML::Node seq{ YAML::NodeType::Sequence };
  for (auto const &v : values) { seq.push_back(v); }
  node[key] = seq;
}

void put(YAML::Node &node, char const *key, YAML::Node const &child) {
  if (!child || (child.IsMap() && child.size() == 0) ||
      (child.IsSequence() && child.size() == 0)) {
    node.remove(key);
  } else {
    node[key] = child;
  }
}

template <typename T, typename Fn>
void put_list(YAML::Node &node, char const *key, std::vector<T> const &items, Fn emit_item) {
  YAML::Node seq{ YAML::NodeType::Sequence };
  for (auto const &item : items) { seq.push_back(emit_item(item)); }
  put(node, key, seq);
}

YAML::Node emit_action(component_action const &a) {
  auto node{ start_from(a.raw) };
  put(node, "cmd", a.cmd);
  put(node, "description", a.description);
  if (a.dir) {
    node["dir"] = *a.dir;
  } else {
    node.remove("dir");
  }
  put(node, "env", a.env);
  if (a.max_retries) { node["maxRetries"] = *a.max_retries; }
  if (a.max_total_seconds) { node["maxTotalSeconds"] = *a.max_total_seconds; }
  if (a.mute) { node["mute"] = *a.mute; }
  return node;
}

YAML::Node emit_action_set(action_set const &s) {
  auto node{ start_from(s.raw) };

  auto defaults{ start_from(s.defaults.raw) };
  put(defaults, "mute", s.defaults.mute);
  if (s.defaults.max_total_seconds) {
    defaults["maxTotalSeconds"] = s.defaults.max_total_seconds;
  } else {
    defaults.remove("maxTotalSeconds");
  }
  if (s.defaults.max_retries) {
    defaults["maxRetries"] = s.defaults.max_retries;
  } else {
    defaults.remove("maxRetries");
  }
  put(defaults, "dir", s.defaults.dir);
  put(defaults, "env", s.defaults.env);
  put(node, "defaults", defaults);

  put_list(node, "before", s.before, emit_action);
  put_list(node, "after", s.after, emit_action);
  put_list(node, "onSuccess", s.on_success, emit_action);
  put_list(node, "onFailure", s.on_failure, emit_action);
  return node;
}

YAML::Node emit_component(component const &c) {
  auto node{ start_from(c.raw) };
  put(node, "name", c.name);
  put(node, "description", c.description);
  put(node, "default", c.default_);
  if (c.required) {
    node["required"] = *c.required;
  } else {
    node.remove("required");
  }

  auto only{ start_from(c.only.raw) };
  put(only, "localOS", c.only.local_os);
  auto cluster{ start_from(c.only.raw ? c.only.raw["cluster"] : YAML::Node{}) };
  put(cluster, "architecture", c.only.cluster_architecture);
  put(cluster, "distros", c.only.cluster_distros);
  put(only, "cluster", cluster);
  put(only, "flavor", c.only.flavor);
  put(node, "only", only);

  auto import{ start_from(c.import.raw) };
  put(import, "name", c.import.name);
  put(import, "path", c.import.path);
  put(import, "url", c.import.url);
  put(node, "import", import);

  put_list(node, "files", c.files, [](component_file const &f) {
    auto item{ start_from(f.raw) };
    put(item, "source", f.source);
    put(item, "shasum", f.shasum);
    put(item, "target", f.target);
    put(item, "executable", f.executable);
    put(item, "symlinks", f.symlinks);
    put(item, "extractPath", f.extract_path);
    return item;
  });

  put_list(node, "dataInjections", c.data_injections, [](component_data_injection const &d) {
    auto item{ start_from(d.raw) };
    put(item, "source", d.source);
    auto target{ start_from(d.target.raw) };
    put(target, "namespace", d.target.namespace_);
    put(target, "selector", d.target.selector);
    put(target, "container", d.target.container);
    put(target, "path", d.target.path);
    put(item, "target", target);
    put(item, "compress", d.compress);
    return item;
  });

  put_list(node, "manifests", c.manifests, [](component_manifest const &m) {
    auto item{ start_from(m.raw) };
    put(item, "name", m.name);
    put(item, "namespace", m.namespace_);
    put(item, "files", m.files);
    put(item, "kustomizations", m.kustomizations);
    put(item, "kustomizeAllowAnyDirectory", m.kustomize_allow_any_directory);
    put(item, "noWait", m.no_wait);
    return item;
  });

  put_list(node, "charts", c.charts, [](component_chart const &ch) {
    auto item{ start_from(ch.raw) };
    put(item, "name", ch.name);
    put(item, "releaseName", ch.release_name);
    put(item, "version", ch.version);
    put(item, "namespace", ch.namespace_);
    put(item, "url", ch.url);
    put(item, "repoName", ch.repo_name);
    put(item, "gitPath", ch.git_path);
    put(item, "localPath", ch.local_path);
    put(item, "valuesFiles", ch.values_files);
    put(item, "noWait", ch.no_wait);
    return item;
  });

  put(node, "repos", c.repos);
  put(node, "images", c.images);

  auto actions{ start_from(c.actions.raw) };
  put(actions, "onCreate", emit_action_set(c.actions.on_create));
  put(node, "actions", actions);
  return node;
}

}  // namespace

package_definition package_parse(std::string_view yaml, std::string const &origin) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string{ yaml });
  } catch (YAML::Exception const &e) {
    throw config_error("package_parse: " + origin + ": " + e.what());
  }

  if (!root.IsMap()) {
    throw config_error("package_parse: " + origin + ": document must be a mapping");
  }

  try {
    package_definition pkg{
      .kind = read_string(root, "kind", "package"),
      .metadata = parse_metadata(root["metadata"]),
      .build = parse_build(root["build"]),
      .components = read_list<component>(root, "components", "components", parse_component),
      .constants = read_entries(root, "constants"),
      .variables = read_entries(root, "variables"),
      .raw = root,
    };

    if (pkg.kind != kPackageKind) {
      throw config_error("kind must be " + std::string{ kPackageKind } + ", got '" +
                         pkg.kind + "'");
    }
    return pkg;
  } catch (config_error const &e) {
    throw config_error("package_parse: " + origin + ": " + e.what());
  }
}

package_definition package_load(std::filesystem::path const &path) {
  return package_parse(util_load_text(path), path.string());
}

std::string package_emit(package_definition const &pkg) {
  auto root{ start_from(pkg.raw) };
  root["kind"] = pkg.kind;

  auto metadata{ start_from(pkg.metadata.raw) };
  put(metadata, "name", pkg.metadata.name);
  put(metadata, "description", pkg.metadata.description);
  put(metadata, "version", pkg.metadata.version);
  put(metadata, "url", pkg.metadata.url);
  put(metadata, "image", pkg.metadata.image);
  put(metadata, "authors", pkg.metadata.authors);
  put(metadata, "documentation", pkg.metadata.documentation);
  put(metadata, "source", pkg.metadata.source);
  put(metadata, "vendor", pkg.metadata.vendor);
  put(metadata, "architecture", pkg.metadata.architecture);
  put(metadata, "aggregateChecksum", pkg.metadata.aggregate_checksum);
  put(metadata, "uncompressed", pkg.metadata.uncompressed);
  put(root, "metadata", metadata);

  auto build{ start_from(pkg.build.raw) };
  put(build, "terminal", pkg.build.terminal);
  put(build, "user", pkg.build.user);
  put(build, "architecture", pkg.build.architecture);
  put(build, "timestamp", pkg.build.timestamp);
  put(build, "version", pkg.build.version);
  put(build, "migrations", pkg.build.migrations);
  put(build, "differential", pkg.build.differential);
  put(build, "differentialPackageVersion", pkg.build.differential_package_version);
  put(build, "differentialMissing", pkg.build.differential_missing);
  put(build, "registryOverrides", pkg.build.registry_overrides);
  put(build, "flavor", pkg.build.flavor);
  put(root, "build", build);

  put_list(root, "components", pkg.components, emit_component);
  put_list(root, "constants", pkg.constants, [](YAML::Node const &n) { return YAML::Clone(n); });
  put_list(root, "variables", pkg.variables, [](YAML::Node const &n) { return YAML::Clone(n); });

  YAML::Emitter out;
  out << root;
  if (!out.good()) { throw std::runtime_error("package_emit: " + out.GetLastError()); }
  return std::string{ out.c_str() } + "\n";
}

void package_save(package_definition const &pkg,
                  std::filesystem::path const &path,
                  std::filesystem::perms mode) {
  // A previous finalized manifest is read-only; make room for the rewrite
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) { std::filesystem::remove(path, ec); }

  util_write_file(path, package_emit(pkg));
  std::filesystem::permissions(path, mode, std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("package_save: failed to set permissions on " + path.string() +
                             ": " + ec.message());
  }
}

void package_validate(package_definition const &pkg) {
  if (pkg.metadata.name.empty()) { throw config_error("package metadata.name is required"); }

  for (auto const &c : pkg.components) {
    if (c.name.empty()) {
      throw config_error("package " + pkg.metadata.name + ": component name is required");
    }
  }
}

void package_validate_unique_components(package_definition const &pkg) {
  std::set<std::string> seen;
  for (auto const &c : pkg.components) {
    if (!seen.insert(c.name).second) {
      throw config_error("package " + pkg.metadata.name + ": component name \"" + c.name +
                         "\" is not unique");
    }
  }
}

std::string package_entry_name(YAML::Node const &entry) {
  if (!entry.IsMap()) { return {}; }
  return read_string(entry, "name", "entry");
}

}  // namespace bale
