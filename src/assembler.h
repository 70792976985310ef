#pragma once

#include "layout.h"
#include "package.h"

#include <filesystem>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace bale {

class chart_packager;
class git_client;
class kustomize_builder;
class progress_reporter;

struct assemble_context {
  std::filesystem::path base_dir;  // relative sources resolve against this
  chart_packager *charts{ nullptr };
  kustomize_builder *kustomize{ nullptr };
  git_client *git{ nullptr };
  progress_reporter *reporter{ nullptr };
  std::stop_token stop;
  std::map<std::string, std::string> variables;  // setVariables results, carried across components
};

// Materializes one component into its build directory:
//   onCreate.before, charts (+ values), files, data injections, manifests
//   (+ kustomizations), repos, onCreate.after.
// A failure runs onCreate.onFailure and is rethrown wrapped as
// `unable to add component "<name>"`. After success onCreate.onSuccess runs;
// its failure also runs onFailure and raises "unable to run component success
// action".
void assemble_component(component const &c, package_paths &paths, assemble_context &ctx);

// Materialized files and data injections of `c`, directories expanded to the
// regular files below them.
std::vector<std::filesystem::path> assemble_sbom_files(component const &c,
                                                       component_paths const &paths);

// Copies the component's local content (files, chart directories, values
// files, manifests, kustomization directories, data injections) into its
// build directory and rewrites those paths relative to the component
// directory. Remote sources, images and repos are left untouched.
void assemble_skeleton(component &c, package_paths &paths, std::filesystem::path const &base_dir);

}  // namespace bale
