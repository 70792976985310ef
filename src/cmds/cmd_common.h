#pragma once

#include "cmd.h"
#include "git.h"
#include "helm.h"
#include "kustomize.h"
#include "packager.h"
#include "progress.h"
#include "sbom.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace bale {

class image_puller;
class oci_cache;

std::filesystem::path resolve_cache_root(std::optional<std::filesystem::path> const &cache_root);

// Default collaborators behind packager_services, owned for the duration of a
// command: registry remotes, the OCI cache, helm, kustomize, libgit2, the
// registry image puller and the JSON SBOM cataloger.
class cmd_services : unmovable {
 public:
  cmd_services(cmd_globals const &globals, std::string label);
  ~cmd_services();

  packager_services const &get() const { return services_; }

 private:
  progress_reporter reporter_;
  std::unique_ptr<oci_cache> cache_;
  default_chart_packager charts_;
  shell_kustomize_builder kustomize_;
  libgit2_client git_;
  std::unique_ptr<image_puller> images_;
  json_sbom_cataloger sbom_;
  packager_services services_;
};

}  // namespace bale
