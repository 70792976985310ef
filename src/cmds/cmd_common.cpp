#include "cmd_common.h"

#include "images.h"
#include "oci_cache.h"
#include "oci_registry.h"
#include "platform.h"

#include <stdexcept>

namespace bale {

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return *cache_root; }

  auto default_cache_root{ platform::get_default_cache_root() };
  if (!default_cache_root) {
    throw std::runtime_error(std::string{ "could not determine cache root: set " } +
                             platform::get_default_cache_root_env_vars() + " or --cache-root");
  }
  return *default_cache_root;
}

cmd_services::cmd_services(cmd_globals const &globals, std::string label)
    : reporter_{ std::move(label) },
      cache_{ std::make_unique<oci_cache>(resolve_cache_root(globals.cache_root)) } {
  registry_options const registry{ .plain_http = globals.plain_http, .credentials = {} };
  oci::remote_factory remotes{ [registry](image_ref const &ref) -> std::unique_ptr<oci::remote> {
    return std::make_unique<registry_remote>(ref, registry);
  } };

  images_ = std::make_unique<registry_image_puller>(remotes, globals.concurrency, &reporter_);
  services_ = packager_services{ .remotes = std::move(remotes),
                                 .cache = cache_.get(),
                                 .charts = &charts_,
                                 .kustomize = &kustomize_,
                                 .git = &git_,
                                 .images = images_.get(),
                                 .sbom = &sbom_,
                                 .reporter = &reporter_,
                                 .stop = globals.stop,
                                 .concurrency = globals.concurrency,
                                 .image_retry_delay = std::chrono::seconds{ 5 } };
}

cmd_services::~cmd_services() = default;

}  // namespace bale
