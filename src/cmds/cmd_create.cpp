#include "cmd_create.h"

#include "cmd_common.h"
#include "image_ref.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace bale {

void cmd_create::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("create", "Create a package from a bale.yaml definition") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("directory", cfg_ptr->directory, "Directory holding bale.yaml")
      ->check(CLI::ExistingDirectory);
  sub->add_option("-o,--output",
                  cfg_ptr->output,
                  "Output directory, or oci://registry/namespace to publish directly");
  sub->add_option("-a,--architecture",
                  cfg_ptr->architecture,
                  "Architecture to build for (defaults to metadata.architecture, then the host)");
  sub->add_option("-f,--flavor", cfg_ptr->flavor, "Flavor of components to include");
  sub->add_option("--registry-override",
                  cfg_ptr->registry_overrides,
                  "Pull images through another registry, as from=to (repeatable)");
  sub->add_option("--differential",
                  cfg_ptr->differential,
                  "Earlier package to build a differential package against");
  sub->add_option("--signing-key", cfg_ptr->signing_key, "PEM private key to sign bale.yaml")
      ->check(CLI::ExistingFile);
  sub->add_option("--signing-key-pass",
                  cfg_ptr->signing_key_password,
                  "Password of the signing key");
  sub->add_option("-m,--max-package-size",
                  cfg_ptr->max_package_size_mb,
                  "Split the archive into parts of this many MiB (0 disables)")
      ->check(CLI::NonNegativeNumber);
  sub->add_flag("--skip-sbom", cfg_ptr->skip_sbom, "Do not catalog SBOMs");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_create::cmd_create(cmd_create::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_create::execute() {
  cmd_services const owned{ globals_, "create" };
  auto services{ owned.get() };
  if (cfg_.skip_sbom) { services.sbom = nullptr; }

  create_options options;
  options.base_dir = cfg_.directory;
  if (is_oci_url(cfg_.output)) {
    options.publish_url = cfg_.output;
  } else {
    options.output_dir = cfg_.output;
  }
  options.architecture = cfg_.architecture;
  options.flavor = cfg_.flavor;
  options.registry_overrides = cfg_.registry_overrides;
  options.differential = cfg_.differential;
  options.signing_key = cfg_.signing_key;
  options.signing_key_password = cfg_.signing_key_password;
  options.max_package_size_mb = cfg_.max_package_size_mb;

  auto const result{ package_create(options, services) };
  tui::info("aggregate checksum %s", result.aggregate.c_str());
}

}  // namespace bale
