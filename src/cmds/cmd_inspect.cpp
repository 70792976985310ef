#include "cmd_inspect.h"

#include "cmd_common.h"
#include "image_ref.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace bale {

void cmd_inspect::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("inspect", "Print the bale.yaml of a package") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("package",
                  cfg_ptr->source,
                  "Package archive, one of its split parts, or oci:// reference")
      ->required();
  sub->add_option("-k,--key", cfg_ptr->key, "Public key to verify the package signature")
      ->check(CLI::ExistingFile);
  sub->add_option("--sbom-out", cfg_ptr->sbom_out, "Directory to extract SBOMs into");
  sub->add_option("-a,--architecture",
                  cfg_ptr->architecture,
                  "Architecture of an oci:// package (defaults to the host)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_inspect::cmd_inspect(cmd_inspect::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_inspect::execute() {
  std::optional<cmd_services> owned;
  packager_services services;
  if (is_oci_url(cfg_.source)) {
    owned.emplace(globals_, "inspect");
    services = owned->get();
  }

  auto const text{ package_inspect({ .source = cfg_.source,
                                     .key = cfg_.key,
                                     .sbom_out = cfg_.sbom_out,
                                     .architecture = cfg_.architecture },
                                   services) };
  tui::print_stdout("%s", text.c_str());
  if (cfg_.key) { tui::info("signature verified"); }
}

}  // namespace bale
