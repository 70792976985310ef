#include "cmd_pull.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace bale {

void cmd_pull::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("pull", "Pull a published package and verify its checksums") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("url", cfg_ptr->url, "Package reference, oci://registry/repository:tag")
      ->required();
  sub->add_option("-o,--output-directory", cfg_ptr->output_dir, "Directory to pull into");
  sub->add_option("-a,--architecture",
                  cfg_ptr->architecture,
                  "Architecture to pull (defaults to the host)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_pull::cmd_pull(cmd_pull::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_pull::execute() {
  cmd_services const owned{ globals_, "pull" };
  auto const pkg{ package_pull({ .url = cfg_.url,
                                 .output_dir = cfg_.output_dir,
                                 .architecture = cfg_.architecture },
                               owned.get()) };
  tui::info("pulled %s %s into %s",
            pkg.metadata.name.c_str(),
            pkg.metadata.version.c_str(),
            cfg_.output_dir.string().c_str());
}

}  // namespace bale
