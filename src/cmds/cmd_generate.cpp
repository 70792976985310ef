#include "cmd_generate.h"

#include "packager.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace bale {

void cmd_generate::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *generate{ app.add_subcommand("generate", "Generate definitions") };
  generate->require_subcommand(1);
  auto *sub{ generate->add_subcommand("package", "Create or update a package definition") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("name", cfg_ptr->name, "Package name")->required();
  sub->add_option("-f,--file", cfg_ptr->file, "Definition file to create or update");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_generate::cmd_generate(cmd_generate::cfg cfg, cmd_globals const & /*globals*/)
    : cfg_{ std::move(cfg) } {}

void cmd_generate::execute() {
  auto const pkg{ package_generate(cfg_.name, cfg_.file) };
  tui::info("wrote %s for package %s", cfg_.file.string().c_str(), pkg.metadata.name.c_str());
}

}  // namespace bale
