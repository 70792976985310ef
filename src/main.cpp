#include "cli.h"
#include "error.h"
#include "libgit2_util.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <stop_token>
#include <variant>

int main(int argc, char **argv) {
  std::stop_source stop;
  bale::termination_handler_install(stop);
  bale::tui::init();

  auto args{ bale::cli_parse(argc, argv) };
  args.globals.stop = stop.get_token();
  bale::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  bale::libgit2_scope git_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      bale::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    bale::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return bale::cmd::create(cfg, args.globals); },
      *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    bale::tui::error("%s", bale::error_describe(ex).c_str());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
