#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bale {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "bale - package assembly and distribution for air-gapped environments" };
  app.require_subcommand(0, 1);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  cli_args args{};

  std::string cache_root;
  app.add_option("--cache-root",
                 cache_root,
                 "Cache root directory (defaults to BALE_CACHE_ROOT, XDG_CACHE_HOME/bale, "
                 "~/.cache/bale)");
  app.add_flag("--plain-http",
               args.globals.plain_http,
               "Talk to registries over plain HTTP instead of HTTPS");
  app.add_option("--concurrency",
                 args.globals.concurrency,
                 "Maximum parallel layer and image transfers")
      ->check(CLI::PositiveNumber);

  // Support version flags (-v / --version) triggering version command directly.
  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_create::register_cli(app, on_selected);
  cmd_publish::register_cli(app, on_selected);
  cmd_pull::register_cli(app, on_selected);
  cmd_inspect::register_cli(app, on_selected);
  cmd_generate::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (!cache_root.empty()) { args.globals.cache_root = std::filesystem::path{ cache_root }; }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace bale
