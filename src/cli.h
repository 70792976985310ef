#pragma once

#include "cmd.h"
#include "cmds/cmd_create.h"
#include "cmds/cmd_generate.h"
#include "cmds/cmd_inspect.h"
#include "cmds/cmd_publish.h"
#include "cmds/cmd_pull.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace bale {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_create::cfg,
                                 cmd_generate::cfg,
                                 cmd_inspect::cfg,
                                 cmd_publish::cfg,
                                 cmd_pull::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cmd_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace bale
