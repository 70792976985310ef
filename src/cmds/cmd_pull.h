#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace bale {

class cmd_pull : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_pull> {
    std::string url;
    std::filesystem::path output_dir{ "." };
    std::string architecture;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_pull(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace bale
