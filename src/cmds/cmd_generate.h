#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace bale {

class cmd_generate : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_generate> {
    std::string name;
    std::filesystem::path file{ "bale.yaml" };
  };

  // Registers "generate package".
  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_generate(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace bale
