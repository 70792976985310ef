#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace bale {

class cmd_publish : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_publish> {
    std::filesystem::path source;  // package archive, split part, or skeleton directory
    std::string url;
    std::optional<std::filesystem::path> signing_key;
    std::string signing_key_password;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_publish(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace bale
