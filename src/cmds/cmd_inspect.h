#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace bale {

class cmd_inspect : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_inspect> {
    std::string source;  // archive, split part, or oci:// reference
    std::optional<std::filesystem::path> key;
    std::optional<std::filesystem::path> sbom_out;
    std::string architecture;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_inspect(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace bale
