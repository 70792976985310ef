#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace bale {

class cmd_create : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_create> {
    std::filesystem::path directory{ "." };
    std::string output{ "." };  // directory, or oci://registry/namespace to publish
    std::string architecture;
    std::string flavor;
    std::vector<std::string> registry_overrides;  // "from=to"
    std::optional<std::filesystem::path> differential;
    std::optional<std::filesystem::path> signing_key;
    std::string signing_key_password;
    int max_package_size_mb{ 0 };
    bool skip_sbom{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_create(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace bale
