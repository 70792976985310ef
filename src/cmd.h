#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>

namespace bale {

// Options shared by every subcommand.
struct cmd_globals {
  std::optional<std::filesystem::path> cache_root;  // --cache-root
  bool plain_http{ false };                         // --plain-http
  int concurrency{ 3 };                             // --concurrency
  std::stop_token stop;                             // set from the termination handler
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cmd_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cmd_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace bale
