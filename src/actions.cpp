#include "actions.h"

#include "error.h"
#include "progress.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include <chrono>
#include <stdexcept>

namespace bale {
namespace {

void put_env(shell_env_t &env, std::string const &entry, std::string const &where) {
  auto const eq{ entry.find('=') };
  if (eq == std::string::npos || eq == 0) {
    throw config_error("actions: " + where + ": env entry '" + entry + "' is not KEY=value");
  }
  env[entry.substr(0, eq)] = entry.substr(eq + 1);
}

std::string describe(component_action const &action) {
  return action.description.empty() ? action.cmd : action.description;
}

void run_one(action_defaults const &defaults,
             component_action const &action,
             action_context &ctx) {
  if (action.wait) {
    throw config_error("actions: wait conditions only apply at deploy time");
  }

  auto const dir{ action.dir.value_or(defaults.dir) };
  std::filesystem::path cwd{ ctx.base_dir };
  if (!dir.empty()) {
    std::filesystem::path const d{ dir };
    cwd = d.is_absolute() ? d : ctx.base_dir / d;
  }

  shell_env_t env{ shell_getenv() };
  for (auto const &[name, value] : ctx.variables) { env["BALE_VAR_" + name] = value; }
  for (auto const &e : defaults.env) { put_env(env, e, describe(action)); }
  for (auto const &e : action.env) { put_env(env, e, describe(action)); }

  bool const mute{ action.mute.value_or(defaults.mute) };
  int const retries{ action.max_retries.value_or(defaults.max_retries) };
  int const max_seconds{ action.max_total_seconds.value_or(defaults.max_total_seconds) };
  auto const choice{ shell_parse_choice(action.shell ? *action.shell : defaults.shell) };

  auto const deadline{ std::chrono::steady_clock::now() + std::chrono::seconds(max_seconds) };
  int const attempts{ retries < 0 ? 1 : retries + 1 };

  run_output output{ ctx.reporter };
  for (int attempt{ 1 };; ++attempt) {
    std::string captured;
    output.on_command_start(action.cmd);

    shell_run_cfg cfg;
    cfg.on_output_line = [&](std::string_view line) {
      output.on_output_line(line);
      if (!mute) { tui::info("%.*s", static_cast<int>(line.size()), line.data()); }
    };
    cfg.on_stdout_line = [&](std::string_view line) {
      captured.append(line);
      captured.push_back('\n');
    };
    cfg.cwd = cwd;
    cfg.env = env;
    cfg.shell = choice;

    auto const result{ shell_run(action.cmd, cfg) };
    if (result.exit_code == 0) {
      auto const value{ std::string{ util_trim(captured) } };
      for (auto const &name : action.set_variables) { ctx.variables[name] = value; }
      return;
    }

    bool const out_of_time{ max_seconds > 0 && std::chrono::steady_clock::now() >= deadline };
    if (attempt >= attempts || out_of_time) {
      throw std::runtime_error("actions: \"" + describe(action) + "\" failed with exit code " +
                               std::to_string(result.exit_code) +
                               (out_of_time ? " (time limit reached)" : ""));
    }
    tui::warn("action \"%s\" failed with exit code %d, retrying (%d/%d)",
              describe(action).c_str(),
              result.exit_code,
              attempt,
              attempts - 1);
  }
}

}  // namespace

void actions_run(action_defaults const &defaults,
                 std::vector<component_action> const &actions,
                 action_context &ctx) {
  for (auto const &action : actions) {
    tui::debug("actions: running %s", describe(action).c_str());
    run_one(defaults, action, ctx);
  }
}

std::optional<std::string> actions_run_failure(action_defaults const &defaults,
                                               std::vector<component_action> const &actions,
                                               action_context &ctx) {
  try {
    actions_run(defaults, actions, ctx);
  } catch (std::exception const &e) { return error_describe(e); }
  return std::nullopt;
}

}  // namespace bale
