#pragma once

#include "package.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bale {

class progress_reporter;

struct action_context {
  std::filesystem::path base_dir;  // relative action dirs resolve against this
  std::map<std::string, std::string> variables;  // filled by setVariables
  progress_reporter *reporter{ nullptr };
};

// Runs `actions` in order with `defaults` applied. Each action gets
// max_retries + 1 attempts within max_total_seconds (0 = unbounded). Trimmed
// stdout of a successful action is stored under each of its setVariables
// names and exported to later actions as BALE_VAR_<NAME>. Throws on the first
// action that exhausts its attempts.
void actions_run(action_defaults const &defaults,
                 std::vector<component_action> const &actions,
                 action_context &ctx);

// Like actions_run, but returns the failure description instead of throwing.
std::optional<std::string> actions_run_failure(action_defaults const &defaults,
                                               std::vector<component_action> const &actions,
                                               action_context &ctx);

}  // namespace bale
