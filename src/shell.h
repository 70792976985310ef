#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bale {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
};

enum class shell_choice { bash, sh };

// Output arrives line by line. A stream's own callback runs before on_output_line.
struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  shell_choice shell{ shell_choice::bash };
  std::optional<std::string> stdin_data;  // fed to the child, then closed
};

// Accepts "bash" or "sh"; empty selects bash.
shell_choice shell_parse_choice(std::optional<std::string_view> value);

// Runs `script` through `<shell> -e -c`; the first failing command ends it.
// A child that cannot start (bad cwd, missing shell) exits with 127.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

// Single-quotes value for safe interpolation into a POSIX shell script.
std::string shell_quote(std::string_view value);

shell_env_t shell_getenv();

}  // namespace bale
