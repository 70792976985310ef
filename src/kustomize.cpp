#include "kustomize.h"

#include "shell.h"
#include "tui.h"
#include "util.h"

#include <stdexcept>
#include <utility>
#include <vector>

namespace bale {

shell_kustomize_builder::shell_kustomize_builder(std::string executable)
    : executable_{ std::move(executable) } {}

void shell_kustomize_builder::build(std::string const &source,
                                    std::filesystem::path const &output,
                                    bool allow_any_directory) {
  std::string script{ shell_quote(executable_) + " build" };
  if (allow_any_directory) { script += " --load-restrictor LoadRestrictionsNone"; }
  script += " " + shell_quote(source);

  std::string rendered;
  std::vector<std::string> errors;
  shell_run_cfg cfg;
  cfg.on_stdout_line = [&](std::string_view line) {
    rendered.append(line);
    rendered.push_back('\n');
  };
  cfg.on_stderr_line = [&](std::string_view line) { errors.emplace_back(line); };
  cfg.env = shell_getenv();

  tui::debug("kustomize: %s", script.c_str());
  auto const result{ shell_run(script, cfg) };
  if (result.exit_code != 0) {
    std::string detail;
    for (auto const &e : errors) { detail += (detail.empty() ? "" : "; ") + e; }
    throw std::runtime_error("kustomize: build of " + source + " failed with exit code " +
                             std::to_string(result.exit_code) +
                             (detail.empty() ? "" : ": " + detail));
  }

  util_write_file(output, rendered);
}

}  // namespace bale
