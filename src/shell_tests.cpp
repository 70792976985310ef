#include "shell.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> run_collect(std::string_view script,
                                     std::optional<fs::path> cwd = std::nullopt,
                                     bale::shell_env_t env = bale::shell_getenv()) {
  std::vector<std::string> lines;
  bale::shell_run_cfg inv{ .on_output_line =
                               [&](std::string_view line) { lines.emplace_back(line); },
                           .cwd = cwd,
                           .env = std::move(env),
                           .shell = bale::shell_choice::bash };
  auto const result{ bale::shell_run(script, inv) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(!result.signal.has_value());
  return lines;
}

}  // namespace

TEST_CASE("shell_getenv captures PATH") {
  auto env{ bale::shell_getenv() };
  REQUIRE(!env.empty());
  CHECK(env.find("PATH") != env.end());
}

TEST_CASE("shell_parse_choice supports bash and sh") {
  CHECK(bale::shell_parse_choice(std::nullopt) == bale::shell_choice::bash);
  CHECK(bale::shell_parse_choice("") == bale::shell_choice::bash);
  CHECK(bale::shell_parse_choice("bash") == bale::shell_choice::bash);
  CHECK(bale::shell_parse_choice("sh") == bale::shell_choice::sh);
  CHECK_THROWS_AS(bale::shell_parse_choice("powershell"), std::invalid_argument);
}

TEST_CASE("shell_quote survives embedded single quotes") {
  CHECK(bale::shell_quote("plain") == "'plain'");
  CHECK(bale::shell_quote("it's") == "'it'\\''s'");

  auto lines{ run_collect("printf '%s\\n' " + bale::shell_quote("a 'quoted' $HOME")) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "a 'quoted' $HOME");
}

TEST_CASE("shell_run executes multiple lines") {
  auto lines{ run_collect("echo first\nprintf 'second\\n'\n") };
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "first");
  CHECK(lines[1] == "second");
}

TEST_CASE("shell_run exposes custom environment variables") {
  auto env{ bale::shell_getenv() };
  env["BALE_SHELL_TEST"] = "ok";
  auto lines{ run_collect("printf '%s\\n' \"$BALE_SHELL_TEST\"", std::nullopt, env) };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "ok");
}

TEST_CASE("shell_run surfaces non-zero exit codes") {
  bale::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                           .env = bale::shell_getenv() };
  auto const result{ bale::shell_run("exit 7", inv) };
  CHECK(result.exit_code == 7);
  CHECK(!result.signal.has_value());
}

TEST_CASE("shell_run delivers trailing partial lines") {
  auto lines{ run_collect("printf 'without-newline'") };
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "without-newline");
}

TEST_CASE("shell_run propagates callback exceptions") {
  bale::shell_run_cfg inv{ .on_output_line =
                               [](std::string_view) { throw std::runtime_error("test"); },
                           .env = bale::shell_getenv() };
  CHECK_THROWS_AS(bale::shell_run("echo hi", inv), std::runtime_error);
}

TEST_CASE("shell_run handles empty script") {
  auto lines{ run_collect("") };
  CHECK(lines.empty());
}

TEST_CASE("shell_run respects working directory") {
  auto lines{ run_collect("pwd", fs::path{ "/tmp" }) };
  REQUIRE(lines.size() == 1);
  CHECK(fs::weakly_canonical(fs::path{ lines[0] }) == fs::weakly_canonical("/tmp"));
}

TEST_CASE("shell_run handles invalid working directory") {
  bale::shell_run_cfg inv{ .on_output_line = [](std::string_view) {},
                           .cwd = "/nonexistent/directory/path",
                           .env = bale::shell_getenv() };
  auto const result{ bale::shell_run("echo hi", inv) };
  CHECK(result.exit_code == 127);
}

TEST_CASE("shell_run delivers split stdout/stderr callbacks") {
  std::vector<std::string> stdout_lines;
  std::vector<std::string> stderr_lines;
  std::vector<std::string> all_lines;
  bale::shell_run_cfg inv{
    .on_output_line = [&](std::string_view line) { all_lines.emplace_back(line); },
    .on_stdout_line = [&](std::string_view line) { stdout_lines.emplace_back(line); },
    .on_stderr_line = [&](std::string_view line) { stderr_lines.emplace_back(line); },
    .env = bale::shell_getenv(),
  };
  auto const result{ bale::shell_run(
      "printf 'out1\\n'; >&2 printf 'err1\\n'; printf 'out2\\n'; >&2 printf 'err2\\n'",
      inv) };
  REQUIRE(result.exit_code == 0);
  CHECK(stdout_lines == std::vector<std::string>{ "out1", "out2" });
  CHECK(stderr_lines == std::vector<std::string>{ "err1", "err2" });
  CHECK(all_lines.size() == 4);
}

TEST_CASE("shell_run feeds stdin_data to the child") {
  std::vector<std::string> lines;
  bale::shell_run_cfg inv{ .on_stdout_line =
                               [&](std::string_view line) { lines.emplace_back(line); },
                           .env = bale::shell_getenv(),
                           .shell = bale::shell_choice::sh,
                           .stdin_data = std::string{ "registry.example.com" } };
  auto const result{ bale::shell_run("host=$(cat); printf 'got %s\\n' \"$host\"", inv) };
  REQUIRE(result.exit_code == 0);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "got registry.example.com");
}

TEST_CASE("shell_run handles large output") {
  std::vector<std::string> lines;
  bale::shell_run_cfg inv{ .on_output_line =
                               [&](std::string_view line) { lines.emplace_back(line); },
                           .env = bale::shell_getenv() };
  auto const result{ bale::shell_run("for i in {1..1000}; do printf '%0100d\\n' $i; done",
                                     inv) };
  REQUIRE(result.exit_code == 0);
  CHECK(lines.size() == 1000);
  CHECK(lines[999].size() == 100);
}

TEST_CASE("shell_run stops at the first failing command") {
  for (auto const choice : { bale::shell_choice::bash, bale::shell_choice::sh }) {
    std::vector<std::string> lines;
    bale::shell_run_cfg inv{ .on_output_line =
                                 [&](std::string_view line) { lines.emplace_back(line); },
                             .env = bale::shell_getenv(),
                             .shell = choice };
    auto const result{ bale::shell_run("echo before\nfalse\necho after", inv) };
    CHECK(result.exit_code == 1);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "before");
  }
}

TEST_CASE("shell_run exit mid-script") {
  std::vector<std::string> lines;
  bale::shell_run_cfg inv{ .on_output_line =
                               [&](std::string_view line) { lines.emplace_back(line); },
                           .env = bale::shell_getenv() };
  auto const result{ bale::shell_run("echo line1\nexit 42\necho line2", inv) };
  CHECK(result.exit_code == 42);
  REQUIRE(lines.size() == 1);
  CHECK(lines[0] == "line1");
  CHECK(std::find(lines.begin(), lines.end(), "line2") == lines.end());
}

TEST_CASE("shell_run tolerates a child that never reads stdin_data") {
  bale::shell_run_cfg inv{ .env = bale::shell_getenv(),
                           .shell = bale::shell_choice::sh,
                           .stdin_data = std::string{ "unused" } };
  auto const result{ bale::shell_run("exit 0", inv) };
  CHECK(result.exit_code == 0);
}
