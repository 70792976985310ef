#include "actions.h"

#include "error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace {

bale::component_action cmd(std::string text) {
  bale::component_action a;
  a.cmd = std::move(text);
  return a;
}

}  // namespace

TEST_CASE("actions_run stores trimmed stdout in setVariables") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  auto greet{ cmd("echo '  hello  '") };
  greet.set_variables = { "GREETING" };
  auto use{ cmd("printf '%s' \"$BALE_VAR_GREETING\" > out.txt") };

  bale::actions_run({}, { greet, use }, ctx);
  CHECK(ctx.variables.at("GREETING") == "hello");
  CHECK(bale::test::read_text(tmp / "out.txt") == "hello");
}

TEST_CASE("actions_run applies defaults and per-action overrides") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  std::filesystem::create_directories(tmp / "scripts");
  std::filesystem::create_directories(tmp / "other");
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  bale::action_defaults defaults;
  defaults.dir = "scripts";
  defaults.env = { "COLOR=blue" };

  auto in_default{ cmd("printf '%s' \"$COLOR\" > color.txt") };
  auto in_other{ cmd("printf '%s' \"$COLOR\" > color.txt") };
  in_other.dir = "other";
  in_other.env = { "COLOR=red" };

  bale::actions_run(defaults, { in_default, in_other }, ctx);
  CHECK(bale::test::read_text(tmp / "scripts/color.txt") == "blue");
  CHECK(bale::test::read_text(tmp / "other/color.txt") == "red");
}

TEST_CASE("actions_run retries up to max_retries") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  auto flaky{ cmd("n=$(cat count 2>/dev/null || echo 0); n=$((n+1)); echo $n > count; "
                  "[ $n -ge 3 ]") };
  flaky.max_retries = 2;
  bale::actions_run({}, { flaky }, ctx);
  CHECK(bale::test::read_text(tmp / "count") == "3\n");
}

TEST_CASE("actions_run stops at the first failing action") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  auto failing{ cmd("exit 4") };
  failing.description = "broken step";
  CHECK_THROWS_WITH_AS(bale::actions_run({}, { failing, cmd("touch never") }, ctx),
                       "actions: \"broken step\" failed with exit code 4",
                       std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(tmp / "never"));
}

TEST_CASE("actions_run_failure returns the error instead of throwing") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  auto const failed{ bale::actions_run_failure({}, { cmd("exit 1") }, ctx) };
  REQUIRE(failed.has_value());
  CHECK(failed->find("exit code 1") != std::string::npos);
  CHECK_FALSE(bale::actions_run_failure({}, { cmd("true") }, ctx).has_value());
}

TEST_CASE("actions_run rejects deploy-time wait actions and bad env entries") {
  bale::test::temp_dir const tmp{ "bale-actions" };
  bale::action_context ctx{ .base_dir = tmp.path(), .variables = {}, .reporter = nullptr };

  bale::component_action wait;
  wait.wait = true;
  CHECK_THROWS_AS(bale::actions_run({}, { wait }, ctx), bale::config_error);

  auto bad_env{ cmd("true") };
  bad_env.env = { "NOEQUALS" };
  CHECK_THROWS_AS(bale::actions_run({}, { bad_env }, ctx), bale::config_error);
}
