#include "package.h"

#include "error.h"

#include "doctest/doctest.h"

#include <string>

namespace {

constexpr char const *kSample{ R"(kind: BalePackageConfig
metadata:
  name: demo
  version: 1.0.0
  x-team: platform
components:
  - name: web
    required: true
    x-note: keep me
    files:
      - source: files/a.txt
        target: /opt/a.txt
        shasum: abc
        executable: true
    charts:
      - name: podinfo
        version: 6.4.0
        url: https://stefanprodan.github.io/podinfo
        valuesFiles: [values.yaml]
    images: ["nginx:1.25", "alpine"]
    repos: ["https://github.com/org/app.git@v1.0.0"]
    actions:
      onCreate:
        defaults:
          dir: scripts
        before:
          - cmd: echo hi
            shell:
              linux: sh
              windows: pwsh
            setVariables:
              - name: GREETING
      onDeploy:
        after:
          - cmd: kubectl get pods
variables:
  - name: DOMAIN
    default: example.com
)" };

}  // namespace

TEST_CASE("package_parse reads modeled fields") {
  auto const pkg{ bale::package_parse(kSample, "sample") };

  CHECK(pkg.kind == "BalePackageConfig");
  CHECK(pkg.metadata.name == "demo");
  CHECK(pkg.metadata.version == "1.0.0");
  REQUIRE(pkg.components.size() == 1);

  auto const &web{ pkg.components[0] };
  CHECK(web.name == "web");
  REQUIRE(web.required.has_value());
  CHECK(*web.required);
  REQUIRE(web.files.size() == 1);
  CHECK(web.files[0].executable);
  CHECK(web.files[0].shasum == "abc");
  REQUIRE(web.charts.size() == 1);
  CHECK(web.charts[0].values_files == std::vector<std::string>{ "values.yaml" });
  CHECK(web.images == std::vector<std::string>{ "nginx:1.25", "alpine" });
  CHECK(web.repos.size() == 1);

  auto const &on_create{ web.actions.on_create };
  CHECK(on_create.defaults.dir == "scripts");
  REQUIRE(on_create.before.size() == 1);
  CHECK(on_create.before[0].cmd == "echo hi");
  CHECK(on_create.before[0].set_variables == std::vector<std::string>{ "GREETING" });
#if !defined(__APPLE__)
  REQUIRE(on_create.before[0].shell.has_value());
  CHECK(*on_create.before[0].shell == "sh");
#endif

  REQUIRE(pkg.variables.size() == 1);
  CHECK(bale::package_entry_name(pkg.variables[0]) == "DOMAIN");
}

TEST_CASE("package_emit preserves unknown keys and deploy actions") {
  auto const pkg{ bale::package_parse(kSample, "sample") };
  auto const again{ bale::package_parse(bale::package_emit(pkg), "emitted") };

  CHECK(again.metadata.raw["x-team"].as<std::string>() == "platform");
  CHECK(again.components[0].raw["x-note"].as<std::string>() == "keep me");
  CHECK(again.components[0].actions.raw["onDeploy"]["after"][0]["cmd"].as<std::string>() ==
        "kubectl get pods");
  CHECK(again.components[0].files[0].target == "/opt/a.txt");
}

TEST_CASE("package_emit drops fields that were emptied") {
  auto pkg{ bale::package_parse(kSample, "sample") };
  pkg.components[0].images.clear();
  pkg.components[0].files[0].shasum.clear();
  pkg.metadata.aggregate_checksum = "feed";

  auto const text{ bale::package_emit(pkg) };
  auto const again{ bale::package_parse(text, "emitted") };
  CHECK(again.components[0].images.empty());
  CHECK_FALSE(again.components[0].raw["images"].IsDefined());
  CHECK(again.components[0].files[0].shasum.empty());
  CHECK(again.metadata.aggregate_checksum == "feed");
}

TEST_CASE("package_parse rejects a foreign kind") {
  CHECK_THROWS_AS(bale::package_parse("kind: OtherPackageConfig\nmetadata:\n  name: x\n", "t"),
                  bale::config_error);
}

TEST_CASE("package_parse rejects malformed documents") {
  CHECK_THROWS_AS(bale::package_parse("kind: [unterminated", "t"), bale::config_error);
  CHECK_THROWS_AS(bale::package_parse("- just\n- a list\n", "t"), bale::config_error);
  CHECK_THROWS_AS(
      bale::package_parse("kind: BalePackageConfig\ncomponents:\n  - name: a\n    images: x\n",
                          "t"),
      bale::config_error);
}

TEST_CASE("package_parse requires cmd on actions") {
  CHECK_THROWS_AS(bale::package_parse(R"(kind: BalePackageConfig
metadata: { name: x }
components:
  - name: a
    actions:
      onCreate:
        before:
          - description: nothing to run
)",
                                      "t"),
                  bale::config_error);
}

TEST_CASE("package_validate_unique_components rejects duplicate component names") {
  auto const pkg{ bale::package_parse(R"(kind: BalePackageConfig
metadata: { name: dup }
components:
  - name: a
  - name: a
)",
                                      "t") };
  CHECK_NOTHROW(bale::package_validate(pkg));
  CHECK_THROWS_WITH_AS(bale::package_validate_unique_components(pkg),
                       "package dup: component name \"a\" is not unique",
                       bale::config_error);
}

TEST_CASE("package_validate requires a package name") {
  auto const pkg{ bale::package_parse("kind: BalePackageConfig\n", "t") };
  CHECK_THROWS_AS(bale::package_validate(pkg), bale::config_error);
}
