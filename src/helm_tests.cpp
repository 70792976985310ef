#include "helm.h"

#include "error.h"
#include "extract.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace {

constexpr char const *kIndex{ R"(apiVersion: v1
entries:
  podinfo:
    - name: podinfo
      version: 6.4.1
      urls: [https://charts.example.com/podinfo-6.4.1.tgz]
    - name: podinfo
      version: 6.4.0
      urls: [podinfo-6.4.0.tgz]
)" };

}  // namespace

TEST_CASE("helm_index_lookup resolves absolute and relative chart URLs") {
  CHECK(bale::helm_index_lookup(kIndex, "https://repo.example.com", "podinfo", "6.4.1") ==
        "https://charts.example.com/podinfo-6.4.1.tgz");
  CHECK(bale::helm_index_lookup(kIndex, "https://repo.example.com", "podinfo", "6.4.0") ==
        "https://repo.example.com/podinfo-6.4.0.tgz");
}

TEST_CASE("helm_index_lookup reports missing charts and versions") {
  CHECK_THROWS_WITH_AS(
      bale::helm_index_lookup(kIndex, "https://repo.example.com", "podinfo", "1.0.0"),
      doctest::Contains("version 1.0.0 not found"),
      std::runtime_error);
  CHECK_THROWS_AS(bale::helm_index_lookup(kIndex, "https://repo.example.com", "nginx", "1.0.0"),
                  std::runtime_error);
}

TEST_CASE("default_chart_packager packages a local chart directory") {
  bale::test::temp_dir const tmp{ "bale-helm" };
  bale::test::write_text(tmp / "chart/Chart.yaml", "apiVersion: v2\nname: demo\nversion: 0.1.0\n");
  bale::test::write_text(tmp / "chart/templates/cm.yaml", "kind: ConfigMap\n");

  bale::component_chart chart;
  chart.name = "demo";
  chart.version = "0.1.0";
  chart.local_path = "chart";

  bale::default_chart_packager packager;
  auto const tgz{ packager.package(chart,
                                   { .charts_dir = tmp / "charts",
                                     .temp_dir = tmp / "temp",
                                     .file_root = tmp.path(),
                                     .progress = {},
                                     .stop = {} }) };
  CHECK(tgz == tmp / "charts/demo-0.1.0.tgz");

  bale::extract(tgz, tmp / "unpacked");
  CHECK(std::filesystem::exists(tmp / "unpacked/demo/Chart.yaml"));
  CHECK(std::filesystem::exists(tmp / "unpacked/demo/templates/cm.yaml"));
}

TEST_CASE("helm_package_dir rejects a version mismatch") {
  bale::test::temp_dir const tmp{ "bale-helm" };
  bale::test::write_text(tmp / "chart/Chart.yaml", "name: demo\nversion: 0.2.0\n");
  CHECK_THROWS_AS(bale::helm_package_dir(tmp / "chart", tmp / "charts", "0.1.0"),
                  bale::config_error);
  CHECK_THROWS_AS(bale::helm_package_dir(tmp / "missing", tmp / "charts"), bale::config_error);
}

TEST_CASE("default_chart_packager needs a source") {
  bale::component_chart chart;
  chart.name = "nothing";
  bale::default_chart_packager packager;
  CHECK_THROWS_AS(packager.package(chart, {}), bale::config_error);
}
