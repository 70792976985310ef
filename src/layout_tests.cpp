#include "layout.h"

#include "error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>

TEST_CASE("package_paths names the build directory entries") {
  bale::package_paths const paths{ "/build" };
  CHECK(paths.manifest() == "/build/bale.yaml");
  CHECK(paths.signature() == "/build/bale.yaml.sig");
  CHECK(paths.checksums() == "/build/checksums.txt");
  CHECK(paths.images_dir() == "/build/images");
  CHECK(paths.sboms_archive() == "/build/sboms.tar");
  CHECK(paths.component_tarball("web") == "/build/components/web.tar");

  auto const web{ paths.component("web") };
  CHECK(web.base == "/build/components/web");
  CHECK(web.files == "/build/components/web/files");
  CHECK(web.temp == "/build/components/web/temp");
}

TEST_CASE("create_component makes every directory once") {
  bale::test::temp_dir const tmp{ "bale-layout" };
  bale::package_paths paths{ tmp.path() };

  auto const web{ paths.create_component("web") };
  for (auto const &dir :
       { web.files, web.data, web.manifests, web.charts, web.values, web.repos, web.temp }) {
    CHECK(std::filesystem::is_directory(dir));
  }

  CHECK_THROWS_WITH_AS(paths.create_component("web"),
                       "package_paths: component \"web\" already has a directory",
                       bale::config_error);
  CHECK_NOTHROW(paths.create_component("api"));
}

TEST_CASE("create_component rejects names that leave the components directory") {
  bale::test::temp_dir const tmp{ "bale-layout" };
  bale::package_paths paths{ tmp.path() };
  CHECK_THROWS_AS(paths.create_component(""), bale::config_error);
  CHECK_THROWS_AS(paths.create_component(".."), bale::config_error);
  CHECK_THROWS_AS(paths.create_component("a/b"), bale::config_error);
}
