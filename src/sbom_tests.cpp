#include "sbom.h"

#include "sha256.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include "nlohmann/json.hpp"

#include <filesystem>

TEST_CASE("json_sbom_cataloger records sorted files with digests") {
  bale::test::temp_dir const tmp{ "bale-sbom" };
  bale::test::write_text(tmp / "web/files/1/b.txt", "b");
  bale::test::write_text(tmp / "web/files/0/a.txt", "hi");

  bale::json_sbom_cataloger cataloger;
  cataloger.catalog({ .output_dir = tmp / "sboms",
                      .components = { { .name = "web",
                                        .root = tmp / "web",
                                        .files = { tmp / "web/files/1/b.txt",
                                                   tmp / "web/files/0/a.txt" } } },
                      .images = { "docker.io/library/nginx:1.25" } });

  auto const doc{ nlohmann::json::parse(bale::test::read_text(tmp / "sboms/web.json")) };
  CHECK(doc["component"] == "web");
  REQUIRE(doc["files"].size() == 2);
  CHECK(doc["files"][0]["path"] == "files/0/a.txt");
  CHECK(doc["files"][0]["sha256"] == bale::sha256_hex(std::string_view{ "hi" }));
  CHECK(doc["files"][0]["size"] == 2);

  auto const images{ nlohmann::json::parse(bale::test::read_text(tmp / "sboms/images.json")) };
  CHECK(images["images"][0] == "docker.io/library/nginx:1.25");
}

TEST_CASE("json_sbom_cataloger output is deterministic") {
  bale::test::temp_dir const tmp{ "bale-sbom" };
  bale::test::write_text(tmp / "c/files/0/x", "x");
  bale::sbom_request const request{ .output_dir = tmp / "out",
                                    .components = { { .name = "c",
                                                      .root = tmp / "c",
                                                      .files = { tmp / "c/files/0/x" } } },
                                    .images = {} };

  bale::json_sbom_cataloger cataloger;
  cataloger.catalog(request);
  auto const first{ bale::test::read_text(tmp / "out/c.json") };
  cataloger.catalog(request);
  CHECK(bale::test::read_text(tmp / "out/c.json") == first);
  CHECK_FALSE(std::filesystem::exists(tmp / "out/images.json"));
}
