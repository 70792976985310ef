#include "oci.h"

#include "error.h"
#include "layout.h"
#include "package.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace {

bale::oci::manifest two_layer_manifest(bale::test::mock_remote &r) {
  return bale::oci::manifest{
    .media_type = std::string{ bale::oci::kMediaTypeImageManifest },
    .config = r.add_blob("{}", {}, std::string{ bale::oci::kMediaTypePackageConfig }),
    .layers = { r.add_blob("kind: BalePackageConfig\n", "bale.yaml"),
                r.add_blob("tarball bytes", "components/web.tar") },
    .annotations = {}
  };
}

bale::package_definition sample_package(std::string const &arch) {
  return bale::package_parse("kind: BalePackageConfig\nmetadata:\n  name: demo\n"
                             "  version: 1.2.0+build\n  architecture: " +
                                 arch + "\n",
                             "test");
}

}  // namespace

TEST_CASE("manifest_parse reads artifact blobs as layers") {
  auto const m{ bale::oci::manifest_parse(
      R"({"schemaVersion":2,"mediaType":"application/vnd.oci.artifact.manifest.v1+json",
          "blobs":[{"mediaType":"x","digest":"sha256:aa","size":3,
                    "annotations":{"org.opencontainers.image.title":"bale.yaml"}}]})",
      "") };
  REQUIRE(m.layers.size() == 1);
  CHECK(m.layers[0].title() == "bale.yaml");
  CHECK(m.layers[0].encoded() == "aa");
  CHECK(m.locate("bale.yaml").size == 3);
  CHECK(m.locate("missing").empty());
}

TEST_CASE("manifest_parse rejects invalid JSON") {
  CHECK_THROWS_AS(bale::oci::manifest_parse("{not json", ""), std::runtime_error);
}

TEST_CASE("layer_media_type follows the file extension") {
  CHECK(bale::oci::layer_media_type("a.tar.zst") == "application/vnd.bale.layer.v1.tar+zstd");
  CHECK(bale::oci::layer_media_type("a.tgz") == "application/vnd.bale.layer.v1.unknown");
  CHECK(bale::oci::layer_media_type("bale.yaml") == "application/vnd.bale.layer.v1.yaml");
  CHECK(bale::oci::layer_media_type("images/index.json") ==
        "application/vnd.bale.layer.v1.json");
  CHECK(bale::oci::layer_media_type("checksums.txt") == "application/vnd.bale.layer.v1.txt");
  CHECK(bale::oci::layer_media_type("components/web.tar") ==
        "application/vnd.bale.layer.v1.unknown");
}

TEST_CASE("package_tag uses version and architecture") {
  CHECK(bale::oci::package_tag(sample_package("amd64")) == "1.2.0_build-amd64");
  CHECK(bale::oci::package_tag(sample_package("skeleton")) == "1.2.0_build-skeleton");

  auto unversioned{ sample_package("amd64") };
  unversioned.metadata.version.clear();
  CHECK_THROWS_AS(bale::oci::package_tag(unversioned), bale::config_error);
}

TEST_CASE("pull writes layers by title and skips present files") {
  bale::test::mock_remote r;
  r.add_manifest("1.0.0-amd64", two_layer_manifest(r));
  bale::test::temp_dir const out{ "bale-oci-pull" };

  auto const first{ bale::oci::pull(r, out.path(), bale::oci::platform_for_arch("amd64"), {}) };
  CHECK(first.written.size() == 2);
  CHECK(bale::test::read_text(out / "components/web.tar") == "tarball bytes");
  CHECK(r.blob_fetches() == 2);

  auto const second{ bale::oci::pull(r, out.path(), bale::oci::platform_for_arch("amd64"), {}) };
  CHECK(second.written.empty());
  CHECK(second.skipped.size() == 2);
  CHECK(r.blob_fetches() == 2);
}

TEST_CASE("pull restricted to titles fetches only those layers") {
  bale::test::mock_remote r;
  r.add_manifest("1.0.0-amd64", two_layer_manifest(r));
  bale::test::temp_dir const out{ "bale-oci-pull" };

  bale::oci::copy_options opts;
  opts.only_titles = { "bale.yaml" };
  auto const result{ bale::oci::pull(r, out.path(), bale::oci::platform_for_arch("amd64"), opts) };
  CHECK(result.written.size() == 1);
  CHECK(std::filesystem::exists(out / "bale.yaml"));
  CHECK_FALSE(std::filesystem::exists(out / "components"));
}

TEST_CASE("copy_blob rejects content that does not match its digest") {
  bale::test::mock_remote r;
  auto const desc{ r.add_blob("good", "a.txt") };
  r.corrupt_blob(desc.digest, "evil");
  bale::test::temp_dir const out{ "bale-oci-blob" };

  CHECK_THROWS_AS(bale::oci::copy_blob(r, desc, out / "a.txt"), bale::integrity_error);
  CHECK_FALSE(std::filesystem::exists(out / "a.txt"));
  CHECK(bale::util_list_files(out.path()).empty());
}

TEST_CASE("resolve_root narrows an index to the requested platform") {
  bale::test::mock_remote r;
  auto const arm_manifest{ r.add_manifest("arm", two_layer_manifest(r)) };

  auto arm_entry{ arm_manifest };
  arm_entry.platform = bale::oci::platform{ .os = "linux", .architecture = "arm64", .variant = {} };
  auto const index_body{ std::string{ R"({"schemaVersion":2,"mediaType":")" } +
                         std::string{ bale::oci::kMediaTypeImageIndex } +
                         R"(","manifests":[{"mediaType":")" + arm_entry.media_type +
                         R"(","digest":")" + arm_entry.digest + R"(","size":)" +
                         std::to_string(arm_entry.size) +
                         R"(,"platform":{"os":"linux","architecture":"arm64"}}]})" };
  r.push_manifest("1.0.0-amd64", std::string{ bale::oci::kMediaTypeImageIndex }, index_body);

  auto const root{ bale::oci::resolve_root(r, bale::oci::platform_for_arch("arm64")) };
  CHECK(root.digest == arm_manifest.digest);
  CHECK_THROWS_AS(bale::oci::resolve_root(r, bale::oci::platform_for_arch("amd64")),
                  std::runtime_error);
}

TEST_CASE("publish pushes the build directory and skips existing layers") {
  bale::test::temp_dir const build{ "bale-oci-publish" };
  bale::test::write_text(build / "bale.yaml", "kind: BalePackageConfig\n");
  bale::test::write_text(build / "checksums.txt", "# aggregate: 00\n");
  bale::test::write_text(build / "components/web.tar", "tar");
  bale::package_paths const paths{ build.path() };
  auto const pkg{ sample_package("amd64") };

  bale::test::mock_remote r{ "oci://registry.test/org/demo:1.2.0_build-amd64" };
  auto const desc{ bale::oci::publish(r, paths, pkg, {}) };
  CHECK(r.blob_pushes() == 4);  // three layers plus the config
  CHECK(r.manifest_pushes() == 1);
  REQUIRE(r.manifest_body("1.2.0_build-amd64").has_value());

  auto const m{ bale::oci::manifest_parse(*r.manifest_body("1.2.0_build-amd64"), "") };
  CHECK(m.layers.size() == 3);
  CHECK(m.locate("components/web.tar").media_type == "application/vnd.bale.layer.v1.unknown");
  CHECK(m.config.media_type == bale::oci::kMediaTypePackageConfig);
  CHECK(desc.digest == bale::oci::descriptor_for_bytes("", *r.manifest_body(desc.digest)).digest);

  bale::oci::publish(r, paths, pkg, {});
  CHECK(r.blob_pushes() == 4);
  CHECK(r.manifest_pushes() == 2);

  bale::test::temp_dir const out{ "bale-oci-publish-pull" };
  bale::oci::pull(r, out.path(), bale::oci::platform_for_arch("amd64"), {});
  CHECK(bale::test::read_text(out / "components/web.tar") == "tar");
}
