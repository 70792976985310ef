#include "oci_cache.h"

#include "extract.h"
#include "sha256.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

TEST_CASE("oci_cache fetches a blob once") {
  bale::test::temp_dir const root{ "bale-cache" };
  bale::oci_cache cache{ root.path() };
  bale::test::mock_remote r;
  auto const desc{ r.add_blob("kind: BalePackageConfig\n", "bale.yaml") };

  auto const first{ cache.ensure_blob(r, desc) };
  auto const second{ cache.ensure_blob(r, desc) };
  CHECK(first == second);
  CHECK(first == root / "oci/blobs/sha256" / desc.encoded());
  CHECK(cache.read_blob(r, desc) == "kind: BalePackageConfig\n");
  CHECK(r.blob_fetches(desc.digest) == 1);
}

TEST_CASE("oci_cache leaves nothing behind when a fetch fails") {
  bale::test::temp_dir const root{ "bale-cache" };
  bale::oci_cache cache{ root.path() };
  bale::test::mock_remote r;
  auto const desc{ r.add_blob("payload") };
  r.fail_next_fetches(1);

  CHECK_THROWS_AS(cache.ensure_blob(r, desc), std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(cache.blob_path(desc)));

  cache.ensure_blob(r, desc);
  CHECK(r.blob_fetches(desc.digest) == 2);
}

TEST_CASE("oci_cache extracts component tarballs once") {
  bale::test::temp_dir const work{ "bale-cache-src" };
  bale::test::write_text(work / "web/files/0/a.txt", "hi");
  bale::archive_create(work / "web", work / "web.tar", { .compression = {}, .prefix = "web" });

  bale::test::mock_remote r;
  auto const tarball{ r.add_blob(bale::test::read_text(work / "web.tar"), "components/web.tar") };

  bale::test::temp_dir const root{ "bale-cache" };
  bale::oci_cache cache{ root.path() };
  auto const dir{ cache.ensure_dir(r, tarball, "oci://registry.test/org/pkg", "web") };
  CHECK(dir == root / "oci/dirs" / tarball.encoded());
  CHECK(bale::test::read_text(dir / "files/0/a.txt") == "hi");

  CHECK(cache.ensure_dir(r, tarball, "oci://registry.test/org/pkg", "web") == dir);
  CHECK(r.blob_fetches() == 1);
}

TEST_CASE("oci_cache creates an empty directory for components without content") {
  bale::test::temp_dir const root{ "bale-cache" };
  bale::oci_cache cache{ root.path() };
  bale::test::mock_remote r;

  auto const dir{ cache.ensure_dir(r, {}, "oci://registry.test/org/pkg", "empty") };
  CHECK(std::filesystem::is_directory(dir));
  CHECK(dir.filename() == bale::sha256_hex(std::string_view{ "oci://registry.test/org/pkgempty" }));
  CHECK(r.blob_fetches() == 0);
}
