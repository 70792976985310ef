#include "checksums.h"

#include "error.h"
#include "layout.h"
#include "sha256.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <string>

namespace {

void populate(bale::test::temp_dir const &tmp) {
  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\n");
  bale::test::write_text(tmp / "bale.yaml.sig", "c2ln");
  bale::test::write_text(tmp / "components/web.tar", "tar");
  bale::test::write_text(tmp / "images/index.json", "{}");
}

}  // namespace

TEST_CASE("checksums_generate lists sorted entries and an aggregate line") {
  bale::test::temp_dir const tmp{ "bale-checksums" };
  populate(tmp);
  bale::package_paths const paths{ tmp.path() };

  auto const manifest{ bale::checksums_generate(paths) };
  REQUIRE(manifest.entries.size() == 2);
  CHECK(manifest.entries[0].path == "components/web.tar");
  CHECK(manifest.entries[1].path == "images/index.json");
  CHECK(manifest.entries[0].sha256 == bale::sha256_hex(std::string_view{ "tar" }));

  auto const text{ bale::test::read_text(tmp / "checksums.txt") };
  CHECK(text == manifest.render());
  CHECK(text.find(bale::sha256_hex(std::string_view{ "tar" }) + "  components/web.tar\n") == 0);
  CHECK(text.ends_with("# aggregate: " + manifest.aggregate + "\n"));
  CHECK(manifest.aggregate == bale::sha256_hex(std::string_view{ manifest.render_entries() }));
}

TEST_CASE("checksums aggregate follows content and ignores excluded files") {
  bale::test::temp_dir const tmp{ "bale-checksums" };
  populate(tmp);
  bale::package_paths const paths{ tmp.path() };
  auto const first{ bale::checksums_generate(paths).aggregate };

  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\nmetadata: {}\n");
  CHECK(bale::checksums_generate(paths).aggregate == first);

  bale::test::write_text(tmp / "components/web.tar", "changed");
  CHECK(bale::checksums_generate(paths).aggregate != first);
}

TEST_CASE("checksums_parse round-trips and rejects tampering") {
  bale::test::temp_dir const tmp{ "bale-checksums" };
  populate(tmp);
  auto const manifest{ bale::checksums_generate(bale::package_paths{ tmp.path() }) };

  auto const parsed{ bale::checksums_parse(manifest.render()) };
  CHECK(parsed.aggregate == manifest.aggregate);
  CHECK(parsed.entries.size() == manifest.entries.size());

  auto tampered{ manifest.render() };
  tampered.replace(0, 1, tampered[0] == 'a' ? "b" : "a");
  CHECK_THROWS_AS(bale::checksums_parse(tampered), bale::integrity_error);
  CHECK_THROWS_AS(bale::checksums_parse("not a checksum line\n"), bale::integrity_error);
}

TEST_CASE("checksums_verify detects modified files and a foreign aggregate") {
  bale::test::temp_dir const tmp{ "bale-checksums" };
  populate(tmp);
  auto const manifest{ bale::checksums_generate(bale::package_paths{ tmp.path() }) };

  CHECK_NOTHROW(bale::checksums_verify(tmp.path(), manifest.aggregate));
  CHECK_THROWS_WITH_AS(bale::checksums_verify(tmp.path(), std::string(64, '0')),
                       doctest::Contains("aggregate checksum mismatch"),
                       bale::integrity_error);

  bale::test::write_text(tmp / "images/index.json", "{\"evil\":true}");
  CHECK_THROWS_WITH_AS(bale::checksums_verify(tmp.path(), manifest.aggregate),
                       doctest::Contains("images/index.json"),
                       bale::integrity_error);
  CHECK_NOTHROW(bale::checksums_verify(tmp.path(), manifest.aggregate, { "images/index.json" }));
}
