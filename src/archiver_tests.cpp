#include "archiver.h"

#include "error.h"
#include "extract.h"
#include "layout.h"
#include "sha256.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <random>
#include <string>

namespace {

namespace fs = std::filesystem;

bale::package_definition sample(bool uncompressed = false) {
  bale::package_definition pkg;
  pkg.metadata.name = "demo";
  pkg.metadata.version = "1.0.0";
  pkg.metadata.architecture = "amd64";
  pkg.metadata.uncompressed = uncompressed;
  return pkg;
}

bale::component named(std::string name) {
  bale::component c;
  c.name = std::move(name);
  return c;
}

std::string noise(std::size_t size) {
  std::mt19937 rng{ 42 };
  std::string out(size, '\0');
  for (auto &c : out) { c = static_cast<char>(rng() & 0xff); }
  return out;
}

}  // namespace

TEST_CASE("archive_components tars content and drops empty components") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  bale::package_paths paths{ tmp / "build" };
  auto const web{ paths.create_component("web") };
  auto const empty{ paths.create_component("empty") };
  bale::test::write_text(web.files / "0/a.txt", "hi");
  bale::test::write_text(web.temp / "scratch", "x");

  bale::archive_components(paths, { named("web"), named("empty") });

  CHECK(fs::exists(paths.component_tarball("web")));
  CHECK_FALSE(fs::exists(web.base));
  CHECK_FALSE(fs::exists(paths.component_tarball("empty")));
  CHECK_FALSE(fs::exists(empty.base));

  CHECK(bale::extract_read_member(paths.component_tarball("web"), "web/files/0/a.txt") == "hi");
  CHECK_FALSE(bale::extract_read_member(paths.component_tarball("web"), "web/temp/scratch"));
}

TEST_CASE("archive_components output is byte-for-byte reproducible") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  std::string digests[2];
  for (int i{ 0 }; i < 2; ++i) {
    bale::package_paths paths{ tmp / ("build" + std::to_string(i)) };
    auto const web{ paths.create_component("web") };
    bale::test::write_text(web.files / "1/b.txt", "b");
    bale::test::write_text(web.files / "0/a.txt", "a");
    bale::archive_components(paths, { named("web") });
    digests[i] = bale::sha256_hex(bale::sha256(paths.component_tarball("web")));
  }
  CHECK(digests[0] == digests[1]);
}

TEST_CASE("archive_finalize records the aggregate and migrations read-only") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  bale::package_paths const paths{ tmp.path() };
  auto pkg{ sample() };

  bale::archive_finalize(pkg, paths, "abc123");
  auto const saved{ bale::package_load(paths.manifest()) };
  CHECK(saved.metadata.aggregate_checksum == "abc123");
  CHECK(saved.build.migrations ==
        std::vector<std::string>{ "scripts-to-actions", "pluralize-set-variable" });
  CHECK((fs::status(paths.manifest()).permissions() & fs::perms::owner_write) == fs::perms::none);

  bale::archive_finalize(pkg, paths, "def456");
  CHECK(bale::package_load(paths.manifest()).metadata.aggregate_checksum == "def456");
}

TEST_CASE("archive_name reflects compression and version") {
  CHECK(bale::archive_name(sample()) == "bale-package-demo-amd64-1.0.0.tar.zst");
  CHECK(bale::archive_name(sample(true)) == "bale-package-demo-amd64-1.0.0.tar");

  auto unversioned{ sample() };
  unversioned.metadata.version.clear();
  CHECK(bale::archive_name(unversioned) == "bale-package-demo-amd64.tar.zst");
}

TEST_CASE("archive_package writes a readable package archive") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  bale::test::write_text(tmp / "build/bale.yaml", "kind: BalePackageConfig\n");
  bale::test::write_text(tmp / "build/checksums.txt", "# aggregate: 00\n");
  bale::package_paths const paths{ tmp / "build" };

  auto const archive{ bale::archive_package(paths, sample(), tmp / "out") };
  CHECK(archive.filename() == "bale-package-demo-amd64-1.0.0.tar.zst");
  CHECK(bale::archive_read_manifest(archive) == "kind: BalePackageConfig\n");
  CHECK(bale::archive_join_parts(archive, tmp / "join") == archive);
}

TEST_CASE("archive_package splits large archives and archive_join_parts restores them") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  bale::test::write_text(tmp / "build/bale.yaml", "kind: BalePackageConfig\n");
  bale::test::write_text(tmp / "build/blob.bin", noise(3 * 1024 * 1024 + 17));
  bale::package_paths const paths{ tmp / "build" };

  auto const head{ bale::archive_package(paths, sample(true), tmp / "out", 1) };
  CHECK(head.filename() == "bale-package-demo-amd64-1.0.0.tar.part000");
  CHECK_FALSE(fs::exists(tmp / "out/bale-package-demo-amd64-1.0.0.tar"));

  auto const header{ nlohmann::json::parse(bale::test::read_text(head)) };
  auto const count{ header["count"].get<std::uint64_t>() };
  CHECK(count == 4);
  CHECK(fs::exists(tmp / "out/bale-package-demo-amd64-1.0.0.tar.part004"));

  auto const joined{ bale::archive_join_parts(tmp / "out/bale-package-demo-amd64-1.0.0.tar.part002",
                                              tmp / "join") };
  CHECK(fs::file_size(joined) == header["bytes"].get<std::uint64_t>());
  CHECK(bale::archive_read_manifest(joined) == "kind: BalePackageConfig\n");

  auto const by_name{ bale::archive_join_parts(tmp / "out/bale-package-demo-amd64-1.0.0.tar",
                                               tmp / "join2") };
  CHECK(bale::sha256_hex(bale::sha256(by_name)) == bale::sha256_hex(bale::sha256(joined)));
}

TEST_CASE("archive_join_parts rejects a corrupted part") {
  bale::test::temp_dir const tmp{ "bale-archive" };
  bale::test::write_text(tmp / "build/blob.bin", noise(2 * 1024 * 1024 + 5));
  bale::package_paths const paths{ tmp / "build" };

  auto const head{ bale::archive_package(paths, sample(true), tmp / "out", 1) };
  auto const part{ tmp / "out/bale-package-demo-amd64-1.0.0.tar.part001" };
  auto content{ bale::test::read_text(part) };
  content[100] = static_cast<char>(content[100] ^ 0x1);
  bale::test::write_text(part, content);

  CHECK_THROWS_AS(bale::archive_join_parts(head, tmp / "join"), bale::integrity_error);
}
