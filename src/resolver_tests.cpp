#include "resolver.h"

#include "error.h"
#include "extract.h"
#include "sha256.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <stop_token>
#include <string>

namespace {

std::string const kHiSha256{ bale::sha256_hex(std::string_view{ "hi" }) };

}  // namespace

TEST_CASE("resolve copies a relative local file") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "src/a.txt", "hi");

  bale::resolve("a.txt",
                tmp / "out/files/0/a.txt",
                { .checksum = kHiSha256,
                  .extract_path = {},
                  .temp_dir = {},
                  .file_root = tmp / "src",
                  .progress = {},
                  .stop = {} });
  CHECK(bale::test::read_text(tmp / "out/files/0/a.txt") == "hi");
  CHECK(bale::util_list_files(tmp / "out/files/0") == std::vector<std::string>{ "a.txt" });
}

TEST_CASE("resolve never places content that fails its checksum") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "a.txt", "tampered");
  bale::test::write_text(tmp / "out/a.txt", "previous");

  bale::resolve_options opts;
  opts.checksum = kHiSha256;
  opts.file_root = tmp.path();

  CHECK_THROWS_WITH_AS(bale::resolve("a.txt", tmp / "out/a.txt", opts),
                       doctest::Contains("(source: a.txt)"),
                       bale::integrity_error);
  CHECK(bale::test::read_text(tmp / "out/a.txt") == "previous");
  CHECK(bale::util_list_files(tmp / "out") == std::vector<std::string>{ "a.txt" });
}

TEST_CASE("resolve overwrites an existing destination") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "a.txt", "hi");
  bale::test::write_text(tmp / "out/a.txt", "stale");

  bale::resolve_options opts;
  opts.file_root = tmp.path();
  bale::resolve("a.txt", tmp / "out/a.txt", opts);
  CHECK(bale::test::read_text(tmp / "out/a.txt") == "hi");
}

TEST_CASE("resolve copies directories recursively") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "chart/Chart.yaml", "name: demo\n");
  bale::test::write_text(tmp / "chart/templates/cm.yaml", "kind: ConfigMap\n");

  bale::resolve_options opts;
  opts.file_root = tmp.path();
  bale::resolve("chart", tmp / "out/chart", opts);
  CHECK(bale::util_list_files(tmp / "out/chart") ==
        std::vector<std::string>{ "Chart.yaml", "templates/cm.yaml" });
}

TEST_CASE("resolve keeps only the extract path of an archive") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "tree/bin/tool", "hi");
  bale::test::write_text(tmp / "tree/README", "docs");
  bale::archive_create(tmp / "tree", tmp / "tool.tar.gz",
                       { .compression = bale::archive_compression::gzip, .prefix = {} });

  bale::resolve_options opts;
  opts.checksum = kHiSha256;
  opts.extract_path = "bin/tool";
  opts.temp_dir = tmp / "work";
  opts.file_root = tmp.path();
  bale::resolve("tool.tar.gz", tmp / "out/tool", opts);

  CHECK(bale::test::read_text(tmp / "out/tool") == "hi");
  CHECK_FALSE(std::filesystem::exists(tmp / "out/README"));
}

TEST_CASE("resolve wraps fetch failures with the source") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::resolve_options opts;
  opts.file_root = tmp.path();

  try {
    bale::resolve("missing.txt", tmp / "out/missing.txt", opts);
    FAIL("expected an exception");
  } catch (std::exception const &e) {
    auto const text{ bale::error_describe(e) };
    CHECK(text.find("unable to resolve missing.txt") == 0);
    CHECK(text.find("does not exist") != std::string::npos);
  }
  CHECK_FALSE(std::filesystem::exists(tmp / "out/missing.txt"));
}

TEST_CASE("resolve stops when cancellation is requested") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::test::write_text(tmp / "a.txt", "hi");

  std::stop_source source;
  source.request_stop();
  bale::resolve_options opts;
  opts.file_root = tmp.path();
  opts.stop = source.get_token();

  CHECK_THROWS(bale::resolve("a.txt", tmp / "out/a.txt", opts));
  CHECK_FALSE(std::filesystem::exists(tmp / "out/a.txt"));
  CHECK(bale::util_list_files(tmp / "out").empty());
}

TEST_CASE("resolve rejects oci sources as a definition error") {
  bale::test::temp_dir const tmp{ "bale-resolve" };
  bale::resolve_options opts;
  opts.file_root = tmp.path();

  try {
    bale::resolve("oci://ghcr.io/org/files:1.0", tmp / "out/files", opts);
    FAIL("expected an exception");
  } catch (std::exception const &e) {
    CHECK(bale::error_has_cause<bale::config_error>(e));
    CHECK(bale::error_describe(e).find("unsupported source") != std::string::npos);
  }
  CHECK_FALSE(std::filesystem::exists(tmp / "out/files"));
}
