#include "fetch.h"

#include "error.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace {

std::filesystem::path make_temp_dir(char const *name) {
  auto const dir{ std::filesystem::temp_directory_path() /
                  (std::string{ "bale-fetch-" } + name) };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

TEST_CASE("fetch_request_for rejects empty sources") {
  CHECK_THROWS_AS(bale::fetch_request_for("", "ignored", std::nullopt), bale::config_error);
}

TEST_CASE("fetch_request_for rejects unsupported schemes") {
  CHECK_THROWS_AS(bale::fetch_request_for("foo://bucket/object", "ignored", std::nullopt),
                  bale::config_error);
  CHECK_THROWS_AS(bale::fetch_request_for("oci://ghcr.io/org/pkg:1.0", "ignored", {}),
                  bale::config_error);
}

TEST_CASE("fetch_request_for maps schemes to request variants") {
  CHECK(std::holds_alternative<bale::fetch_request_https>(
      bale::fetch_request_for("https://example.com/a.tgz", "out", {})));
  CHECK(std::holds_alternative<bale::fetch_request_http>(
      bale::fetch_request_for("http://example.com/a.tgz", "out", {})));
  CHECK(std::holds_alternative<bale::fetch_request_file>(
      bale::fetch_request_for("files/a.txt", "out", std::filesystem::path{ "/root" })));
}

TEST_CASE("fetch_request_for splits git refs") {
  auto const with_ref{ bale::fetch_request_for("https://example.com/org/repo.git@v1.2.0",
                                               "out",
                                               {}) };
  REQUIRE(std::holds_alternative<bale::fetch_request_git>(with_ref));
  auto const &git{ std::get<bale::fetch_request_git>(with_ref) };
  CHECK(git.source == "https://example.com/org/repo.git");
  CHECK(git.ref == "v1.2.0");

  auto const no_ref{ bale::fetch_request_for("https://example.com/org/repo.git", "out", {}) };
  REQUIRE(std::holds_alternative<bale::fetch_request_git>(no_ref));
  CHECK(std::get<bale::fetch_request_git>(no_ref).ref.empty());
}

TEST_CASE("fetch_single copies local files relative to file_root") {
  auto const temp_dir{ make_temp_dir("local") };
  bale::scoped_path_cleanup cleanup{ temp_dir };

  std::ofstream(temp_dir / "source1.txt") << "content one";
  std::filesystem::create_directories(temp_dir / "tree" / "nested");
  std::ofstream(temp_dir / "tree" / "nested" / "two.txt") << "content two";

  auto const file_result{ bale::fetch_single(
      bale::fetch_request_for("source1.txt", temp_dir / "dest" / "one.txt", temp_dir)) };
  CHECK(file_result.resolved_destination == temp_dir / "dest" / "one.txt");
  CHECK(bale::util_load_text(temp_dir / "dest" / "one.txt") == "content one");

  bale::fetch_single(bale::fetch_request_file{ .source = (temp_dir / "tree").string(),
                                               .destination = temp_dir / "copy" });
  CHECK(bale::util_load_text(temp_dir / "copy" / "nested" / "two.txt") == "content two");
}

TEST_CASE("fetch_single reports missing local files") {
  auto const temp_dir{ make_temp_dir("missing") };
  bale::scoped_path_cleanup cleanup{ temp_dir };

  CHECK_THROWS_WITH_AS(
      bale::fetch_single(bale::fetch_request_file{ .source = "absent.txt",
                                                   .destination = temp_dir / "out",
                                                   .file_root = temp_dir }),
      doctest::Contains("does not exist"),
      std::runtime_error);
}
