#include "util.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("match dispatches on the held alternative") {
  std::variant<int, std::string> value{ std::string{ "layer" } };
  auto const describe{ [](std::variant<int, std::string> const &v) {
    return std::visit(bale::match{ [](int i) { return "slot " + std::to_string(i); },
                                   [](std::string const &s) { return "name " + s; } },
                      v);
  } };

  CHECK(describe(value) == "name layer");
  value = 3;
  CHECK(describe(value) == "slot 3");
}

TEST_CASE("util_bytes_to_hex is lowercase and two digits per byte") {
  unsigned char const bytes[]{ 0x00, 0x0f, 0xab, 0xff };
  CHECK(bale::util_bytes_to_hex(bytes, sizeof bytes) == "000fabff");
  CHECK(bale::util_bytes_to_hex(bytes, 0).empty());
}

TEST_CASE("util_hex_char_to_int accepts both cases") {
  CHECK(bale::util_hex_char_to_int('0') == 0);
  CHECK(bale::util_hex_char_to_int('a') == 10);
  CHECK(bale::util_hex_char_to_int('F') == 15);
  CHECK(bale::util_hex_char_to_int('g') == -1);
  CHECK(bale::util_hex_char_to_int(':') == -1);
}

TEST_CASE("util_format_bytes scales units") {
  CHECK(bale::util_format_bytes(0) == "0B");
  CHECK(bale::util_format_bytes(1023) == "1023B");
  CHECK(bale::util_format_bytes(1536) == "1.50KB");
  CHECK(bale::util_format_bytes(5ull * 1024 * 1024 * 1024) == "5.00GB");
  CHECK(bale::util_format_bytes(3ull * 1024 * 1024 * 1024 * 1024) == "3.00TB");
}

TEST_CASE("util_trim strips surrounding whitespace") {
  CHECK(bale::util_trim("  sha256:abc \t\n") == "sha256:abc");
  CHECK(bale::util_trim(" a b ") == "a b");
  CHECK(bale::util_trim(" \t\r\n").empty());
  CHECK(bale::util_trim("").empty());
}

TEST_CASE("scoped_path_cleanup removes a staging tree") {
  bale::test::temp_dir const tmp;
  auto const staging{ tmp / "staging" };
  bale::test::write_text(staging / "images" / "blobs" / "x", "x");

  {
    bale::scoped_path_cleanup const cleanup{ staging };
    CHECK(fs::exists(staging));
  }
  CHECK_FALSE(fs::exists(staging));
}

TEST_CASE("scoped_path_cleanup reset removes early and disarms") {
  bale::test::temp_dir const tmp;
  auto const file{ tmp / "download.partial" };
  bale::test::write_text(file, "partial");

  bale::scoped_path_cleanup cleanup{ file };
  cleanup.reset();
  CHECK_FALSE(fs::exists(file));

  bale::test::write_text(file, "renamed into place by someone else");
  cleanup.reset();
  CHECK(fs::exists(file));
}

TEST_CASE("util_load_text keeps binary content") {
  bale::test::temp_dir const tmp;
  std::string const payload{ "ab\0cd\0\0e", 8 };
  bale::util_write_file(tmp / "bin", payload);

  CHECK(bale::util_load_text(tmp / "bin") == payload);
  CHECK(bale::util_load_text(tmp / "bin").size() == 8);
}

TEST_CASE("util_load_text reads files larger than one chunk") {
  bale::test::temp_dir const tmp;
  std::string const payload(200 * 1024 + 7, 'z');
  bale::util_write_file(tmp / "big", payload);

  CHECK(bale::util_load_text(tmp / "big") == payload);
}

TEST_CASE("util_load_text throws on a missing file") {
  bale::test::temp_dir const tmp;
  CHECK_THROWS_WITH(bale::util_load_text(tmp / "missing"),
                    doctest::Contains("util_load_text: failed to open"));
}

TEST_CASE("util_write_file creates parents and leaves no staging files") {
  bale::test::temp_dir const tmp;
  auto const target{ tmp / "a" / "b" / "bale.yaml" };
  bale::util_write_file(target, "kind: BalePackage\n");
  bale::util_write_file(target, "v2");

  CHECK(bale::util_load_text(target) == "v2");
  CHECK(bale::util_list_files(tmp.path()) == std::vector<std::string>{ "a/b/bale.yaml" });
}

TEST_CASE("util_partial_path stays beside the target and is hidden") {
  fs::path const target{ "/tmp/dir/archive.tar" };
  auto const first{ bale::util_partial_path(target) };
  auto const second{ bale::util_partial_path(target) };

  CHECK(first.parent_path() == target.parent_path());
  CHECK(first.filename().string().starts_with(".archive.tar."));
  CHECK(first.filename().string().ends_with(".partial"));
  CHECK(first != second);
}

TEST_CASE("util_list_files returns sorted relative paths") {
  bale::test::temp_dir const tmp;
  fs::create_directories(tmp / "empty");
  bale::test::write_text(tmp / "z" / "last.txt", "");
  bale::test::write_text(tmp / "a" / "nested" / "deep.txt", "");
  bale::test::write_text(tmp / "B.txt", "");
  bale::test::write_text(tmp / "a" / "first.txt", "");

  CHECK(bale::util_list_files(tmp.path()) ==
        std::vector<std::string>{ "B.txt", "a/first.txt", "a/nested/deep.txt", "z/last.txt" });
}

TEST_CASE("util_list_files throws on missing root") {
  bale::test::temp_dir const tmp;
  CHECK_THROWS_WITH(bale::util_list_files(tmp / "missing"),
                    doctest::Contains("util_list_files: failed to open"));
}
