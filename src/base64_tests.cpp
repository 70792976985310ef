#include "base64.h"

#include "doctest/doctest.h"

#include <stdexcept>
#include <string>

TEST_CASE("base64_encode handles padding lengths") {
  CHECK(bale::base64_encode("") == "");
  CHECK(bale::base64_encode("f") == "Zg==");
  CHECK(bale::base64_encode("fo") == "Zm8=");
  CHECK(bale::base64_encode("foo") == "Zm9v");
  CHECK(bale::base64_encode("user:secret") == "dXNlcjpzZWNyZXQ=");
}

TEST_CASE("base64_decode reverses encoding of binary data") {
  std::string binary;
  for (int i{ 0 }; i < 256; ++i) { binary.push_back(static_cast<char>(i)); }
  CHECK(bale::base64_decode(bale::base64_encode(binary)) == binary);
  CHECK(bale::base64_decode("dXNlcjpzZWNyZXQ=") == "user:secret");
}

TEST_CASE("base64_decode rejects malformed input") {
  CHECK_THROWS_WITH_AS(bale::base64_decode("not base64!", "auth"),
                       doctest::Contains("auth"),
                       std::runtime_error);
}
