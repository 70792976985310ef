#include "image_ref.h"

#include "error.h"

#include "doctest/doctest.h"

#include <string>

TEST_CASE("image_ref_parse applies Docker Hub defaults") {
  auto const nginx{ bale::image_ref_parse("nginx") };
  CHECK(nginx.registry == "docker.io");
  CHECK(nginx.repository == "library/nginx");
  CHECK(nginx.tag == "latest");
  CHECK(nginx.str() == "docker.io/library/nginx:latest");

  CHECK(bale::image_ref_parse("bitnami/redis:7.2").str() == "docker.io/bitnami/redis:7.2");
  CHECK(bale::image_ref_parse("index.docker.io/library/alpine:3.19").str() ==
        "docker.io/library/alpine:3.19");
}

TEST_CASE("image_ref_parse keeps explicit registries and ports") {
  auto const ref{ bale::image_ref_parse("localhost:5000/team/app:v2") };
  CHECK(ref.registry == "localhost:5000");
  CHECK(ref.repository == "team/app");
  CHECK(ref.tag == "v2");
  CHECK(ref.reference() == "v2");

  CHECK(bale::image_ref_parse("ghcr.io/stefanprodan/podinfo").tag == "latest");
}

TEST_CASE("image_ref_parse handles digests") {
  std::string const digest{ "sha256:" + std::string(64, 'a') };
  auto const pinned{ bale::image_ref_parse("alpine@" + digest) };
  CHECK(pinned.tag.empty());
  CHECK(pinned.digest == digest);
  CHECK(pinned.reference() == digest);
  CHECK(pinned.str() == "docker.io/library/alpine@" + digest);

  auto const both{ bale::image_ref_parse("alpine:3.19@" + digest) };
  CHECK(both.tag == "3.19");
  CHECK(both.reference() == digest);
}

TEST_CASE("image_ref_parse equates spellings of the same image") {
  CHECK(bale::image_ref_parse("nginx:1.25") ==
        bale::image_ref_parse("docker.io/library/nginx:1.25"));
  CHECK(bale::image_ref_parse("a:1").str() == bale::image_ref_parse("a:1").str());
  CHECK_FALSE(bale::image_ref_parse("a:1") == bale::image_ref_parse("a:2"));
}

TEST_CASE("image_ref_parse rejects malformed references") {
  CHECK_THROWS_AS(bale::image_ref_parse(""), bale::config_error);
  CHECK_THROWS_AS(bale::image_ref_parse("Upper/Case"), bale::config_error);
  CHECK_THROWS_AS(bale::image_ref_parse("nginx:bad tag"), bale::config_error);
  CHECK_THROWS_AS(bale::image_ref_parse("nginx@sha256:short"), bale::config_error);
}

TEST_CASE("oci_ref_parse requires scheme and registry") {
  auto const ref{ bale::oci_ref_parse("oci://ghcr.io/org/packages/init:1.0.0-amd64") };
  CHECK(ref.registry == "ghcr.io");
  CHECK(ref.repository == "org/packages/init");
  CHECK(ref.tag == "1.0.0-amd64");

  auto const untagged{ bale::oci_ref_parse("oci://localhost:5000/skeleton") };
  CHECK(untagged.tag.empty());

  CHECK_THROWS_AS(bale::oci_ref_parse("ghcr.io/org/pkg:1.0"), bale::config_error);
  CHECK_THROWS_AS(bale::oci_ref_parse("oci://pkg:1.0"), bale::config_error);
  CHECK(bale::is_oci_url("oci://x/y"));
  CHECK_FALSE(bale::is_oci_url("https://x/y"));
}
