#include "sign.h"

#include "error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/ecp.h"
#include "mbedtls/entropy.h"
#include "mbedtls/pk.h"

#include <array>
#include <filesystem>
#include <string>

namespace {

// Writes a fresh P-256 key pair as PEM.
void generate_key(std::filesystem::path const &private_pem,
                  std::filesystem::path const &public_pem) {
  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context drbg;
  mbedtls_pk_context pk;
  mbedtls_entropy_init(&entropy);
  mbedtls_ctr_drbg_init(&drbg);
  mbedtls_pk_init(&pk);

  REQUIRE(mbedtls_ctr_drbg_seed(&drbg, mbedtls_entropy_func, &entropy, nullptr, 0) == 0);
  REQUIRE(mbedtls_pk_setup(&pk, mbedtls_pk_info_from_type(MBEDTLS_PK_ECKEY)) == 0);
  REQUIRE(mbedtls_ecp_gen_key(MBEDTLS_ECP_DP_SECP256R1,
                              mbedtls_pk_ec(pk),
                              mbedtls_ctr_drbg_random,
                              &drbg) == 0);

  std::array<unsigned char, 4096> buf{};
  REQUIRE(mbedtls_pk_write_key_pem(&pk, buf.data(), buf.size()) == 0);
  bale::test::write_text(private_pem, reinterpret_cast<char const *>(buf.data()));
  buf.fill(0);
  REQUIRE(mbedtls_pk_write_pubkey_pem(&pk, buf.data(), buf.size()) == 0);
  bale::test::write_text(public_pem, reinterpret_cast<char const *>(buf.data()));

  mbedtls_pk_free(&pk);
  mbedtls_ctr_drbg_free(&drbg);
  mbedtls_entropy_free(&entropy);
}

}  // namespace

TEST_CASE("sign_file output verifies with the public key") {
  bale::test::temp_dir const tmp{ "bale-sign" };
  generate_key(tmp / "key.pem", tmp / "key.pub");
  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\n");

  bale::sign_file(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pem");
  CHECK(std::filesystem::exists(tmp / "bale.yaml.sig"));
  CHECK_NOTHROW(bale::sign_verify(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pub"));
  CHECK_NOTHROW(bale::sign_verify(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pem"));
}

TEST_CASE("sign_verify rejects modified manifests and other keys") {
  bale::test::temp_dir const tmp{ "bale-sign" };
  generate_key(tmp / "key.pem", tmp / "key.pub");
  generate_key(tmp / "other.pem", tmp / "other.pub");
  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\n");
  bale::sign_file(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pem");

  CHECK_THROWS_AS(bale::sign_verify(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "other.pub"),
                  bale::integrity_error);

  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\nmetadata: {}\n");
  CHECK_THROWS_AS(bale::sign_verify(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pub"),
                  bale::integrity_error);
}

TEST_CASE("sign_verify reports an unsigned manifest") {
  bale::test::temp_dir const tmp{ "bale-sign" };
  generate_key(tmp / "key.pem", tmp / "key.pub");
  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\n");

  CHECK_THROWS_WITH_AS(
      bale::sign_verify(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pub"),
      doctest::Contains("is not signed"),
      bale::integrity_error);
}

TEST_CASE("sign_file rejects an unreadable key") {
  bale::test::temp_dir const tmp{ "bale-sign" };
  bale::test::write_text(tmp / "bale.yaml", "kind: BalePackageConfig\n");
  bale::test::write_text(tmp / "key.pem", "not a key");

  CHECK_THROWS_AS(bale::sign_file(tmp / "bale.yaml", tmp / "bale.yaml.sig", tmp / "key.pem"),
                  bale::config_error);
}
