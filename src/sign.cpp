#include "sign.h"

#include "base64.h"
#include "error.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"
#include "mbedtls/error.h"
#include "mbedtls/pk.h"

#include <array>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace bale {
namespace {

using pk_ptr = std::unique_ptr<mbedtls_pk_context, decltype(&mbedtls_pk_free)>;
using entropy_ptr = std::unique_ptr<mbedtls_entropy_context, decltype(&mbedtls_entropy_free)>;
using drbg_ptr = std::unique_ptr<mbedtls_ctr_drbg_context, decltype(&mbedtls_ctr_drbg_free)>;

constexpr std::string_view kPersonalization{ "bale-sign" };

std::string mbedtls_message(int rc) {
  std::array<char, 128> buf{};
  mbedtls_strerror(rc, buf.data(), buf.size());
  return buf.data();
}

// Seeded CTR_DRBG for key parsing and signing.
struct random_source : unmovable {
  random_source() {
    mbedtls_entropy_init(&entropy);
    mbedtls_ctr_drbg_init(&drbg);
    if (int const rc{ mbedtls_ctr_drbg_seed(
            &drbg,
            mbedtls_entropy_func,
            &entropy,
            reinterpret_cast<unsigned char const *>(kPersonalization.data()),
            kPersonalization.size()) };
        rc != 0) {
      throw std::runtime_error("sign: mbedtls_ctr_drbg_seed failed: " + mbedtls_message(rc));
    }
  }

  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context drbg;
  entropy_ptr entropy_scope{ &entropy, &mbedtls_entropy_free };
  drbg_ptr drbg_scope{ &drbg, &mbedtls_ctr_drbg_free };
};

sha256_t digest_of(std::filesystem::path const &manifest) {
  if (!std::filesystem::exists(manifest)) {
    throw std::runtime_error("sign: " + manifest.string() + " does not exist");
  }
  return sha256(manifest);
}

}  // namespace

void sign_file(std::filesystem::path const &manifest,
               std::filesystem::path const &signature,
               std::filesystem::path const &private_key,
               std::string const &password) {
  random_source rng;

  mbedtls_pk_context pk;
  mbedtls_pk_init(&pk);
  pk_ptr pk_scope{ &pk, &mbedtls_pk_free };

  if (int const rc{ mbedtls_pk_parse_keyfile(&pk,
                                             private_key.string().c_str(),
                                             password.empty() ? nullptr : password.c_str(),
                                             mbedtls_ctr_drbg_random,
                                             &rng.drbg) };
      rc != 0) {
    throw config_error("sign: unable to load private key " + private_key.string() + ": " +
                       mbedtls_message(rc));
  }

  auto const digest{ digest_of(manifest) };
  std::array<unsigned char, MBEDTLS_PK_SIGNATURE_MAX_SIZE> sig{};
  std::size_t sig_len{ 0 };
  if (int const rc{ mbedtls_pk_sign(&pk,
                                    MBEDTLS_MD_SHA256,
                                    digest.data(),
                                    digest.size(),
                                    sig.data(),
                                    sig.size(),
                                    &sig_len,
                                    mbedtls_ctr_drbg_random,
                                    &rng.drbg) };
      rc != 0) {
    throw std::runtime_error("sign: mbedtls_pk_sign failed: " + mbedtls_message(rc));
  }

  util_write_file(signature,
                  base64_encode(std::string_view{ reinterpret_cast<char const *>(sig.data()),
                                                  sig_len }));
  tui::info("signed %s", manifest.filename().string().c_str());
}

void sign_verify(std::filesystem::path const &manifest,
                 std::filesystem::path const &signature,
                 std::filesystem::path const &key) {
  if (!std::filesystem::exists(signature)) {
    throw integrity_error("sign_verify: " + manifest.filename().string() + " is not signed");
  }

  mbedtls_pk_context pk;
  mbedtls_pk_init(&pk);
  pk_ptr pk_scope{ &pk, &mbedtls_pk_free };

  if (mbedtls_pk_parse_public_keyfile(&pk, key.string().c_str()) != 0) {
    mbedtls_pk_free(&pk);
    mbedtls_pk_init(&pk);
    random_source rng;
    if (int const rc{ mbedtls_pk_parse_keyfile(&pk,
                                               key.string().c_str(),
                                               nullptr,
                                               mbedtls_ctr_drbg_random,
                                               &rng.drbg) };
        rc != 0) {
      throw config_error("sign_verify: unable to load key " + key.string() + ": " +
                         mbedtls_message(rc));
    }
  }

  auto const sig{ base64_decode(util_trim(util_load_text(signature)), "sign_verify") };
  auto const digest{ digest_of(manifest) };
  if (int const rc{ mbedtls_pk_verify(&pk,
                                      MBEDTLS_MD_SHA256,
                                      digest.data(),
                                      digest.size(),
                                      reinterpret_cast<unsigned char const *>(sig.data()),
                                      sig.size()) };
      rc != 0) {
    throw integrity_error("sign_verify: signature of " + manifest.filename().string() +
                          " does not verify: " + mbedtls_message(rc));
  }
}

}  // namespace bale
