#pragma once

#include <filesystem>
#include <string>

namespace bale {

// Signs sha256(manifest) with a PEM private key (RSA or EC, optionally
// password protected) and writes the base64 signature to `signature`.
void sign_file(std::filesystem::path const &manifest,
               std::filesystem::path const &signature,
               std::filesystem::path const &private_key,
               std::string const &password = {});

// Checks `signature` over sha256(manifest) with a PEM public key (a private key
// is accepted too). Throws integrity_error when the signature is missing or
// does not verify.
void sign_verify(std::filesystem::path const &manifest,
                 std::filesystem::path const &signature,
                 std::filesystem::path const &key);

}  // namespace bale
