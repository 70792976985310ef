#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bale {

struct registry_credentials {
  std::string username;
  std::string password;
  std::string identity_token;  // refresh token handed out by some helpers

  bool empty() const {
    return username.empty() && password.empty() && identity_token.empty();
  }
};

// Runs docker-credential-<helper> for `server_url` and returns its JSON output,
// or nullopt when the helper knows no credentials for that server.
using credential_helper_fn =
    std::function<std::optional<std::string>(std::string const &helper,
                                             std::string const &server_url)>;

// Key under which docker stores credentials for `registry`. Docker Hub aliases
// share "https://index.docker.io/v1/".
std::string oci_auth_config_key(std::string_view registry);

// $DOCKER_CONFIG/config.json, else ~/.docker/config.json.
std::optional<std::filesystem::path> oci_auth_config_path();

// Credentials for `registry` from a docker config document. credHelpers win
// over credsStore, which wins over inline auths entries.
registry_credentials oci_auth_from_config(std::string_view config_json,
                                          std::string_view registry,
                                          credential_helper_fn const &helper);

// Reads the user's docker config (if any) and consults helpers via the shell.
registry_credentials oci_auth_lookup(std::string_view registry);

std::optional<std::string> oci_auth_run_helper(std::string const &helper,
                                               std::string const &server_url);

struct auth_challenge {
  std::string scheme;  // lowercase: "bearer" or "basic"
  std::map<std::string, std::string> params;
};

// Parses a WWW-Authenticate header value.
auth_challenge oci_auth_parse_challenge(std::string_view header);

std::string oci_auth_basic_header(registry_credentials const &creds);

}  // namespace bale
