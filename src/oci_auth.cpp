#include "oci_auth.h"

#include "base64.h"
#include "platform.h"
#include "shell.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace bale {
namespace {

constexpr std::string_view kDockerHubKey{ "https://index.docker.io/v1/" };

// "https://host:port/v1/" -> "host:port"
std::string host_of(std::string_view key) {
  if (auto const scheme{ key.find("://") }; scheme != std::string_view::npos) {
    key.remove_prefix(scheme + 3);
  }
  if (auto const slash{ key.find('/') }; slash != std::string_view::npos) {
    key = key.substr(0, slash);
  }
  return std::string{ key };
}

bool is_docker_hub(std::string_view host) {
  return host == "docker.io" || host == "index.docker.io" || host == "registry-1.docker.io";
}

bool same_registry(std::string_view key, std::string_view registry) {
  auto const a{ host_of(key) };
  auto const b{ host_of(registry) };
  return a == b || (is_docker_hub(a) && is_docker_hub(b));
}

registry_credentials from_helper_output(std::string const &output, std::string const &helper) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(output);
  } catch (nlohmann::json::exception const &e) {
    throw std::runtime_error("oci_auth: docker-credential-" + helper +
                             " returned invalid JSON: " + e.what());
  }

  registry_credentials creds{ .username = j.value("Username", ""),
                              .password = j.value("Secret", ""),
                              .identity_token = {} };
  if (creds.username == "<token>") {
    creds.identity_token = creds.password;
    creds.username.clear();
    creds.password.clear();
  }
  return creds;
}

std::optional<registry_credentials> via_helper(std::string const &helper,
                                               std::string_view registry,
                                               credential_helper_fn const &run) {
  std::string const server{ is_docker_hub(host_of(registry)) ? std::string{ kDockerHubKey }
                                                             : host_of(registry) };
  tui::debug("oci_auth: asking docker-credential-%s for %s", helper.c_str(), server.c_str());
  if (auto const output{ run(helper, server) }) { return from_helper_output(*output, helper); }
  return std::nullopt;
}

}  // namespace

std::string oci_auth_config_key(std::string_view registry) {
  auto const host{ host_of(registry) };
  return is_docker_hub(host) ? std::string{ kDockerHubKey } : host;
}

std::optional<std::filesystem::path> oci_auth_config_path() {
  if (char const *dir{ std::getenv("DOCKER_CONFIG") }; dir && *dir) {
    return std::filesystem::path{ dir } / "config.json";
  }
  if (auto const home{ platform::home_dir() }) { return *home / ".docker" / "config.json"; }
  return std::nullopt;
}

registry_credentials oci_auth_from_config(std::string_view config_json,
                                          std::string_view registry,
                                          credential_helper_fn const &helper) {
  nlohmann::json config;
  try {
    config = nlohmann::json::parse(config_json);
  } catch (nlohmann::json::exception const &e) {
    throw std::runtime_error(std::string{ "oci_auth: invalid docker config: " } + e.what());
  }
  if (!config.is_object()) { return {}; }

  if (auto const it{ config.find("credHelpers") }; it != config.end() && it->is_object()) {
    for (auto const &[key, value] : it->items()) {
      if (!value.is_string() || !same_registry(key, registry)) { continue; }
      if (auto creds{ via_helper(value.get<std::string>(), registry, helper) }) {
        return *creds;
      }
      return {};
    }
  }

  if (auto const it{ config.find("credsStore") }; it != config.end() && it->is_string()) {
    if (auto creds{ via_helper(it->get<std::string>(), registry, helper) }) { return *creds; }
  }

  if (auto const it{ config.find("auths") }; it != config.end() && it->is_object()) {
    for (auto const &[key, entry] : it->items()) {
      if (!entry.is_object() || !same_registry(key, registry)) { continue; }

      registry_credentials creds{ .username = entry.value("username", ""),
                                  .password = entry.value("password", ""),
                                  .identity_token = entry.value("identitytoken", "") };
      if (auto const auth{ entry.value("auth", "") }; !auth.empty()) {
        auto const decoded{ base64_decode(auth, "oci_auth: docker config auth entry") };
        auto const colon{ decoded.find(':') };
        if (colon == std::string::npos) {
          throw std::runtime_error("oci_auth: auth entry for " + key +
                                   " is not user:password");
        }
        creds.username = decoded.substr(0, colon);
        creds.password = decoded.substr(colon + 1);
      }
      return creds;
    }
  }

  return {};
}

std::optional<std::string> oci_auth_run_helper(std::string const &helper,
                                               std::string const &server_url) {
  std::string out;
  std::string err;
  shell_run_cfg cfg{ .on_output_line = {},
                     .on_stdout_line = [&](std::string_view line) {
                       out.append(line);
                       out.push_back('\n');
                     },
                     .on_stderr_line = [&](std::string_view line) {
                       err.append(line);
                       err.push_back('\n');
                     },
                     .cwd = std::nullopt,
                     .env = shell_getenv(),
                     .shell = shell_choice::sh,
                     .stdin_data = server_url };

  auto const result{ shell_run(shell_quote("docker-credential-" + helper) + " get", cfg) };
  if (result.exit_code == 0) { return out; }

  if (out.find("credentials not found") != std::string::npos ||
      err.find("credentials not found") != std::string::npos) {
    return std::nullopt;
  }
  throw std::runtime_error("oci_auth: docker-credential-" + helper + " exited with " +
                           std::to_string(result.exit_code) + ": " +
                           std::string{ util_trim(err.empty() ? out : err) });
}

registry_credentials oci_auth_lookup(std::string_view registry) {
  auto const path{ oci_auth_config_path() };
  if (!path || !platform::file_exists(*path)) {
    tui::debug("oci_auth: no docker config, using anonymous access to %.*s",
               static_cast<int>(registry.size()), registry.data());
    return {};
  }
  return oci_auth_from_config(util_load_text(*path), registry, oci_auth_run_helper);
}

auth_challenge oci_auth_parse_challenge(std::string_view header) {
  auth_challenge challenge;

  header = util_trim(header);
  auto const space{ header.find(' ') };
  challenge.scheme = std::string{ header.substr(0, space) };
  std::ranges::transform(challenge.scheme, challenge.scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (space == std::string_view::npos) { return challenge; }

  // key="value",key=value,...; values may contain commas inside quotes
  std::string_view rest{ header.substr(space + 1) };
  while (!rest.empty()) {
    rest = util_trim(rest);
    auto const eq{ rest.find('=') };
    if (eq == std::string_view::npos) { break; }
    auto const key{ std::string{ util_trim(rest.substr(0, eq)) } };
    rest.remove_prefix(eq + 1);

    std::string value;
    if (!rest.empty() && rest.front() == '"') {
      auto const close{ rest.find('"', 1) };
      value = std::string{ rest.substr(1, close == std::string_view::npos ? rest.size() - 1
                                                                          : close - 1) };
      rest.remove_prefix(close == std::string_view::npos ? rest.size() : close + 1);
    } else {
      auto const comma{ rest.find(',') };
      value = std::string{ util_trim(rest.substr(0, comma)) };
      rest.remove_prefix(comma == std::string_view::npos ? rest.size() : comma);
    }
    challenge.params[key] = value;

    if (auto const comma{ rest.find(',') }; comma != std::string_view::npos) {
      rest.remove_prefix(comma + 1);
    } else {
      break;
    }
  }
  return challenge;
}

std::string oci_auth_basic_header(registry_credentials const &creds) {
  return "Authorization: Basic " + base64_encode(creds.username + ":" + creds.password);
}

}  // namespace bale
