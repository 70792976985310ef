#include "oci_registry.h"

#include "sha256.h"
#include "tui.h"

#include "nlohmann/json.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace bale {
namespace {

constexpr char const *kManifestAccept{
  "Accept: application/vnd.oci.image.manifest.v1+json, "
  "application/vnd.oci.image.index.v1+json, "
  "application/vnd.oci.artifact.manifest.v1+json, "
  "application/vnd.docker.distribution.manifest.v2+json, "
  "application/vnd.docker.distribution.manifest.list.v2+json"
};

std::string query_escape(std::string_view value) {
  std::string out;
  for (unsigned char const c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

[[noreturn]] void throw_status(http_request const &request, http_response const &response) {
  std::string detail{ response.body.substr(0, 200) };
  throw std::runtime_error("registry_remote: " + request.method + " " + request.url +
                           ": HTTP " + std::to_string(response.status) +
                           (detail.empty() ? "" : " " + detail));
}

http_request make_request(std::string method, std::string url) {
  http_request request;
  request.method = std::move(method);
  request.url = std::move(url);
  return request;
}

}  // namespace

std::string registry_api_host(std::string_view registry) {
  if (registry == kDockerHubRegistry) { return "registry-1.docker.io"; }
  return std::string{ registry };
}

registry_remote::registry_remote(image_ref ref, registry_options options, transport_fn transport)
    : ref_{ std::move(ref) },
      options_{ std::move(options) },
      transport_{ transport ? std::move(transport) : transport_fn{ libcurl_request } } {}

std::string registry_remote::endpoint() const {
  return std::string{ options_.plain_http ? "http://" : "https://" } +
         registry_api_host(ref_.registry) + "/v2/" + ref_.repository;
}

std::string registry_remote::absolute(std::string const &location) const {
  if (location.starts_with("http://") || location.starts_with("https://")) { return location; }
  return std::string{ options_.plain_http ? "http://" : "https://" } +
         registry_api_host(ref_.registry) + location;
}

registry_credentials const &registry_remote::credentials() {
  if (!options_.credentials) { options_.credentials = oci_auth_lookup(ref_.registry); }
  return *options_.credentials;
}

http_response registry_remote::send(http_request request) {
  auto const base_headers{ request.headers };
  std::string seen_authorization;
  {
    std::lock_guard const lock{ mutex_ };
    seen_authorization = authorization_;
  }
  if (!seen_authorization.empty()) { request.headers.push_back(seen_authorization); }

  auto response{ transport_(request) };
  if (response.status != 401) { return response; }

  {
    std::lock_guard const auth_lock{ auth_mutex_ };
    bool refreshed{ false };
    {
      std::lock_guard const lock{ mutex_ };
      refreshed = authorization_ != seen_authorization;  // another request already did it
    }
    if (!refreshed) { authorize(response); }
  }

  request.headers = base_headers;
  {
    std::lock_guard const lock{ mutex_ };
    if (authorization_.empty() || authorization_ == seen_authorization) { return response; }
    request.headers.push_back(authorization_);
  }
  return transport_(request);
}

void registry_remote::authorize(http_response const &challenge_response) {
  auto const header{ challenge_response.header("www-authenticate") };
  if (!header) {
    throw std::runtime_error("registry_remote: " + ref_.registry +
                             " answered 401 without an authentication challenge");
  }

  auto const challenge{ oci_auth_parse_challenge(*header) };
  auto const &creds{ credentials() };
  std::string authorization;

  if (challenge.scheme == "basic") {
    if (creds.username.empty()) {
      throw std::runtime_error("registry_remote: " + ref_.registry +
                               " requires credentials; none found in docker config");
    }
    authorization = oci_auth_basic_header(creds);
  } else if (challenge.scheme == "bearer") {
    auto const realm{ challenge.params.find("realm") };
    if (realm == challenge.params.end() || realm->second.empty()) {
      throw std::runtime_error("registry_remote: bearer challenge from " + ref_.registry +
                               " has no realm");
    }
    std::string service;
    if (auto const it{ challenge.params.find("service") }; it != challenge.params.end()) {
      service = it->second;
    }
    std::string const scope{ "repository:" + ref_.repository + ":pull,push" };

    http_request token_request;
    if (!creds.identity_token.empty()) {
      token_request = make_request("POST", realm->second);
      token_request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
      token_request.body = "grant_type=refresh_token&client_id=bale&service=" +
                           query_escape(service) + "&scope=" + query_escape(scope) +
                           "&refresh_token=" + query_escape(creds.identity_token);
    } else {
      token_request = make_request("GET",
                                   realm->second + "?service=" + query_escape(service) +
                                       "&scope=" + query_escape(scope));
      if (!creds.username.empty()) {
        token_request.headers.push_back(oci_auth_basic_header(creds));
      }
    }

    tui::debug("registry_remote: requesting token for %s", scope.c_str());
    auto const token_response{ transport_(token_request) };
    if (token_response.status != 200) { throw_status(token_request, token_response); }

    nlohmann::json body;
    try {
      body = nlohmann::json::parse(token_response.body);
    } catch (nlohmann::json::exception const &e) {
      throw std::runtime_error("registry_remote: invalid token response from " +
                               realm->second + ": " + e.what());
    }
    auto token{ body.value("token", "") };
    if (token.empty()) { token = body.value("access_token", ""); }
    if (token.empty()) {
      throw std::runtime_error("registry_remote: token response from " + realm->second +
                               " carries no token");
    }
    authorization = "Authorization: Bearer " + token;
  } else {
    throw std::runtime_error("registry_remote: unsupported authentication scheme '" +
                             challenge.scheme + "' from " + ref_.registry);
  }

  std::lock_guard const lock{ mutex_ };
  authorization_ = std::move(authorization);
}

oci::descriptor registry_remote::resolve(std::string const &reference) {
  auto request{ make_request("HEAD", endpoint() + "/manifests/" + reference) };
  request.headers.push_back(kManifestAccept);
  auto const response{ send(request) };
  if (response.status == 404) {
    throw std::runtime_error("registry_remote: " + ref_.name() + ":" + reference +
                             " not found");
  }
  if (response.status != 200) { throw_status(request, response); }

  auto const media_type{ response.header("content-type").value_or("") };
  if (auto const digest{ response.header("docker-content-digest") }) {
    std::int64_t size{ 0 };
    if (auto const length{ response.header("content-length") }) {
      size = std::stoll(*length);
    }
    return oci::descriptor{ .media_type = media_type,
                            .digest = *digest,
                            .size = size,
                            .annotations = {},
                            .platform = std::nullopt };
  }

  // some registries omit the digest on HEAD; hash the body instead
  auto get{ make_request("GET", request.url) };
  get.headers.push_back(kManifestAccept);
  auto const full{ send(get) };
  if (full.status != 200) { throw_status(get, full); }
  return oci::descriptor_for_bytes(full.header("content-type").value_or(media_type), full.body);
}

std::string registry_remote::fetch_manifest(oci::descriptor const &desc) {
  auto request{ make_request("GET", endpoint() + "/manifests/" + desc.digest) };
  request.headers.push_back(kManifestAccept);
  auto response{ send(request) };
  if (response.status != 200) { throw_status(request, response); }
  return std::move(response.body);
}

void registry_remote::fetch_blob(oci::descriptor const &desc,
                                 std::filesystem::path const &destination,
                                 fetch_progress_cb_t const &progress) {
  auto request{ make_request("GET", endpoint() + "/blobs/" + desc.digest) };
  request.output_file = destination;
  request.progress = progress;
  auto const response{ send(request) };
  if (response.status != 200) {
    throw std::runtime_error("registry_remote: GET " + request.url + ": HTTP " +
                             std::to_string(response.status));
  }
}

bool registry_remote::exists(oci::descriptor const &desc) {
  auto const request{ make_request("HEAD", endpoint() + "/blobs/" + desc.digest) };
  auto const response{ send(request) };
  if (response.status == 200) { return true; }
  if (response.status == 404) { return false; }
  throw_status(request, response);
}

void registry_remote::push_blob(oci::descriptor const &desc,
                                std::filesystem::path const &source) {
  auto const start{ make_request("POST", endpoint() + "/blobs/uploads/") };
  auto const started{ send(start) };
  if (started.status != 202) { throw_status(start, started); }

  auto const location{ started.header("location") };
  if (!location) {
    throw std::runtime_error("registry_remote: upload to " + ref_.name() +
                             " returned no Location");
  }

  auto url{ absolute(*location) };
  url += (url.find('?') == std::string::npos ? "?" : "&");
  url += "digest=" + query_escape(desc.digest);

  auto request{ make_request("PUT", url) };
  request.headers.push_back("Content-Type: application/octet-stream");
  request.body_file = source;
  auto const response{ send(request) };
  if (response.status != 201) { throw_status(request, response); }
  tui::debug("registry_remote: pushed %s", desc.digest.c_str());
}

void registry_remote::push_manifest(std::string const &reference,
                                    std::string const &media_type,
                                    std::string const &body) {
  auto request{ make_request("PUT", endpoint() + "/manifests/" + reference) };
  request.headers.push_back("Content-Type: " + media_type);
  request.body = body;
  auto const response{ send(request) };
  if (response.status != 201 && response.status != 200) { throw_status(request, response); }
}

}  // namespace bale
