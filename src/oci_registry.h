#pragma once

#include "libcurl_util.h"
#include "oci.h"
#include "oci_auth.h"
#include "util.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bale {

struct registry_options {
  bool plain_http{ false };  // never inferred from a failed TLS handshake
  std::optional<registry_credentials> credentials;  // skips docker config lookup
};

// Host that serves the distribution API for `registry`.
std::string registry_api_host(std::string_view registry);

// oci::remote over the OCI distribution API. Anonymous first; a 401 challenge
// triggers basic auth or a bearer token scoped to repository:<repo>:pull,push.
class registry_remote : public oci::remote, unmovable {
 public:
  using transport_fn = std::function<http_response(http_request const &)>;

  registry_remote(image_ref ref, registry_options options, transport_fn transport = {});

  image_ref const &ref() const override { return ref_; }

  oci::descriptor resolve(std::string const &reference) override;
  std::string fetch_manifest(oci::descriptor const &desc) override;
  void fetch_blob(oci::descriptor const &desc,
                  std::filesystem::path const &destination,
                  fetch_progress_cb_t const &progress) override;
  bool exists(oci::descriptor const &desc) override;
  void push_blob(oci::descriptor const &desc, std::filesystem::path const &source) override;
  void push_manifest(std::string const &reference,
                     std::string const &media_type,
                     std::string const &body) override;

  std::string endpoint() const;  // scheme://host/v2/<repository>

 private:
  http_response send(http_request request);
  void authorize(http_response const &challenge);
  registry_credentials const &credentials();  // caller holds auth_mutex_
  std::string absolute(std::string const &location) const;

  image_ref ref_;
  registry_options options_;
  transport_fn transport_;
  std::mutex auth_mutex_;  // serializes challenge handling
  std::mutex mutex_;
  std::string authorization_;  // full "Authorization: ..." header, empty when anonymous
};

}  // namespace bale
