#include "libcurl_util.h"

#include "platform.h"
#include "util.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace bale {

namespace {

constexpr char kDefaultUserAgent[]{ "bale/0.1" };

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct curl_slist_deleter {
  void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
};
using curl_slist_ptr = std::unique_ptr<curl_slist, curl_slist_deleter>;

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *stream{ static_cast<std::ofstream *>(userdata) };
  size_t const total{ size * nmemb };
  stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*stream) { return 0; }
  return total;
}

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *out{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  out->append(ptr, total);
  return total;
}

size_t curl_read_file(char *buffer, size_t size, size_t nitems, void *userdata) {
  auto *file{ static_cast<std::FILE *>(userdata) };
  size_t const n{ std::fread(buffer, 1, size * nitems, file) };
  if (n == 0 && std::ferror(file)) { return CURL_READFUNC_ABORT; }
  return n;
}

size_t curl_header(char *buffer, size_t size, size_t nitems, void *userdata) {
  auto *headers{ static_cast<std::map<std::string, std::string> *>(userdata) };
  size_t const total{ size * nitems };
  std::string_view const line{ buffer, total };

  // A new status line starts a new response (redirects, 100-continue)
  if (line.starts_with("HTTP/")) {
    headers->clear();
    return total;
  }

  auto const colon{ line.find(':') };
  if (colon == std::string_view::npos) { return total; }

  std::string name{ util_trim(line.substr(0, colon)) };
  std::ranges::transform(name, name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  (*headers)[name] = std::string{ util_trim(line.substr(colon + 1)) };
  return total;
}

struct xfer_state {
  fetch_progress_cb_t const *progress{ nullptr };
  bool upload{ false };
};

int curl_xferinfo(void *clientp,
                  curl_off_t dltotal,
                  curl_off_t dlnow,
                  curl_off_t ultotal,
                  curl_off_t ulnow) {
  auto const *state{ static_cast<xfer_state const *>(clientp) };
  if (!state || !state->progress || !*state->progress) { return 0; }

  curl_off_t const total{ state->upload ? ultotal : dltotal };
  curl_off_t const now{ state->upload ? ulnow : dlnow };

  fetch_transfer_progress const prog{
    .transferred = static_cast<std::uint64_t>(now),
    .total = total > 0 ? std::make_optional(static_cast<std::uint64_t>(total))
                       : std::nullopt
  };

  return (*state->progress)(prog) ? 0 : 1;
}

curl_ptr make_handle() {
  libcurl_ensure_initialized();
  curl_ptr handle{ curl_easy_init(), &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }
  return handle;
}

template <typename T>
void setopt(CURL *handle, CURLoption option, T value) {
  CURLcode const rc{ curl_easy_setopt(handle, option, value) };
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                             curl_easy_strerror(rc));
  }
}

std::runtime_error perform_error(CURLcode code, std::string const &url) {
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    return std::runtime_error("transfer of " + url + " was cancelled");
  }
  return std::runtime_error(std::string("curl_easy_perform failed: ") +
                            curl_easy_strerror(code) + " (" + url + ")");
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       fetch_progress_cb_t const &progress) {
  std::string const url_copy{ url };

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::filesystem::path resolved_destination{ destination };
  if (!resolved_destination.is_absolute()) {
    resolved_destination = std::filesystem::absolute(resolved_destination);
  }
  resolved_destination = resolved_destination.lexically_normal();

  std::error_code ec;
  auto const parent{ resolved_destination.parent_path() };
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("libcurl_download: failed to create parent directory: " +
                               parent.string() + ": " + ec.message());
    }
  }

  auto const staging{ util_partial_path(resolved_destination) };
  scoped_path_cleanup staging_cleanup{ staging };

  {
    std::ofstream output{ staging, std::ios::binary | std::ios::trunc };
    if (!output.is_open()) {
      throw std::runtime_error("libcurl_download: failed to open destination: " +
                               staging.string());
    }

    auto const handle{ make_handle() };
    xfer_state state{ .progress = &progress, .upload = false };

    setopt(handle.get(), CURLOPT_URL, url_copy.c_str());
    setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
    setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    setopt(handle.get(), CURLOPT_USERAGENT, kDefaultUserAgent);
    setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_write_file);
    setopt(handle.get(), CURLOPT_WRITEDATA, &output);
    setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
    setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
    setopt(handle.get(), CURLOPT_XFERINFODATA, &state);

    CURLcode const perform_result{ curl_easy_perform(handle.get()) };
    if (perform_result != CURLE_OK) { throw perform_error(perform_result, url_copy); }

    output.flush();
    if (!output) {
      throw std::runtime_error("libcurl_download: failed to flush destination file");
    }
  }

  platform::atomic_rename(staging, resolved_destination);
  staging_cleanup.reset();
  return resolved_destination;
}

std::optional<std::string> http_response::header(std::string const &lowercase_name) const {
  if (auto const it{ headers.find(lowercase_name) }; it != headers.end()) {
    return it->second;
  }
  return std::nullopt;
}

http_response libcurl_request(http_request const &request) {
  auto const handle{ make_handle() };
  http_response response;

  curl_slist_ptr header_list;
  for (auto const &h : request.headers) {
    curl_slist *next{ curl_slist_append(header_list.get(), h.c_str()) };
    if (!next) { throw std::runtime_error("libcurl_request: curl_slist_append failed"); }
    static_cast<void>(header_list.release());
    header_list.reset(next);
  }

  std::optional<std::ofstream> output;
  file_ptr_t upload;
  xfer_state state{ .progress = &request.progress, .upload = request.body_file.has_value() };

  setopt(handle.get(), CURLOPT_URL, request.url.c_str());
  setopt(handle.get(), CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
  setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  setopt(handle.get(), CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(handle.get(), CURLOPT_HEADERFUNCTION, curl_header);
  setopt(handle.get(), CURLOPT_HEADERDATA, &response.headers);
  setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
  setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
  setopt(handle.get(), CURLOPT_XFERINFODATA, &state);
  if (header_list) { setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get()); }

  if (request.method == "HEAD") {
    setopt(handle.get(), CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET") {
    setopt(handle.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }

  if (request.body_file) {
    upload = util_open_file(*request.body_file, "rb");
    if (!upload) {
      throw std::runtime_error("libcurl_request: failed to open " +
                               request.body_file->string());
    }
    auto const size{ std::filesystem::file_size(*request.body_file) };
    setopt(handle.get(), CURLOPT_UPLOAD, 1L);
    if (request.method != "PUT") {
      setopt(handle.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    setopt(handle.get(), CURLOPT_READFUNCTION, curl_read_file);
    setopt(handle.get(), CURLOPT_READDATA, upload.get());
    setopt(handle.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
  } else if (request.body) {
    setopt(handle.get(), CURLOPT_POSTFIELDS, request.body->data());
    setopt(handle.get(),
           CURLOPT_POSTFIELDSIZE_LARGE,
           static_cast<curl_off_t>(request.body->size()));
  } else if (request.method == "POST" || request.method == "PUT") {
    setopt(handle.get(), CURLOPT_POSTFIELDS, "");
    setopt(handle.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
  }

  if (request.output_file) {
    output.emplace(*request.output_file, std::ios::binary | std::ios::trunc);
    if (!output->is_open()) {
      throw std::runtime_error("libcurl_request: failed to open " +
                               request.output_file->string());
    }
    setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_write_file);
    setopt(handle.get(), CURLOPT_WRITEDATA, &*output);
  } else {
    setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_write_string);
    setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
  }

  CURLcode const rc{ curl_easy_perform(handle.get()) };
  if (rc != CURLE_OK) { throw perform_error(rc, request.url); }

  if (output) {
    output->flush();
    if (!*output) {
      throw std::runtime_error("libcurl_request: failed to write " +
                               request.output_file->string());
    }
  }

  if (CURLcode const info_rc{
          curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status) };
      info_rc != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_getinfo failed: ") +
                             curl_easy_strerror(info_rc));
  }
  return response;
}

}  // namespace bale
