#include "tbb/flow_graph.h"
#include <git2.h>
#include <curl/curl.h>
#include <archive.h>
#include <archive_entry.h>
#include <mbedtls/md.h>
#include <mbedtls/pk.h>
#include <tbb/global_control.h>
#include <yaml-cpp/yaml.h>
#include <zstd.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

int main() {
    if (git_libgit2_init() < 0) {
        return 1;
    }
    const auto features = git_libgit2_features();
    git_libgit2_shutdown();
    if ((features & GIT_FEATURE_HTTPS) == 0) {
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }
    const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        curl_global_cleanup();
        return 1;
    }
    if ((info->features & CURL_VERSION_SSL) == 0U) {
        curl_global_cleanup();
        return 1;
    }
    curl_global_cleanup();

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);

    archive *writer = archive_write_new();
    if (!writer) {
        return 1;
    }
    if (archive_write_add_filter_zstd(writer) != ARCHIVE_OK) {
        archive_write_free(writer);
        return 1;
    }
    archive_write_free(writer);

    static constexpr std::string_view payload = "bale";
    std::array<char, 64> frame{};
    const std::size_t frame_size =
        ZSTD_compress(frame.data(), frame.size(), payload.data(), payload.size(), 3);
    if (ZSTD_isError(frame_size)) {
        return 1;
    }

    static constexpr std::size_t kSha256Length = 32;
    std::array<unsigned char, kSha256Length> sha{};
    static constexpr std::string_view sha_msg = "abc";
    const mbedtls_md_info_t *md = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!md || mbedtls_md(md,
                          reinterpret_cast<const unsigned char *>(sha_msg.data()),
                          sha_msg.size(),
                          sha.data()) != 0) {
        return 1;
    }
    static constexpr std::array<unsigned char, 4> sha_prefix{0xba, 0x78, 0x16, 0xbf};
    if (!std::equal(sha_prefix.begin(), sha_prefix.end(), sha.begin())) {
        return 1;
    }

    mbedtls_pk_context pk;
    mbedtls_pk_init(&pk);
    mbedtls_pk_free(&pk);

    const YAML::Node doc = YAML::Load("kind: BalePackageConfig");
    if (doc["kind"].as<std::string>() != "BalePackageConfig") {
        return 1;
    }

    const auto json = nlohmann::json::parse(R"({"schemaVersion":2})");
    if (json["schemaVersion"] != 2) {
        return 1;
    }

    return 0;
}
