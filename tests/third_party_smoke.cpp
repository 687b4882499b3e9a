#include <CLI/CLI.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <blake3.h>
#include <curl/curl.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include "mbedtls/sha256.h"
#include "picojson.h"
#include "semver.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>

int main() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }
    const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
    if (!info || (info->features & CURL_VERSION_LIBZ) == 0U) {
        curl_global_cleanup();
        return 1;
    }
    curl_global_cleanup();

    archive *reader = archive_read_new();
    if (!reader) {
        return 1;
    }
    const int gzip_ok = archive_read_support_filter_gzip(reader);
    archive_read_free(reader);
    if (gzip_ok != ARCHIVE_OK) {
        return 1;
    }

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    std::array<uint8_t, BLAKE3_OUT_LEN> digest{};
    blake3_hasher_finalize(&hasher, digest.data(), digest.size());
    static constexpr std::array<uint8_t, 4> blake3_empty_prefix{0xaf, 0x13, 0x49, 0xb9};
    if (!std::equal(blake3_empty_prefix.begin(), blake3_empty_prefix.end(), digest.begin())) {
        return 1;
    }

    static constexpr std::string_view sha_msg = "abc";
    std::array<unsigned char, 32> sha{};
    if (mbedtls_sha256(reinterpret_cast<const unsigned char *>(sha_msg.data()),
                       sha_msg.size(),
                       sha.data(),
                       0) != 0) {
        return 1;
    }
    static constexpr std::array<unsigned char, 4> sha_expected_prefix{0xba, 0x78, 0x16, 0xbf};
    if (!std::equal(sha_expected_prefix.begin(), sha_expected_prefix.end(), sha.begin())) {
        return 1;
    }

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);
    std::atomic<int> sum{0};
    tbb::parallel_for(0, 10, [&sum](int i) { sum += i; });
    if (sum != 45) {
        return 1;
    }

    picojson::value doc;
    if (!picojson::parse(doc, std::string{R"({"dist-tags": {"latest": "1.2.3"}})"}).empty() ||
        doc.get("dist-tags").get("latest").to_str() != "1.2.3") {
        return 1;
    }

    semver::version<> low;
    semver::version<> high;
    if (!semver::parse(std::string_view{"1.2.3"}, low) ||
        !semver::parse(std::string_view{"1.10.0"}, high) || !(low < high)) {
        return 1;
    }

    CLI::App app{"smoke"};
    int jobs = 0;
    app.add_option("--jobs", jobs);
    const char *argv[] = {"smoke", "--jobs", "4"};
    try {
        app.parse(3, argv);
    } catch (const CLI::ParseError &) {
        return 1;
    }
    if (jobs != 4) {
        return 1;
    }

    return 0;
}
