#include "integrity.h"

#include "tui.h"
#include "util.h"

#include "mbedtls/base64.h"
#include "mbedtls/sha1.h"
#include "mbedtls/sha256.h"
#include "mbedtls/sha512.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace xpm {
namespace {

constexpr size_t kReadChunk{ 1024 * 1024 };

char const *algorithm_name(digest_algorithm algorithm) {
  switch (algorithm) {
    case digest_algorithm::sha1: return "sha1";
    case digest_algorithm::sha256: return "sha256";
    case digest_algorithm::sha512: return "sha512";
  }
  return "unknown";
}

std::optional<digest_algorithm> parse_algorithm(std::string_view name) {
  if (name == "sha1") { return digest_algorithm::sha1; }
  if (name == "sha256") { return digest_algorithm::sha256; }
  if (name == "sha512") { return digest_algorithm::sha512; }
  return std::nullopt;
}

template <typename Update>
void read_file_chunks(std::filesystem::path const &file_path, Update &&update) {
  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("integrity: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(kReadChunk);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0 && update(buffer.data(), read_bytes)) {
      throw std::runtime_error("integrity: digest update failed");
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("integrity: fread failed"); }
      break;
    }
  }
}

std::vector<unsigned char> digest_sha1(std::filesystem::path const &file_path) {
  mbedtls_sha1_context ctx;
  mbedtls_sha1_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha1_free)> ctx_scope(
      &ctx,
      &mbedtls_sha1_free);

  if (mbedtls_sha1_starts(&ctx)) {
    throw std::runtime_error("integrity: mbedtls_sha1_starts failed");
  }
  read_file_chunks(file_path, [&ctx](unsigned char const *data, size_t len) {
    return mbedtls_sha1_update(&ctx, data, len);
  });

  std::vector<unsigned char> digest(20);
  if (mbedtls_sha1_finish(&ctx, digest.data())) {
    throw std::runtime_error("integrity: mbedtls_sha1_finish failed");
  }
  return digest;
}

std::vector<unsigned char> digest_sha256(std::filesystem::path const &file_path) {
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha256_free)> ctx_scope(
      &ctx,
      &mbedtls_sha256_free);

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("integrity: mbedtls_sha256_starts failed");
  }
  read_file_chunks(file_path, [&ctx](unsigned char const *data, size_t len) {
    return mbedtls_sha256_update(&ctx, data, len);
  });

  std::vector<unsigned char> digest(32);
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("integrity: mbedtls_sha256_finish failed");
  }
  return digest;
}

std::vector<unsigned char> digest_sha512(std::filesystem::path const &file_path) {
  mbedtls_sha512_context ctx;
  mbedtls_sha512_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha512_free)> ctx_scope(
      &ctx,
      &mbedtls_sha512_free);

  if (mbedtls_sha512_starts(&ctx, 0)) {
    throw std::runtime_error("integrity: mbedtls_sha512_starts failed");
  }
  read_file_chunks(file_path, [&ctx](unsigned char const *data, size_t len) {
    return mbedtls_sha512_update(&ctx, data, len);
  });

  std::vector<unsigned char> digest(64);
  if (mbedtls_sha512_finish(&ctx, digest.data())) {
    throw std::runtime_error("integrity: mbedtls_sha512_finish failed");
  }
  return digest;
}

struct sri_entry {
  digest_algorithm algorithm;
  std::string encoded;
};

// Strongest supported entry of a space-separated SRI list; options after '?' ignored.
std::optional<sri_entry> pick_sri_entry(std::string_view integrity) {
  std::optional<sri_entry> best;

  while (!integrity.empty()) {
    auto const start{ integrity.find_first_not_of(" \t\r\n") };
    if (start == std::string_view::npos) { break; }
    integrity.remove_prefix(start);

    auto const end{ integrity.find_first_of(" \t\r\n") };
    auto token{ integrity.substr(0, end) };
    integrity.remove_prefix(end == std::string_view::npos ? integrity.size() : end);

    auto const dash{ token.find('-') };
    if (dash == std::string_view::npos) { continue; }

    auto const algorithm{ parse_algorithm(token.substr(0, dash)) };
    if (!algorithm) { continue; }

    auto encoded{ token.substr(dash + 1) };
    if (auto const q{ encoded.find('?') }; q != std::string_view::npos) {
      encoded = encoded.substr(0, q);
    }

    if (!best || *algorithm > best->algorithm) {
      best = sri_entry{ .algorithm = *algorithm, .encoded = std::string{ encoded } };
    }
  }

  return best;
}

}  // namespace

std::vector<unsigned char> integrity_digest_file(std::filesystem::path const &file_path,
                                                 digest_algorithm algorithm) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("integrity: file does not exist: " + file_path.string());
  }

  switch (algorithm) {
    case digest_algorithm::sha1: return digest_sha1(file_path);
    case digest_algorithm::sha256: return digest_sha256(file_path);
    case digest_algorithm::sha512: return digest_sha512(file_path);
  }
  throw std::invalid_argument("integrity: unknown digest algorithm");
}

std::vector<unsigned char> integrity_base64_decode(std::string_view encoded) {
  auto const *src{ reinterpret_cast<unsigned char const *>(encoded.data()) };

  size_t required{ 0 };
  int const probe{ mbedtls_base64_decode(nullptr, 0, &required, src, encoded.size()) };
  if (probe == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
    throw std::runtime_error("integrity: invalid base64: " + std::string{ encoded });
  }

  std::vector<unsigned char> decoded(required);
  size_t written{ 0 };
  if (mbedtls_base64_decode(decoded.data(),
                            decoded.size(),
                            &written,
                            src,
                            encoded.size()) != 0) {
    throw std::runtime_error("integrity: invalid base64: " + std::string{ encoded });
  }
  decoded.resize(written);
  return decoded;
}

void integrity_verify(std::filesystem::path const &file_path,
                      std::string_view integrity,
                      std::string_view shasum) {
  if (auto const entry{ pick_sri_entry(integrity) }) {
    auto const expected{ integrity_base64_decode(entry->encoded) };
    auto const actual{ integrity_digest_file(file_path, entry->algorithm) };
    if (expected != actual) {
      throw std::runtime_error(std::string("integrity: ") +
                               algorithm_name(entry->algorithm) + " mismatch for " +
                               file_path.filename().string() + ": expected " +
                               util_bytes_to_hex(expected.data(), expected.size()) +
                               " but got " +
                               util_bytes_to_hex(actual.data(), actual.size()));
    }
    return;
  }

  if (!shasum.empty()) {
    auto const expected{ util_hex_to_bytes(std::string{ shasum }) };
    auto const actual{ integrity_digest_file(file_path, digest_algorithm::sha1) };
    if (expected != actual) {
      throw std::runtime_error("integrity: sha1 mismatch for " +
                               file_path.filename().string() + ": expected " +
                               std::string{ shasum } + " but got " +
                               util_bytes_to_hex(actual.data(), actual.size()));
    }
    return;
  }

  tui::debug("integrity: no checksum published for %s", file_path.filename().c_str());
}

}  // namespace xpm
