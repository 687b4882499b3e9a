#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

enum class digest_algorithm { sha1, sha256, sha512 };

std::vector<unsigned char> integrity_digest_file(std::filesystem::path const &file_path,
                                                 digest_algorithm algorithm);

// Decode standard (padded) base64. Throws std::runtime_error on malformed input.
std::vector<unsigned char> integrity_base64_decode(std::string_view encoded);

// Verify a downloaded archive against registry dist metadata.
// integrity is a Subresource Integrity string ("sha512-<base64>", possibly several
// space-separated entries; the strongest supported one is checked). When it is empty
// or names no supported algorithm, shasum (hex SHA-1) is checked instead. With neither
// present the file is accepted. Throws std::runtime_error on mismatch.
void integrity_verify(std::filesystem::path const &file_path,
                      std::string_view integrity,
                      std::string_view shasum);

}  // namespace xpm
