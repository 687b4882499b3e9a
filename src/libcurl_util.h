#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace xpm {

struct libcurl_response {
  long status{ 0 };
  std::string body;
};

void libcurl_ensure_initialized();

// GET url into memory. Non-2xx statuses are returned, not thrown; transport
// failures throw std::runtime_error.
libcurl_response libcurl_get(std::string_view url, std::string_view accept);

// GET url into destination. With resume_offset > 0 the file is appended to and a
// byte range is requested; a server that answers 200 instead restarts the file.
// The body of an error status is not written. Returns the status with an empty body.
libcurl_response libcurl_download(std::string_view url,
                                  std::filesystem::path const &destination,
                                  std::uint64_t resume_offset);

}  // namespace xpm
