#include "libcurl_util.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace xpm {

namespace {

constexpr char kDefaultUserAgent[]{ "xpm/0.1" };
constexpr long kConnectTimeoutSeconds{ 30 };

using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_t = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  body->append(ptr, total);
  return total;
}

struct download_sink {
  CURL *handle;
  std::filesystem::path destination;
  std::uint64_t resume_offset;
  std::ofstream output;
  bool opened{ false };
  bool discard{ false };
};

// The status line is known by the first body callback, so the file mode is picked
// there: append on 206, truncate on a plain 200, nothing on an error status.
size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *sink{ static_cast<download_sink *>(userdata) };
  size_t const total{ size * nmemb };

  if (!sink->opened) {
    sink->opened = true;
    long status{ 0 };
    curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
      sink->discard = true;
    } else {
      bool const append{ status == 206 && sink->resume_offset > 0 };
      sink->output.open(sink->destination,
                        std::ios::binary | (append ? std::ios::app : std::ios::trunc));
      if (!sink->output.is_open()) { return 0; }
    }
  }

  if (sink->discard) { return total; }

  sink->output.write(ptr, static_cast<std::streamsize>(total));
  if (!sink->output) { return 0; }
  return total;
}

curl_handle_t make_handle(std::string const &url) {
  curl_handle_t handle{ curl_easy_init(), &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [h = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(h, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  setopt(CURLOPT_URL, url.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_NOPROGRESS, 1L);
  setopt(CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  setopt(CURLOPT_ACCEPT_ENCODING, "");
  return handle;
}

long perform(CURL *handle, std::string const &url) {
  CURLcode const perform_result{ curl_easy_perform(handle) };
  if (perform_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_perform failed for ") + url + ": " +
                             curl_easy_strerror(perform_result));
  }

  long status{ 0 };
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  return status;
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

libcurl_response libcurl_get(std::string_view url, std::string_view accept) {
  libcurl_ensure_initialized();

  std::string const url_copy{ url };
  auto handle{ make_handle(url_copy) };

  curl_slist_t headers{ nullptr, &curl_slist_free_all };
  if (!accept.empty()) {
    std::string const accept_header{ "Accept: " + std::string(accept) };
    headers.reset(curl_slist_append(nullptr, accept_header.c_str()));
    if (!headers) { throw std::runtime_error("curl_slist_append failed"); }
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  libcurl_response response;
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_write_string);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

  response.status = perform(handle.get(), url_copy);
  return response;
}

libcurl_response libcurl_download(std::string_view url,
                                  std::filesystem::path const &destination,
                                  std::uint64_t resume_offset) {
  libcurl_ensure_initialized();

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::error_code ec;
  auto const parent{ destination.parent_path() };
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("libcurl_download: failed to create parent directory: " +
                               parent.string() + ": " + ec.message());
    }
  }

  std::string const url_copy{ url };
  auto handle{ make_handle(url_copy) };

  download_sink sink{ .handle = handle.get(),
                      .destination = destination,
                      .resume_offset = resume_offset };
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_write_file);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &sink);
  // CURLOPT_RANGE rather than RESUME_FROM: a 200 reply must restart, not fail.
  std::string const range{ std::to_string(resume_offset) + "-" };
  if (resume_offset > 0) { curl_easy_setopt(handle.get(), CURLOPT_RANGE, range.c_str()); }

  libcurl_response response;
  response.status = perform(handle.get(), url_copy);

  if (sink.output.is_open()) {
    sink.output.flush();
    if (!sink.output) {
      throw std::runtime_error("libcurl_download: failed to flush " + destination.string());
    }
    sink.output.close();
  } else if (response.status >= 200 && response.status < 300 &&
             !(response.status == 206 && resume_offset > 0)) {
    // Empty body: still leave an empty, truncated file behind.
    std::ofstream{ destination, std::ios::binary | std::ios::trunc };
  }

  return response;
}

}  // namespace xpm
