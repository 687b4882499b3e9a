#pragma once

#include "util.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

inline constexpr char kDefaultRegistry[]{ "https://registry.npmjs.org" };

struct http_response {
  long status{ 0 };
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Network seam. Implementations may throw std::runtime_error for transport failures;
// HTTP error statuses are returned.
class registry_transport {
 public:
  virtual ~registry_transport() = default;

  virtual http_response get(std::string const &url, std::string_view accept) = 0;
  virtual http_response download(std::string const &url,
                                 std::filesystem::path const &destination,
                                 std::uint64_t resume_offset) = 0;
};

class curl_registry_transport : public registry_transport {
 public:
  http_response get(std::string const &url, std::string_view accept) override;
  http_response download(std::string const &url,
                         std::filesystem::path const &destination,
                         std::uint64_t resume_offset) override;
};

using dependency_map = std::map<std::string, std::string>;  // name -> range

struct dist_info {
  std::string tarball;
  std::string shasum;
  std::string integrity;
  std::uint64_t unpacked_size{ 0 };
  std::uint64_t file_count{ 0 };
};

struct version_metadata {
  std::string name;
  std::string version;
  dist_info dist;
  dependency_map dependencies;
  dependency_map optional_dependencies;
  dependency_map peer_dependencies;
  std::vector<std::string> os;
  std::vector<std::string> cpu;
};
using version_metadata_ptr = std::shared_ptr<version_metadata const>;

struct registry_package {
  std::string name;
  std::map<std::string, std::string> dist_tags;
  std::map<std::string, version_metadata_ptr> versions;
};
using registry_package_ptr = std::shared_ptr<registry_package const>;

// Throw std::runtime_error on malformed JSON or missing required fields.
registry_package registry_parse_package(std::string_view json);
version_metadata registry_parse_version(std::string_view json);

// "@scope/name" -> "@scope%2fname"
std::string registry_encode_name(std::string_view name);

struct registry_options {
  std::string base_url{ kDefaultRegistry };
  unsigned retries{ 2 };
  std::optional<std::filesystem::path> cache_dir;  // disk metadata cache root
  std::chrono::milliseconds backoff_base{ 200 };
};

class registry_client : unmovable {
 public:
  registry_client(registry_transport &transport, registry_options options);
  ~registry_client();

  // Memory cache, then disk cache, then one coalesced network fetch per name.
  registry_package_ptr fetch_package(std::string const &name);

  version_metadata_ptr get_version_metadata(std::string const &name,
                                            std::string const &version);

  // Resumable download through destination + ".part"; destination appears only
  // once complete.
  void download_tarball(std::string const &url, std::filesystem::path const &destination);

  registry_options const &options() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace xpm
