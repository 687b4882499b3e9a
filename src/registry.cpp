#include "registry.h"

#include "libcurl_util.h"
#include "platform.h"
#include "tui.h"

#include "picojson.h"
#include "tbb/concurrent_hash_map.h"

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

namespace xpm {

namespace {

constexpr char kAcceptAbbreviated[]{
  "application/vnd.npm.install-v1+json; q=1.0, application/json; q=0.8"
};
constexpr char kAcceptJson[]{ "application/json" };

std::string string_field(picojson::object const &o, char const *key) {
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<std::string>()) { return {}; }
  return it->second.get<std::string>();
}

std::uint64_t count_field(picojson::object const &o, char const *key) {
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<double>()) { return 0; }
  double const value{ it->second.get<double>() };
  return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

dependency_map dependency_field(picojson::object const &o, char const *key) {
  dependency_map deps;
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<picojson::object>()) { return deps; }
  for (auto const &[name, range] : it->second.get<picojson::object>()) {
    if (range.is<std::string>()) { deps.emplace(name, range.get<std::string>()); }
  }
  return deps;
}

std::vector<std::string> string_list_field(picojson::object const &o, char const *key) {
  std::vector<std::string> out;
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<picojson::array>()) { return out; }
  for (auto const &v : it->second.get<picojson::array>()) {
    if (v.is<std::string>()) { out.push_back(v.get<std::string>()); }
  }
  return out;
}

version_metadata version_from_json(picojson::value const &j) {
  if (!j.is<picojson::object>()) {
    throw std::runtime_error("registry: version entry is not an object");
  }
  auto const &obj{ j.get<picojson::object>() };

  version_metadata meta{ .name = string_field(obj, "name"),
                         .version = string_field(obj, "version") };
  if (meta.name.empty() || meta.version.empty()) {
    throw std::runtime_error("registry: version entry lacks name or version");
  }

  auto const dist{ obj.find("dist") };
  if (dist == obj.end() || !dist->second.is<picojson::object>()) {
    throw std::runtime_error("registry: " + meta.name + "@" + meta.version + " has no dist");
  }
  auto const &dist_obj{ dist->second.get<picojson::object>() };
  meta.dist = dist_info{ .tarball = string_field(dist_obj, "tarball"),
                         .shasum = string_field(dist_obj, "shasum"),
                         .integrity = string_field(dist_obj, "integrity"),
                         .unpacked_size = count_field(dist_obj, "unpackedSize"),
                         .file_count = count_field(dist_obj, "fileCount") };
  if (meta.dist.tarball.empty()) {
    throw std::runtime_error("registry: " + meta.name + "@" + meta.version +
                             " has no dist.tarball");
  }

  meta.dependencies = dependency_field(obj, "dependencies");
  meta.optional_dependencies = dependency_field(obj, "optionalDependencies");
  meta.peer_dependencies = dependency_field(obj, "peerDependencies");
  meta.os = string_list_field(obj, "os");
  meta.cpu = string_list_field(obj, "cpu");
  return meta;
}

picojson::value parse_json(std::string_view text) {
  picojson::value root;
  std::string const err{ picojson::parse(root, std::string{ text }) };
  if (!err.empty()) { throw std::runtime_error("registry: malformed JSON: " + err); }
  return root;
}

}  // namespace

registry_package registry_parse_package(std::string_view json) {
  auto const j{ parse_json(json) };
  if (!j.is<picojson::object>()) {
    throw std::runtime_error("registry: package document is not an object");
  }
  auto const &obj{ j.get<picojson::object>() };

  registry_package pkg{ .name = string_field(obj, "name") };
  if (pkg.name.empty()) { throw std::runtime_error("registry: package document has no name"); }

  if (auto const tags{ obj.find("dist-tags") };
      tags != obj.end() && tags->second.is<picojson::object>()) {
    for (auto const &[tag, version] : tags->second.get<picojson::object>()) {
      if (version.is<std::string>()) { pkg.dist_tags.emplace(tag, version.get<std::string>()); }
    }
  }

  auto const versions{ obj.find("versions") };
  if (versions == obj.end() || !versions->second.is<picojson::object>()) {
    throw std::runtime_error("registry: package " + pkg.name + " has no versions");
  }
  for (auto const &[version, entry] : versions->second.get<picojson::object>()) {
    pkg.versions.emplace(version,
                         std::make_shared<version_metadata const>(version_from_json(entry)));
  }

  return pkg;
}

version_metadata registry_parse_version(std::string_view json) {
  return version_from_json(parse_json(json));
}

std::string registry_encode_name(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  for (char const c : name) {
    if (c == '/') {
      out += "%2f";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

http_response curl_registry_transport::get(std::string const &url, std::string_view accept) {
  auto r{ libcurl_get(url, accept) };
  return http_response{ .status = r.status, .body = std::move(r.body) };
}

http_response curl_registry_transport::download(std::string const &url,
                                                std::filesystem::path const &destination,
                                                std::uint64_t resume_offset) {
  auto r{ libcurl_download(url, destination, resume_offset) };
  return http_response{ .status = r.status, .body = std::move(r.body) };
}

struct registry_client::impl {
  using package_cache_t = tbb::concurrent_hash_map<std::string, registry_package_ptr>;

  impl(registry_transport &t, registry_options o) : transport{ t }, options{ std::move(o) } {}

  registry_transport &transport;
  registry_options options;
  std::optional<std::filesystem::path> metadata_dir;

  package_cache_t cache;
  std::mutex inflight_mutex;
  std::unordered_map<std::string, std::shared_future<registry_package_ptr>> inflight;

  registry_package_ptr cache_lookup(std::string const &name) {
    package_cache_t::const_accessor acc;
    if (cache.find(acc, name)) { return acc->second; }
    return nullptr;
  }

  void cache_insert(std::string const &name, registry_package_ptr const &pkg) {
    package_cache_t::accessor acc;
    cache.insert(acc, name);
    acc->second = pkg;
  }

  std::optional<std::filesystem::path> disk_cache_path(std::string const &name) const {
    if (!metadata_dir) { return std::nullopt; }
    std::string file{ name };
    for (char &c : file) {
      if (c == '/') { c = '+'; }
    }
    return *metadata_dir / (file + ".json");
  }

  registry_package_ptr load_disk_cache(std::string const &name) {
    auto const path{ disk_cache_path(name) };
    if (!path || !std::filesystem::exists(*path)) { return nullptr; }

    try {
      auto pkg{ std::make_shared<registry_package const>(
          registry_parse_package(util_load_text_file(*path))) };
      tui::debug("registry: %s served from disk cache", name.c_str());
      return pkg;
    } catch (std::exception const &e) {
      tui::debug("registry: ignoring unreadable cache entry %s: %s",
                 path->c_str(),
                 e.what());
      return nullptr;
    }
  }

  void store_disk_cache(std::string const &name, std::string const &body) {
    auto const path{ disk_cache_path(name) };
    if (!path) { return; }
    try {
      util_write_file_atomic(*path, body);
    } catch (std::exception const &e) {
      tui::warn("registry: failed to write metadata cache %s: %s", path->c_str(), e.what());
    }
  }

  http_response request_with_retry(std::string const &url,
                                   std::function<http_response()> const &attempt) {
    std::string last_error;
    for (unsigned i{ 0 }; i <= options.retries; ++i) {
      try {
        auto response{ attempt() };
        if (response.ok()) { return response; }
        last_error = "HTTP " + std::to_string(response.status) + " for URL: " + url;
      } catch (std::runtime_error const &e) {
        last_error = std::string("request failed for URL ") + url + ": " + e.what();
      }

      if (i < options.retries) {
        auto const delay{ options.backoff_base * (1u << i) };
        tui::debug("registry: %s, retrying in %lld ms",
                   last_error.c_str(),
                   static_cast<long long>(delay.count()));
        std::this_thread::sleep_for(delay);
      }
    }

    throw std::runtime_error("registry: " + last_error + " (after " +
                             std::to_string(options.retries + 1) + " attempt(s))");
  }

  registry_package_ptr fetch_network(std::string const &name) {
    std::string const url{ options.base_url + "/" + registry_encode_name(name) };
    auto const response{
      request_with_retry(url, [&] { return transport.get(url, kAcceptAbbreviated); })
    };

    registry_package_ptr pkg;
    try {
      pkg = std::make_shared<registry_package const>(registry_parse_package(response.body));
    } catch (std::runtime_error const &e) {
      throw std::runtime_error("registry: failed to parse metadata for " + name + ": " +
                               e.what());
    }

    cache_insert(name, pkg);
    store_disk_cache(name, response.body);
    return pkg;
  }
};

registry_client::registry_client(registry_transport &transport, registry_options options)
    : m{ std::make_unique<impl>(transport, std::move(options)) } {
  while (!m->options.base_url.empty() && m->options.base_url.back() == '/') {
    m->options.base_url.pop_back();
  }

  if (m->options.cache_dir) {
    m->metadata_dir = *m->options.cache_dir / "metadata";
    std::filesystem::create_directories(*m->metadata_dir);
  }
}

registry_client::~registry_client() = default;

registry_options const &registry_client::options() const { return m->options; }

registry_package_ptr registry_client::fetch_package(std::string const &name) {
  if (auto cached{ m->cache_lookup(name) }) { return cached; }

  if (auto from_disk{ m->load_disk_cache(name) }) {
    m->cache_insert(name, from_disk);
    return from_disk;
  }

  std::promise<registry_package_ptr> promise;
  std::shared_future<registry_package_ptr> pending;
  {
    std::lock_guard lock{ m->inflight_mutex };
    // A leader publishes to the cache before leaving the in-flight map.
    if (auto cached{ m->cache_lookup(name) }) { return cached; }

    if (auto const it{ m->inflight.find(name) }; it != m->inflight.end()) {
      pending = it->second;
    } else {
      m->inflight.emplace(name, promise.get_future().share());
    }
  }

  if (pending.valid()) {
    try {
      return pending.get();
    } catch (std::exception const &e) {
      tui::debug("registry: shared fetch of %s failed (%s), fetching independently",
                 name.c_str(),
                 e.what());
      return m->fetch_network(name);
    }
  }

  try {
    auto pkg{ m->fetch_network(name) };
    {
      std::lock_guard lock{ m->inflight_mutex };
      m->inflight.erase(name);
    }
    promise.set_value(pkg);
    return pkg;
  } catch (std::exception const &) {
    {
      std::lock_guard lock{ m->inflight_mutex };
      m->inflight.erase(name);
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

version_metadata_ptr registry_client::get_version_metadata(std::string const &name,
                                                           std::string const &version) {
  if (auto cached{ m->cache_lookup(name) }) {
    if (auto const it{ cached->versions.find(version) }; it != cached->versions.end()) {
      return it->second;
    }
  }

  std::string const url{ m->options.base_url + "/" + registry_encode_name(name) + "/" +
                         version };
  auto const response{
    m->request_with_retry(url, [&] { return m->transport.get(url, kAcceptJson); })
  };

  try {
    return std::make_shared<version_metadata const>(registry_parse_version(response.body));
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("registry: failed to parse metadata for " + name + "@" +
                             version + ": " + e.what());
  }
}

void registry_client::download_tarball(std::string const &url,
                                       std::filesystem::path const &destination) {
  auto part{ destination };
  part += ".part";
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path());
  }

  m->request_with_retry(url, [&] {
    std::error_code ec;
    std::uint64_t offset{ 0 };
    if (std::filesystem::exists(part, ec)) { offset = std::filesystem::file_size(part, ec); }
    if (ec) { offset = 0; }
    if (offset > 0) {
      tui::debug("registry: resuming %s at %llu bytes",
                 url.c_str(),
                 static_cast<unsigned long long>(offset));
    }

    auto response{ m->transport.download(url, part, offset) };
    if (response.status == 416) {  // stale partial, start over next attempt
      std::filesystem::remove(part, ec);
    }
    return response;
  });

  platform::atomic_rename(part, destination);
}

}  // namespace xpm
