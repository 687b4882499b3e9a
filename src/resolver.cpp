#include "resolver.h"

#include "platform.h"
#include "tui.h"
#include "version_range.h"

#include "tbb/concurrent_hash_map.h"
#include "tbb/concurrent_unordered_set.h"
#include "tbb/task_group.h"

#include <deque>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

namespace xpm {

namespace {

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

bool list_allows(std::vector<std::string> const &list, std::string_view host) {
  if (list.empty()) { return true; }

  bool has_positive{ false };
  bool positive_match{ false };
  for (auto const &entry : list) {
    if (!entry.empty() && entry.front() == '!') {
      if (std::string_view{ entry }.substr(1) == host) { return false; }
    } else {
      has_positive = true;
      if (entry == host) { positive_match = true; }
    }
  }
  return !has_positive || positive_match;
}

std::string requirement_key(std::string_view name, std::string_view requirement) {
  return std::string(name) + "@" + std::string(requirement);
}

struct dependency_edge {
  std::string name;
  std::string requirement;
  bool optional;
};

std::vector<dependency_edge> all_dependencies(version_metadata const &meta) {
  std::vector<dependency_edge> edges;
  for (auto const &[n, r] : meta.dependencies) { edges.push_back({ n, r, false }); }
  for (auto const &[n, r] : meta.optional_dependencies) { edges.push_back({ n, r, true }); }
  for (auto const &[n, r] : meta.peer_dependencies) { edges.push_back({ n, r, false }); }
  return edges;
}

}  // namespace

std::string resolver_pick_version(registry_package const &pkg, std::string_view requirement) {
  requirement = trim(requirement);

  auto const latest{ pkg.dist_tags.find("latest") };
  auto const checked = [&](std::string const &version) -> std::string {
    if (!pkg.versions.contains(version)) {
      throw std::runtime_error("resolver: " + pkg.name + "@" + version +
                               " is tagged but not published");
    }
    return version;
  };

  if (requirement.empty() || requirement == "latest" || requirement == "*" ||
      requirement == "x") {
    if (latest == pkg.dist_tags.end()) {
      throw std::runtime_error("resolver: " + pkg.name + " has no latest tag");
    }
    return checked(latest->second);
  }

  if (auto const tag{ pkg.dist_tags.find(std::string(requirement)) };
      tag != pkg.dist_tags.end()) {
    return checked(tag->second);
  }

  if (auto const range{ version_range::parse(requirement) }) {
    std::vector<std::string> published;
    published.reserve(pkg.versions.size());
    for (auto const &[version, meta] : pkg.versions) { published.push_back(version); }
    if (auto best{ version_max_satisfying(published, *range) }) { return *best; }
  }

  if (latest != pkg.dist_tags.end() && pkg.versions.contains(latest->second)) {
    tui::warn("resolver: no version of %s satisfies %.*s, using latest %s",
              pkg.name.c_str(),
              static_cast<int>(requirement.size()),
              requirement.data(),
              latest->second.c_str());
    return latest->second;
  }

  throw std::runtime_error("resolver: no version of " + pkg.name + " satisfies " +
                           std::string(requirement));
}

std::vector<resolved_package> resolver_shadowed_versions(
    std::vector<resolved_package> const &resolved,
    registry_client &registry) {
  std::set<std::string> known;
  for (auto const &pkg : resolved) { known.insert(pkg.key()); }

  std::deque<std::pair<std::string, std::string>> queue;
  auto const want = [&](std::map<std::string, std::string> const &deps) {
    for (auto const &[name, version] : deps) {
      if (known.insert(requirement_key(name, version)).second) {
        queue.emplace_back(name, version);
      }
    }
  };
  for (auto const &pkg : resolved) { want(pkg.resolved_dependencies); }

  std::vector<resolved_package> out;
  while (!queue.empty()) {
    auto [name, version]{ std::move(queue.front()) };
    queue.pop_front();

    resolved_package pkg{ .name = name,
                          .version = version,
                          .metadata = registry.get_version_metadata(name, version) };
    for (auto const &edge : all_dependencies(*pkg.metadata)) {
      try {
        pkg.resolved_dependencies[edge.name] =
            resolver_pick_version(*registry.fetch_package(edge.name), edge.requirement);
      } catch (std::exception const &e) {
        if (!edge.optional) { throw; }
        tui::debug("resolver: skipping optional %s@%s: %s",
                   edge.name.c_str(),
                   edge.requirement.c_str(),
                   e.what());
      }
    }

    tui::debug("resolver: %s@%s kept for its dependents", name.c_str(), version.c_str());
    want(pkg.resolved_dependencies);
    out.push_back(std::move(pkg));
  }
  return out;
}

bool resolver_platform_supported(version_metadata const &meta,
                                 std::string_view os,
                                 std::string_view cpu) {
  return list_allows(meta.os, os) && list_allows(meta.cpu, cpu);
}

struct resolver::impl {
  impl(registry_client &r, resolver_options o) : registry{ r }, options{ std::move(o) } {
    if (options.os.empty()) { options.os = std::string(platform::os_name()); }
    if (options.cpu.empty()) { options.cpu = std::string(platform::cpu_name()); }
  }

  registry_client &registry;
  resolver_options options;

  tbb::concurrent_unordered_set<std::string> visited;         // name@requirement
  tbb::concurrent_unordered_set<std::string> visited_required;
  tbb::concurrent_unordered_set<std::string> expanded;        // name@version
  tbb::concurrent_hash_map<std::string, std::string> resolution_cache;

  std::mutex resolved_mutex;
  std::map<std::string, resolved_package> resolved;  // by name

  void enqueue(tbb::task_group &tg, std::string name, std::string requirement, bool optional) {
    // A required edge is visited again when only optional edges reached it so far, so
    // its failure is not lost to an earlier optional skip.
    auto const key{ requirement_key(name, requirement) };
    bool const first{ visited.insert(key).second };
    bool const first_required{ !optional && visited_required.insert(key).second };
    if (!first && !first_required) { return; }
    tg.run([this, &tg, name = std::move(name), requirement = std::move(requirement), optional] {
      visit(tg, name, requirement, optional);
    });
  }

  void visit(tbb::task_group &tg,
             std::string const &name,
             std::string const &requirement,
             bool optional) {
    version_metadata_ptr meta;
    std::string version;

    try {
      auto const pkg{ registry.fetch_package(name) };
      version = resolver_pick_version(*pkg, requirement);
      meta = pkg->versions.at(version);
    } catch (std::exception const &e) {
      if (optional) {
        tui::debug("resolver: skipping optional %s@%s: %s",
                   name.c_str(),
                   requirement.c_str(),
                   e.what());
        return;
      }
      throw std::runtime_error("resolver: failed to resolve " + name + "@" + requirement +
                               ": " + e.what());
    }

    if (!resolver_platform_supported(*meta, options.os, options.cpu)) {
      if (optional) {
        tui::debug("resolver: skipping optional %s@%s, unsupported on %s/%s",
                   name.c_str(),
                   version.c_str(),
                   options.os.c_str(),
                   options.cpu.c_str());
        return;
      }
      tui::warn("resolver: %s@%s does not declare support for %s/%s",
                name.c_str(),
                version.c_str(),
                options.os.c_str(),
                options.cpu.c_str());
    }

    {
      decltype(resolution_cache)::accessor acc;
      resolution_cache.insert(acc, requirement_key(name, requirement));
      acc->second = version;
    }

    {
      std::lock_guard lock{ resolved_mutex };
      auto const it{ resolved.find(name) };
      if (it != resolved.end() && it->second.version != version) {
        tui::warn("resolver: %s requested as %s@%s and %s@%s, keeping %s",
                  name.c_str(),
                  name.c_str(),
                  it->second.version.c_str(),
                  name.c_str(),
                  version.c_str(),
                  version.c_str());
      }
      resolved[name] = resolved_package{ .name = name, .version = version, .metadata = meta };
    }

    if (!expanded.insert(requirement_key(name, version)).second) { return; }
    tui::debug("resolver: resolved %s@%s", name.c_str(), version.c_str());

    for (auto &edge : all_dependencies(*meta)) {
      enqueue(tg, std::move(edge.name), std::move(edge.requirement), edge.optional);
    }
  }

  std::optional<std::string> cached_version(std::string const &key) const {
    decltype(resolution_cache)::const_accessor acc;
    if (resolution_cache.find(acc, key)) { return acc->second; }
    return std::nullopt;
  }

  void link_dependencies() {
    for (auto &[name, pkg] : resolved) {
      pkg.resolved_dependencies.clear();
      for (auto const &edge : all_dependencies(*pkg.metadata)) {
        if (auto const v{ cached_version(requirement_key(edge.name, edge.requirement)) }) {
          pkg.resolved_dependencies[edge.name] = *v;
        } else if (edge.optional) {
          continue;
        } else if (auto const it{ resolved.find(edge.name) }; it != resolved.end()) {
          pkg.resolved_dependencies[edge.name] = it->second.version;
        }
      }
    }
  }
};

resolver::resolver(registry_client &registry, resolver_options options)
    : m{ std::make_unique<impl>(registry, std::move(options)) } {}

resolver::~resolver() = default;

std::vector<resolved_package> resolver::resolve(dependency_map const &requirements) {
  m->visited.clear();
  m->visited_required.clear();
  m->expanded.clear();
  m->resolution_cache.clear();
  m->resolved.clear();

  tbb::task_group tg;
  for (auto const &[name, requirement] : requirements) {
    m->enqueue(tg, name, std::string(trim(requirement)), false);
  }
  tg.wait();

  m->link_dependencies();

  std::vector<resolved_package> out;
  out.reserve(m->resolved.size());
  for (auto &[name, pkg] : m->resolved) { out.push_back(std::move(pkg)); }
  m->resolved.clear();

  tui::info("resolver: %zu package(s) resolved", out.size());
  return out;
}

std::optional<std::string> resolver::find_compatible_version(
    std::string const &name,
    std::string const &requirement) const {
  return m->cached_version(requirement_key(name, requirement));
}

}  // namespace xpm
