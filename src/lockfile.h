#pragma once

#include "registry.h"
#include "resolver.h"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xpm {

inline constexpr char kLockfileName[]{ "xpm-lock.json" };
inline constexpr int kLockfileVersion{ 1 };

struct lockfile_entry {
  std::string version;
  std::string resolved;  // tarball URL
  std::map<std::string, std::string> dependencies;  // name -> version

  bool operator==(lockfile_entry const &) const = default;
};

// {"lockfileVersion": 1, "packages": {name: {version, resolved, dependencies}}}
struct lockfile {
  std::map<std::string, lockfile_entry> packages;

  static lockfile from_resolved(std::vector<resolved_package> const &resolved);

  // nullopt when the file does not exist. Throws std::runtime_error on malformed JSON
  // or an unexpected shape.
  static std::optional<lockfile> load(std::filesystem::path const &path);
  static lockfile parse(std::string_view json);

  std::string dump() const;
  void save(std::filesystem::path const &path) const;  // atomic

  // Closure of required_names over each entry's dependencies. Names without an entry
  // are not included.
  std::set<std::string> reachable_from(std::set<std::string> const &required_names) const;

  // Drops every entry not reachable from required_names; returns the dropped names.
  std::vector<std::string> prune(std::set<std::string> const &required_names);

  // Dependency names referenced by some entry that have no entry of their own.
  std::vector<std::string> dangling_references() const;

  // True when every requirement has an entry whose version satisfies it and no
  // reference dangles. Dist-tag requirements other than "latest"/"*" never match.
  bool satisfies(dependency_map const &requirements) const;

  // Resolved packages for every entry, with metadata from the registry.
  std::vector<resolved_package> to_resolved(registry_client &registry) const;
};

}  // namespace xpm
