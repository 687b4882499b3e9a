#pragma once

#include "registry.h"
#include "util.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

struct resolved_package {
  std::string name;
  std::string version;
  version_metadata_ptr metadata;
  std::map<std::string, std::string> resolved_dependencies;  // name -> chosen version

  std::string key() const { return name + "@" + version; }
};

struct resolver_options {
  std::string os;   // empty means the host
  std::string cpu;  // empty means the host
};

class resolver : unmovable {
 public:
  explicit resolver(registry_client &registry, resolver_options options = {});
  ~resolver();

  // Expand requirements (name -> range or dist-tag) into the full graph. One entry per
  // package name, sorted by name. When two ranges pick different versions of one
  // name, the last one recorded wins and a warning is logged.
  std::vector<resolved_package> resolve(dependency_map const &requirements);

  // Version chosen for name@requirement during the last resolve, if any.
  std::optional<std::string> find_compatible_version(std::string const &name,
                                                     std::string const &requirement) const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

// Entries that some resolved_dependencies point at but that lost the name-keyed
// pick, closed over their own dependencies. Ranges of the added entries are picked
// against the registry directly. Never returns a name@version already in resolved.
std::vector<resolved_package> resolver_shadowed_versions(
    std::vector<resolved_package> const &resolved,
    registry_client &registry);

// "latest"/"*"/""/"x" -> latest tag; another tag name -> that tag; otherwise the
// greatest version in range, falling back to the latest tag. Throws std::runtime_error
// when nothing fits.
std::string resolver_pick_version(registry_package const &pkg, std::string_view requirement);

// os/cpu lists may contain "!name" exclusions. Empty lists allow everything.
bool resolver_platform_supported(version_metadata const &meta,
                                 std::string_view os,
                                 std::string_view cpu);

}  // namespace xpm
