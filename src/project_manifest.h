#pragma once

#include "registry.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xpm {

// The fields of a package.json that installation cares about. Used both for the
// project's own manifest and for the package.json inside each installed package.
struct package_manifest {
  std::string name;
  std::string version;
  dependency_map dependencies;
  dependency_map dev_dependencies;
  dependency_map optional_dependencies;
  std::map<std::string, std::string> scripts;
  std::map<std::string, std::string> bin;  // command name -> package-relative path
  std::optional<std::string> bin_path;     // string form of "bin"

  // Throws std::runtime_error on malformed JSON or a non-object document.
  static package_manifest parse(std::string_view json);

  // nullopt when the file does not exist.
  static std::optional<package_manifest> load(std::filesystem::path const &path);

  // dependencies, then devDependencies, then optionalDependencies; the first
  // declaration of a name wins.
  dependency_map install_requirements() const;

  // Both "bin" forms as command name -> relative path. The string form is named after
  // package_name without its scope.
  std::map<std::string, std::string> bin_links(std::string_view package_name) const;

  std::optional<std::string> script(std::string_view stage) const;
};

// "@scope/tool" -> "tool"
std::string_view package_unscoped_name(std::string_view name);

// Write name -> "^version" into the package.json at path. A name already under
// devDependencies is updated there, everything else lands in dependencies. Other
// keys are preserved. No-op when the file does not exist.
void package_manifest_record_versions(std::filesystem::path const &path,
                                      std::map<std::string, std::string> const &versions);

// Version field of <node_modules>/<name>/package.json, if installed.
std::optional<std::string> package_installed_version(
    std::filesystem::path const &node_modules,
    std::string const &name);

}  // namespace xpm
