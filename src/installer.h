#pragma once

#include "content_store.h"
#include "registry.h"
#include "resolver.h"
#include "script_runner.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace xpm {

enum class materialize_mode { hard_link, copy, hard_link_or_copy };

// runner: scripts are left for a script_runner pass after linking
// inline: each package runs its own stages during install_all
enum class lifecycle_mode { runner, inline_scripts, none };

struct installer_options {
  std::filesystem::path virtual_store_root;
  std::filesystem::path project_root;
  materialize_mode materialize{ materialize_mode::hard_link_or_copy };
  lifecycle_mode scripts{ lifecycle_mode::runner };
  std::chrono::seconds script_timeout{ 300 };
  std::size_t batch_size{ 50 };
  int extract_concurrency{ 0 };  // 0 -> hardware threads
};

struct install_failure {
  std::string package;  // name@version
  std::string message;
};

struct install_report {
  std::size_t installed{ 0 };
  std::vector<install_failure> failures;

  bool ok() const { return failures.empty(); }
};

class installer : unmovable {
 public:
  installer(content_store &store, registry_client &registry, installer_options options);
  ~installer();

  // Index of the package's files in the store. Downloads, verifies and extracts at
  // most once per name@version per run; a persisted index skips all of that.
  package_index ensure_extracted(resolved_package const &pkg);

  // Populate <vstore>/<store name>/node_modules/<name>/ from the store.
  void materialize(resolved_package const &pkg, package_index const &index);

  // Sibling symlinks from the package's node_modules to each resolved dependency's
  // virtual-store entry. Throws when a target entry is missing.
  void link_dependencies(resolved_package const &pkg);

  // preinstall, install, postinstall in order, stopping at the first failure.
  // Returns false when a stage failed; never throws for script failures.
  bool run_lifecycle_scripts(resolved_package const &pkg);

  // <project>/node_modules/<name> -> virtual-store entry, plus node_modules/.bin links.
  void link_to_root(std::string const &name, std::string const &version);

  // Bin links for pkg into bin_dir. Returns the linked command names.
  std::vector<std::string> link_binaries_to(std::string const &name,
                                            std::string const &version,
                                            std::filesystem::path const &bin_dir);

  // Extract and materialize every package, then link dependencies once all entries
  // exist. Per-package failures are collected; siblings keep going.
  install_report install_all(std::vector<resolved_package> const &packages);

  // link_to_root for each (name, version), in parallel.
  install_report link_all_to_root(
      std::vector<std::pair<std::string, std::string>> const &roots);

  // Remove <project>/node_modules/<name> and the package's virtual-store entry.
  void remove_package(std::string const &name, std::string const &version);

  std::filesystem::path package_dir(std::string const &name, std::string const &version) const;
  installer_options const &options() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace xpm
