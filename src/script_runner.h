#pragma once

#include "resolver.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

enum class script_stage { preinstall, install, postinstall };

inline constexpr script_stage kScriptStages[]{ script_stage::preinstall,
                                               script_stage::install,
                                               script_stage::postinstall };

char const *script_stage_name(script_stage stage);

struct script_task {
  std::string package_name;
  std::string package_version;
  std::filesystem::path package_dir;
  script_stage stage;
  std::string command;
  std::vector<std::string> dependencies;  // declared dependency names

  std::string key() const { return package_name + "@" + package_version; }
};

struct script_outcome {
  bool success{ false };
  bool timed_out{ false };
  int exit_code{ 0 };
  std::string message;  // empty on success
};

struct script_summary {
  std::size_t succeeded{ 0 };
  std::size_t failed{ 0 };     // includes timed_out
  std::size_t timed_out{ 0 };
  std::vector<std::string> failures;  // "name@version stage: message"
};

struct script_runner_options {
  std::filesystem::path project_root;
  std::filesystem::path virtual_store_root;
  std::chrono::seconds timeout{ 300 };
  unsigned max_parallel{ 0 };  // 0 -> max(hardware threads, 4)
  std::set<std::string> only_built_dependencies;  // empty allows every package
  std::optional<std::filesystem::path> global_bin_dir;  // default $HOME/.xpm_global/bin
};

class script_runner : unmovable {
 public:
  explicit script_runner(script_runner_options options);

  // One task per lifecycle stage each package declares. filter limits the scan to
  // "name@version" keys. Packages missing from the virtual store are skipped.
  std::vector<script_task> scan(std::vector<resolved_package> const &packages,
                                std::optional<std::set<std::string>> const &filter = {}) const;

  // Stable sort by stage: preinstall, install, postinstall. Not a dependency order.
  static std::vector<script_task> order(std::vector<script_task> tasks);

  // Runs packages concurrently, up to max_parallel at a time. A package's stages
  // run in order and stop at its first failure. Never throws for script failures.
  script_summary execute(std::vector<script_task> const &tasks) const;

  // Runs one stage in the package dir under the timeout, streaming its output.
  script_outcome run_one(script_task const &task) const;

  unsigned max_parallel() const;
  script_runner_options const &options() const { return options_; }

 private:
  script_runner_options options_;
};

}  // namespace xpm
