#pragma once

#include "cmd.h"
#include "installer.h"
#include "registry.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CLI { class App; }

namespace xpm {

class cmd_install : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_install> {
    std::vector<std::string> packages;  // empty installs the project's package.json
    std::string registry;               // empty -> $XPM_REGISTRY, else npmjs
    unsigned retries{ 2 };
    std::optional<std::filesystem::path> project_dir;
    bool global{ false };
    materialize_mode materialize{ materialize_mode::hard_link_or_copy };
    std::size_t batch_size{ 50 };
    unsigned script_timeout{ 300 };
    lifecycle_mode scripts{ lifecycle_mode::runner };
    unsigned jobs{ 0 };
    std::vector<std::string> only_built;
    bool metadata_cache{ false };
    bool frozen_lockfile{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_install(cfg cfg, std::optional<std::filesystem::path> const &cli_store_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_store_root_;
};

// The install pipeline against an explicit store root and registry transport.
bool cmd_install_run(cmd_install::cfg const &cfg,
                     std::filesystem::path const &store_root,
                     registry_transport &transport);

// "name[@range]" -> {name, requirement}. Splits on the last '@' past a leading scope
// marker. A bare version is pinned ("=1.2.3"); no range means "latest".
std::pair<std::string, std::string> cmd_install_parse_package_arg(std::string_view arg);

}  // namespace xpm
