#pragma once

#include "cmds/cmd_install.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace xpm {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_install::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> store_root;  // Global store root override
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace xpm
