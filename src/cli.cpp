#include "cli.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace xpm {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "xpm - content-addressed package installer" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (prefix output with timestamp and level)");

  cli_args args{};
  app.add_option("--store-root",
                 args.store_root,
                 "Content store root (defaults to $XPM_STORE_ROOT or the user data dir)");

  // -v / --version trigger the version command directly.
  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  cmd_install::register_cli(app, [&cmd_cfg](cmd_install::cfg cfg) { cmd_cfg = std::move(cfg); });
  cmd_version::register_cli(app, [&cmd_cfg](cmd_version::cfg cfg) { cmd_cfg = std::move(cfg); });

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace xpm
