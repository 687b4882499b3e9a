#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace xpm {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // False reports a handled failure; unexpected errors throw.
  virtual bool execute() = 0;

  // cli_store_root is the global --store-root override.
  template <typename config>
  static ptr_t create(config const &cfg,
                      std::optional<std::filesystem::path> const &cli_store_root);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg,
                       std::optional<std::filesystem::path> const &cli_store_root) {
  return std::make_unique<typename config::cmd_t>(cfg, cli_store_root);
}

}  // namespace xpm
