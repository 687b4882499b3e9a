#include "cmd_install.h"

#include "content_store.h"
#include "installer.h"
#include "lockfile.h"
#include "platform.h"
#include "project_manifest.h"
#include "registry.h"
#include "resolver.h"
#include "script_runner.h"
#include "tui.h"
#include "version_range.h"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace xpm {

namespace fs = std::filesystem;

namespace {

bool is_any_version(std::string_view requirement) {
  return requirement.empty() || requirement == "latest" || requirement == "*";
}

std::string registry_url(std::string const &configured) {
  if (!configured.empty()) { return configured; }
  if (char const *env{ std::getenv("XPM_REGISTRY") }; env && *env) { return env; }
  return kDefaultRegistry;
}

std::string version_of(std::vector<resolved_package> const &resolved,
                       std::string const &name) {
  for (auto const &pkg : resolved) {
    if (pkg.name == name) { return pkg.version; }
  }
  throw std::runtime_error("install: " + name + " missing from the resolved graph");
}

void log_failures(char const *what, install_report const &report) {
  for (auto const &f : report.failures) {
    tui::error("install: %s %s failed: %s", what, f.package.c_str(), f.message.c_str());
  }
}

}  // namespace

std::pair<std::string, std::string> cmd_install_parse_package_arg(std::string_view arg) {
  auto const at{ arg.rfind('@') };
  if (at == std::string_view::npos || at == 0) { return { std::string(arg), "latest" }; }

  std::string name{ arg.substr(0, at) };
  std::string requirement{ arg.substr(at + 1) };
  if (requirement.empty()) { return { std::move(name), "latest" }; }
  if (version_is_exact(requirement)) {
    return { std::move(name), "=" + version_strip_exact(requirement) };
  }
  return { std::move(name), std::move(requirement) };
}

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("install", "Install packages into a project") };
  auto cfg_ptr{ std::make_shared<cfg>() };

  sub->add_option("packages",
                  cfg_ptr->packages,
                  "Packages as name[@range] (install package.json if omitted)");
  sub->add_option("--registry", cfg_ptr->registry, "Registry base URL");
  sub->add_option("--retries", cfg_ptr->retries, "Network retries per request");
  sub->add_option("--project", cfg_ptr->project_dir, "Project directory");
  sub->add_flag("--global,-g", cfg_ptr->global, "Install into ~/.xpm_global");

  auto *copy{ sub->add_flag_callback(
      "--copy",
      [cfg_ptr] { cfg_ptr->materialize = materialize_mode::copy; },
      "Copy files out of the store instead of hard-linking") };
  sub->add_flag_callback("--hard-link",
                         [cfg_ptr] { cfg_ptr->materialize = materialize_mode::hard_link; },
                         "Hard-link only, failing across filesystems")
      ->excludes(copy);

  sub->add_option("--batch-size", cfg_ptr->batch_size, "Packages installed concurrently")
      ->check(CLI::PositiveNumber);
  sub->add_option("--script-timeout", cfg_ptr->script_timeout, "Seconds per lifecycle script")
      ->check(CLI::PositiveNumber);

  std::map<std::string, lifecycle_mode> const script_modes{
    { "runner", lifecycle_mode::runner },
    { "inline", lifecycle_mode::inline_scripts },
    { "none", lifecycle_mode::none },
  };
  sub->add_option("--scripts", cfg_ptr->scripts, "Lifecycle scripts: runner, inline or none")
      ->transform(CLI::CheckedTransformer(script_modes, CLI::ignore_case));

  sub->add_option("--jobs,-j", cfg_ptr->jobs, "Lifecycle scripts run concurrently");
  sub->add_option("--only-built",
                  cfg_ptr->only_built,
                  "Only run lifecycle scripts of these packages");
  sub->add_flag("--metadata-cache",
                cfg_ptr->metadata_cache,
                "Cache registry metadata under the store root");
  sub->add_flag("--frozen-lockfile",
                cfg_ptr->frozen_lockfile,
                "Fail unless the lockfile satisfies every requirement");

  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_install::cmd_install(cfg cfg, std::optional<fs::path> const &cli_store_root)
    : cfg_{ std::move(cfg) }, cli_store_root_{ cli_store_root } {}

bool cmd_install::execute() {
  auto const store_root{ cli_store_root_ ? cli_store_root_ : platform::get_default_store_root() };
  if (!store_root) {
    throw std::runtime_error(std::string("install: cannot determine store root; set ") +
                             platform::get_default_store_root_env_vars() +
                             " or pass --store-root");
  }

  curl_registry_transport transport;
  return cmd_install_run(cfg_, *store_root, transport);
}

bool cmd_install_run(cmd_install::cfg const &cfg,
                     fs::path const &store_root,
                     registry_transport &transport) {
  fs::path target;
  if (cfg.global) {
    auto const home{ platform::home_dir() };
    if (!home) { throw std::runtime_error("install: --global requires HOME"); }
    target = *home / ".xpm_global";
  } else {
    target = fs::absolute(cfg.project_dir.value_or(fs::current_path()));
  }

  auto const manifest_path{ target / "package.json" };
  auto const lock_path{ target / kLockfileName };
  auto const node_modules{ target / "node_modules" };

  std::optional<package_manifest> manifest;
  if (!cfg.global) { manifest = package_manifest::load(manifest_path); }

  dependency_map project_requirements;
  if (manifest) { project_requirements = manifest->install_requirements(); }

  dependency_map requested;
  std::set<std::string> record_names;  // written back as ^version
  if (cfg.packages.empty()) {
    if (!manifest) {
      throw std::runtime_error("install: no package.json in " + target.string());
    }
    requested = project_requirements;
    for (auto const &[name, requirement] : requested) {
      if (is_any_version(requirement)) { record_names.insert(name); }
    }
  } else {
    for (auto const &arg : cfg.packages) {
      auto [name, requirement]{ cmd_install_parse_package_arg(arg) };
      record_names.insert(name);
      requested[std::move(name)] = std::move(requirement);
    }
  }

  if (requested.empty()) {
    tui::info("install: nothing to install");
    return true;
  }

  dependency_map roots{ project_requirements };
  for (auto const &[name, requirement] : requested) { roots[name] = requirement; }

  std::optional<lockfile> old_lock;
  if (!cfg.global) { old_lock = lockfile::load(lock_path); }
  bool const lock_usable{ old_lock && old_lock->satisfies(roots) };
  if (cfg.frozen_lockfile && !lock_usable) {
    throw std::runtime_error(std::string("install: ") + kLockfileName +
                             " is missing or does not satisfy the requirements "
                             "(--frozen-lockfile)");
  }

  dependency_map to_install;
  for (auto const &[name, requirement] : requested) {
    if (version_is_exact(requirement)) {
      auto const installed{ package_installed_version(node_modules, name) };
      if (installed && *installed == version_strip_exact(requirement)) {
        tui::info("install: %s@%s already installed", name.c_str(), installed->c_str());
        continue;
      }
    }
    to_install.emplace(name, requirement);
  }

  if (to_install.empty()) {
    tui::info("install: %zu package(s) already up to date", requested.size());
    return true;
  }

  content_store store{ store_root };
  registry_client registry{
    transport,
    registry_options{ .base_url = registry_url(cfg.registry),
                      .retries = cfg.retries,
                      .cache_dir = cfg.metadata_cache ? std::optional<fs::path>{ store_root }
                                                      : std::nullopt }
  };

  std::vector<resolved_package> resolved;
  std::map<std::string, std::string> root_versions;
  if (lock_usable) {
    lockfile subset{ *old_lock };
    std::set<std::string> names;
    for (auto const &[name, requirement] : to_install) { names.insert(name); }
    subset.prune(names);
    tui::info("install: reusing %s for %zu package(s)", kLockfileName, subset.packages.size());
    resolved = subset.to_resolved(registry);
    for (auto const &name : names) { root_versions[name] = subset.packages.at(name).version; }
  } else {
    resolver r{ registry };
    resolved = r.resolve(to_install);
    for (auto const &[name, requirement] : to_install) {
      auto const picked{ r.find_compatible_version(name, requirement) };
      root_versions[name] = picked ? *picked : version_of(resolved, name);
    }
  }

  auto all{ resolved };
  for (auto &pkg : resolver_shadowed_versions(resolved, registry)) {
    tui::warn("install: also installing %s@%s for dependents of another version",
              pkg.name.c_str(),
              pkg.version.c_str());
    all.push_back(std::move(pkg));
  }

  auto const virtual_store{ cfg.global ? store_root / "virtual_store"
                                        : node_modules / ".xpm" / "virtual_store" };

  installer inst{ store,
                  registry,
                  installer_options{
                      .virtual_store_root = virtual_store,
                      .project_root = target,
                      .materialize = cfg.materialize,
                      .scripts = cfg.scripts,
                      .script_timeout = std::chrono::seconds{ cfg.script_timeout },
                      .batch_size = cfg.batch_size,
                  } };

  std::set<std::string> fresh;
  for (auto const &pkg : all) {
    if (!fs::exists(inst.package_dir(pkg.name, pkg.version) / "package.json")) {
      fresh.insert(pkg.key());
    }
  }

  auto const report{ inst.install_all(all) };
  log_failures("package", report);

  std::vector<std::pair<std::string, std::string>> const root_list(root_versions.begin(),
                                                                   root_versions.end());
  auto link_report{ inst.link_all_to_root(root_list) };

  if (cfg.global) {
    for (auto const &[name, version] : root_list) {
      try {
        inst.link_binaries_to(name, version, target / "bin");
      } catch (std::exception const &e) {
        link_report.failures.push_back({ name + "@" + version, e.what() });
      }
    }
  }
  log_failures("link", link_report);

  script_summary scripts;
  if (cfg.scripts == lifecycle_mode::runner && !fresh.empty()) {
    script_runner const runner{ script_runner_options{
        .project_root = target,
        .virtual_store_root = virtual_store,
        .timeout = std::chrono::seconds{ cfg.script_timeout },
        .max_parallel = cfg.jobs,
        .only_built_dependencies = std::set<std::string>(cfg.only_built.begin(),
                                                         cfg.only_built.end()),
        .global_bin_dir = cfg.global ? std::optional<fs::path>{ target / "bin" }
                                      : std::nullopt,
    } };
    scripts = runner.execute(script_runner::order(runner.scan(all, fresh)));
    for (auto const &failure : scripts.failures) {
      tui::error("install: script %s", failure.c_str());
    }
  }

  if (!cfg.global) {
    auto next{ old_lock.value_or(lockfile{}) };
    std::vector<std::pair<std::string, std::string>> stale;
    auto current{ lockfile::from_resolved(resolved) };
    for (auto &[name, entry] : current.packages) {
      if (auto const it{ next.packages.find(name) };
          it != next.packages.end() && it->second.version != entry.version) {
        stale.emplace_back(name, it->second.version);
      }
      next.packages[name] = std::move(entry);
    }

    std::set<std::string> root_names;
    for (auto const &[name, requirement] : roots) { root_names.insert(name); }
    auto const before{ next.packages };
    for (auto const &name : next.prune(root_names)) {
      stale.emplace_back(name, before.at(name).version);
    }

    std::set<std::string> wanted;
    for (auto const &pkg : all) { wanted.insert(pkg.key()); }
    for (auto const &[name, version] : stale) {
      if (wanted.contains(name + "@" + version)) { continue; }
      tui::info("install: removing %s@%s", name.c_str(), version.c_str());
      try {
        inst.remove_package(name, version);
      } catch (std::exception const &e) {
        tui::warn("install: could not remove %s@%s: %s", name.c_str(), version.c_str(), e.what());
      }
    }

    if (report.ok()) {
      next.save(lock_path);

      std::map<std::string, std::string> recorded;
      for (auto const &name : record_names) {
        if (auto const it{ root_versions.find(name) }; it != root_versions.end()) {
          recorded.emplace(name, it->second);
        }
      }
      if (!recorded.empty()) { package_manifest_record_versions(manifest_path, recorded); }
    }
  }

  for (auto const &[name, version] : root_list) {
    tui::print_stdout("+ %s %s\n", name.c_str(), version.c_str());
  }
  tui::info("install: %zu package(s) installed, %zu failed",
            report.installed,
            report.failures.size());
  if (scripts.succeeded + scripts.failed > 0) {
    tui::info("install: %zu script(s) succeeded, %zu failed (%zu timed out)",
              scripts.succeeded,
              scripts.failed,
              scripts.timed_out);
  }

  return report.ok() && link_report.ok() && scripts.failed == 0;
}

}  // namespace xpm
