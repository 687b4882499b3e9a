#include "script_runner.h"

#include "platform.h"
#include "project_manifest.h"
#include "shell.h"
#include "tui.h"

#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace xpm {

namespace {

constexpr unsigned kMinScriptParallelism{ 4 };

std::string build_path(script_task const &task,
                       script_runner_options const &options,
                       shell_env_t const &inherited) {
  std::vector<std::filesystem::path> candidates{
    task.package_dir.parent_path() / ".bin",
    options.project_root / "node_modules" / ".bin",
  };
  if (options.global_bin_dir) {
    candidates.push_back(*options.global_bin_dir);
  } else if (auto const home{ platform::home_dir() }) {
    candidates.push_back(*home / ".xpm_global" / "bin");
  }

  std::string path;
  for (auto const &dir : candidates) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) { continue; }
    if (!path.empty()) { path.push_back(':'); }
    path += dir.string();
  }

  if (auto const it{ inherited.find("PATH") }; it != inherited.end() && !it->second.empty()) {
    if (!path.empty()) { path.push_back(':'); }
    path += it->second;
  }
  return path;
}

shell_env_t script_env(script_task const &task, script_runner_options const &options) {
  auto env{ shell_getenv() };
  env["PATH"] = build_path(task, options, env);
  env["NODE_ENV"] = "production";
  env["CI"] = "true";
  env["npm_config_foreground_scripts"] = "true";
  env["npm_package_name"] = task.package_name;
  env["npm_package_version"] = task.package_version;
  env["npm_lifecycle_event"] = script_stage_name(task.stage);
  return env;
}

}  // namespace

char const *script_stage_name(script_stage stage) {
  switch (stage) {
    case script_stage::preinstall: return "preinstall";
    case script_stage::install: return "install";
    case script_stage::postinstall: return "postinstall";
  }
  return "unknown";
}

script_runner::script_runner(script_runner_options options) : options_{ std::move(options) } {}

unsigned script_runner::max_parallel() const {
  if (options_.max_parallel > 0) { return options_.max_parallel; }
  return std::max(std::thread::hardware_concurrency(), kMinScriptParallelism);
}

std::vector<script_task> script_runner::scan(
    std::vector<resolved_package> const &packages,
    std::optional<std::set<std::string>> const &filter) const {
  std::vector<script_task> tasks;

  for (auto const &pkg : packages) {
    if (filter && !filter->contains(pkg.key())) { continue; }
    if (!options_.only_built_dependencies.empty() &&
        !options_.only_built_dependencies.contains(pkg.name)) {
      continue;
    }

    auto const pkg_dir{ util_virtual_store_package_dir(options_.virtual_store_root,
                                                       pkg.name,
                                                       pkg.version) };
    std::optional<package_manifest> manifest;
    try {
      manifest = package_manifest::load(pkg_dir / "package.json");
    } catch (std::runtime_error const &e) {
      tui::warn("scripts: skipping %s: %s", pkg.key().c_str(), e.what());
      continue;
    }
    if (!manifest) { continue; }

    std::vector<std::string> deps;
    if (pkg.metadata) {
      for (auto const &[name, range] : pkg.metadata->dependencies) { deps.push_back(name); }
    }

    for (auto const stage : kScriptStages) {
      auto command{ manifest->script(script_stage_name(stage)) };
      if (!command) { continue; }
      tasks.push_back(script_task{ .package_name = pkg.name,
                                   .package_version = pkg.version,
                                   .package_dir = pkg_dir,
                                   .stage = stage,
                                   .command = std::move(*command),
                                   .dependencies = deps });
    }
  }

  return tasks;
}

std::vector<script_task> script_runner::order(std::vector<script_task> tasks) {
  std::stable_sort(tasks.begin(), tasks.end(), [](script_task const &a, script_task const &b) {
    return static_cast<int>(a.stage) < static_cast<int>(b.stage);
  });
  return tasks;
}

script_outcome script_runner::run_one(script_task const &task) const {
  auto const key{ task.key() };
  char const *stage{ script_stage_name(task.stage) };
  tui::info("%s %s: %s", key.c_str(), stage, task.command.c_str());

  shell_run_cfg const cfg{
    .on_stdout_line =
        [&key](std::string_view line) {
          tui::info("  %s | %.*s", key.c_str(), static_cast<int>(line.size()), line.data());
        },
    .on_stderr_line =
        [&key](std::string_view line) {
          tui::warn("  %s | %.*s", key.c_str(), static_cast<int>(line.size()), line.data());
        },
    .cwd = task.package_dir,
    .env = script_env(task, options_),
    .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout)
  };

  shell_result result;
  try {
    result = shell_run(task.command, cfg);
  } catch (std::exception const &e) {
    return script_outcome{ .exit_code = -1,
                           .message = std::string("failed to start: ") + e.what() };
  }

  if (result.timed_out) {
    return script_outcome{ .timed_out = true,
                           .exit_code = -1,
                           .message = "Script timed out after " +
                                      std::to_string(options_.timeout.count()) + " seconds" };
  }
  if (result.signal) {
    return script_outcome{ .exit_code = result.exit_code,
                           .message = "Script killed by signal " +
                                      std::to_string(*result.signal) };
  }
  if (result.exit_code != 0) {
    return script_outcome{ .exit_code = result.exit_code,
                           .message = "Script exited with code " +
                                      std::to_string(result.exit_code) };
  }
  return script_outcome{ .success = true };
}

script_summary script_runner::execute(std::vector<script_task> const &tasks) const {
  script_summary summary;
  if (tasks.empty()) { return summary; }

  // Group stages by package, keeping stage order within each group.
  std::vector<std::vector<script_task const *>> groups;
  std::map<std::string, std::size_t> group_of;
  auto const ordered{ order(tasks) };
  for (auto const &task : ordered) {
    auto const [it, inserted]{ group_of.try_emplace(task.key(), groups.size()) };
    if (inserted) { groups.emplace_back(); }
    groups[it->second].push_back(&task);
  }

  tui::info("scripts: running %zu script(s) across %zu package(s)",
            tasks.size(),
            groups.size());

  std::mutex summary_mutex;
  tbb::task_arena arena{ static_cast<int>(max_parallel()) };
  arena.execute([&] {
    tbb::task_group tg;
    for (auto const &group : groups) {
      tg.run([&, group_tasks = &group] {
        for (auto const *task : *group_tasks) {
          auto const outcome{ run_one(*task) };
          char const *stage{ script_stage_name(task->stage) };

          std::lock_guard lock{ summary_mutex };
          if (outcome.success) {
            ++summary.succeeded;
            continue;
          }

          ++summary.failed;
          if (outcome.timed_out) { ++summary.timed_out; }
          summary.failures.push_back(task->key() + " " + stage + ": " + outcome.message);
          tui::error("%s %s failed: %s", task->key().c_str(), stage, outcome.message.c_str());
          break;
        }
      });
    }
    tg.wait();
  });

  tui::info("scripts: %zu succeeded, %zu failed (%zu timed out)",
            summary.succeeded,
            summary.failed,
            summary.timed_out);
  return summary;
}

}  // namespace xpm
