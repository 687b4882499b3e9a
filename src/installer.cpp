#include "installer.h"

#include "extract.h"
#include "integrity.h"
#include "platform.h"
#include "project_manifest.h"
#include "tui.h"

#include "tbb/parallel_for_each.h"
#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace xpm {

namespace {

bool should_fall_back_to_copy(std::error_code const &ec) {
  return ec == std::errc::cross_device_link || ec == std::errc::permission_denied ||
         ec == std::errc::operation_not_permitted || ec == std::errc::too_many_links;
}

void place_file(std::filesystem::path const &blob,
                std::filesystem::path const &dest,
                materialize_mode mode) {
  switch (mode) {
    case materialize_mode::hard_link: std::filesystem::create_hard_link(blob, dest); return;

    case materialize_mode::copy:
      std::filesystem::copy_file(blob, dest, std::filesystem::copy_options::overwrite_existing);
      return;

    case materialize_mode::hard_link_or_copy: {
      std::error_code ec;
      std::filesystem::create_hard_link(blob, dest, ec);
      if (!ec) { return; }
      if (!should_fall_back_to_copy(ec)) {
        throw std::filesystem::filesystem_error("installer: hard link failed", blob, dest, ec);
      }
      std::filesystem::copy_file(blob, dest, std::filesystem::copy_options::overwrite_existing);
      return;
    }
  }
}

// Blob-backed files stay read-only so the shared store is never made writable.
void mark_bin_executable(std::filesystem::path const &target) {
  std::error_code ec;
  auto const links{ std::filesystem::hard_link_count(target, ec) };
  if (!ec && links > 1) {
    platform::make_read_only(target, true);
  } else {
    platform::make_executable(target);
  }
}

}  // namespace

struct installer::impl {
  content_store &store;
  registry_client &registry;
  installer_options options;
  tbb::task_arena extract_arena;
  script_runner scripts;

  std::mutex extractions_mutex;
  std::unordered_map<std::string, std::shared_future<package_index>> extractions;

  impl(content_store &s, registry_client &r, installer_options o)
      : store{ s },
        registry{ r },
        options{ std::move(o) },
        extract_arena{ options.extract_concurrency > 0 ? options.extract_concurrency
                                                       : tbb::task_arena::automatic },
        scripts{ script_runner_options{ .project_root = options.project_root,
                                        .virtual_store_root = options.virtual_store_root,
                                        .timeout = options.script_timeout } } {}

  package_index extract_uncached(resolved_package const &pkg);
};

package_index installer::impl::extract_uncached(resolved_package const &pkg) {
  if (auto index{ store.get_index(pkg.name, pkg.version) }) {
    tui::debug("installer: %s already in store", pkg.key().c_str());
    return std::move(*index);
  }

  auto const meta{ pkg.metadata ? pkg.metadata
                                : registry.get_version_metadata(pkg.name, pkg.version) };

  auto const tarball{ store.tarballs_dir() /
                      (util_package_store_name(pkg.name, pkg.version) + ".tgz") };
  if (!std::filesystem::exists(tarball)) {
    tui::debug("installer: downloading %s", meta->dist.tarball.c_str());
    registry.download_tarball(meta->dist.tarball, tarball);
    tui::debug("installer: downloaded %s (%s)",
               pkg.key().c_str(),
               util_format_bytes(std::filesystem::file_size(tarball)).c_str());
  }

  try {
    integrity_verify(tarball, meta->dist.integrity, meta->dist.shasum);
  } catch (std::runtime_error const &) {
    std::error_code ec;
    std::filesystem::remove(tarball, ec);
    throw;
  }

  package_index index;
  extract_arena.execute([&] { index = extract_to_store(tarball, store); });
  store.store_index(pkg.name, pkg.version, index);
  tui::debug("installer: extracted %s (%zu files)", pkg.key().c_str(), index.size());
  return index;
}

installer::installer(content_store &store, registry_client &registry, installer_options options)
    : m{ std::make_unique<impl>(store, registry, std::move(options)) } {}

installer::~installer() = default;

installer_options const &installer::options() const { return m->options; }

std::filesystem::path installer::package_dir(std::string const &name,
                                             std::string const &version) const {
  return util_virtual_store_package_dir(m->options.virtual_store_root, name, version);
}

package_index installer::ensure_extracted(resolved_package const &pkg) {
  auto const key{ pkg.key() };

  std::promise<package_index> promise;
  std::shared_future<package_index> pending;
  {
    std::lock_guard lock{ m->extractions_mutex };
    if (auto const it{ m->extractions.find(key) }; it != m->extractions.end()) {
      pending = it->second;
    } else {
      m->extractions.emplace(key, promise.get_future().share());
    }
  }
  if (pending.valid()) { return pending.get(); }

  try {
    auto index{ m->extract_uncached(pkg) };
    promise.set_value(index);
    return index;
  } catch (...) {
    promise.set_exception(std::current_exception());
    {
      std::lock_guard lock{ m->extractions_mutex };
      m->extractions.erase(key);
    }
    throw;
  }
}

void installer::materialize(resolved_package const &pkg, package_index const &index) {
  auto const dir{ package_dir(pkg.name, pkg.version) };

  std::vector<std::pair<std::filesystem::path, content_hash const *>> files;
  files.reserve(index.size());
  for (auto const &[archive_path, hash] : index) {
    if (auto rel{ extract_strip_components(archive_path, 1) }) {
      files.emplace_back(dir / *rel, &hash);
    }
  }

  bool const complete{ std::filesystem::exists(dir / "package.json") &&
                       std::all_of(files.begin(), files.end(), [](auto const &f) {
                         return std::filesystem::exists(f.first);
                       }) };
  if (complete) {
    tui::debug("installer: %s already materialized", pkg.key().c_str());
    return;
  }

  std::filesystem::create_directories(dir);
  for (auto const &[dest, hash] : files) {
    std::filesystem::create_directories(dest.parent_path());
    std::error_code ec;
    std::filesystem::remove(dest, ec);
    place_file(m->store.blob_path(*hash), dest, m->options.materialize);
  }
}

void installer::link_dependencies(resolved_package const &pkg) {
  auto const node_modules{ m->options.virtual_store_root /
                           util_package_store_name(pkg.name, pkg.version) / "node_modules" };

  for (auto const &[dep_name, dep_version] : pkg.resolved_dependencies) {
    if (dep_name == pkg.name) { continue; }  // would replace the package itself

    auto const target{ package_dir(dep_name, dep_version) };
    if (!std::filesystem::is_directory(target)) {
      throw std::runtime_error("installer: missing dependency target " + target.string() +
                               " for " + pkg.key());
    }
    util_replace_with_relative_symlink(target, node_modules / dep_name);
  }
}

bool installer::run_lifecycle_scripts(resolved_package const &pkg) {
  auto const dir{ package_dir(pkg.name, pkg.version) };

  std::optional<package_manifest> manifest;
  try {
    manifest = package_manifest::load(dir / "package.json");
  } catch (std::runtime_error const &e) {
    tui::error("installer: cannot read scripts of %s: %s", pkg.key().c_str(), e.what());
    return false;
  }
  if (!manifest) { return true; }

  for (auto const stage : kScriptStages) {
    auto command{ manifest->script(script_stage_name(stage)) };
    if (!command) { continue; }

    auto const outcome{ m->scripts.run_one(script_task{ .package_name = pkg.name,
                                                         .package_version = pkg.version,
                                                         .package_dir = dir,
                                                         .stage = stage,
                                                         .command = std::move(*command) }) };
    if (!outcome.success) {
      tui::error("%s %s failed: %s",
                 pkg.key().c_str(),
                 script_stage_name(stage),
                 outcome.message.c_str());
      return false;
    }
  }
  return true;
}

std::vector<std::string> installer::link_binaries_to(std::string const &name,
                                                     std::string const &version,
                                                     std::filesystem::path const &bin_dir) {
  auto const dir{ package_dir(name, version) };
  auto const manifest{ package_manifest::load(dir / "package.json") };
  if (!manifest) { return {}; }

  std::vector<std::string> linked;
  for (auto const &[command, rel_path] : manifest->bin_links(name)) {
    auto const target{ (dir / rel_path).lexically_normal() };
    if (!std::filesystem::exists(target)) {
      tui::debug("installer: %s bin '%s' missing target %s",
                 name.c_str(),
                 command.c_str(),
                 target.c_str());
      continue;
    }

    std::string const command_name{ package_unscoped_name(command) };
    util_replace_with_relative_symlink(target, bin_dir / command_name);
    mark_bin_executable(target);
    linked.push_back(command_name);
  }
  return linked;
}

void installer::link_to_root(std::string const &name, std::string const &version) {
  auto const target{ package_dir(name, version) };
  if (!std::filesystem::is_directory(target)) {
    throw std::runtime_error("installer: " + name + "@" + version + " is not materialized");
  }

  auto const node_modules{ m->options.project_root / "node_modules" };
  util_replace_with_relative_symlink(target, node_modules / name);
  link_binaries_to(name, version, node_modules / ".bin");
}

install_report installer::install_all(std::vector<resolved_package> const &packages) {
  install_report report;
  std::mutex report_mutex;
  std::vector<std::uint8_t> materialized(packages.size(), 0);
  std::vector<std::uint8_t> linked(packages.size(), 0);

  auto const record_failure{ [&](resolved_package const &pkg, std::exception const &e) {
    tui::error("installer: %s: %s", pkg.key().c_str(), e.what());
    std::lock_guard lock{ report_mutex };
    report.failures.push_back(install_failure{ .package = pkg.key(), .message = e.what() });
  } };

  tbb::task_arena batch{ static_cast<int>(std::max<std::size_t>(m->options.batch_size, 1)) };

  batch.execute([&] {
    tbb::task_group tg;
    for (std::size_t i{ 0 }; i < packages.size(); ++i) {
      tg.run([&, i] {
        auto const &pkg{ packages[i] };
        try {
          materialize(pkg, ensure_extracted(pkg));
          materialized[i] = 1;
        } catch (std::exception const &e) { record_failure(pkg, e); }
      });
    }
    tg.wait();
  });

  batch.execute([&] {
    tbb::task_group tg;
    for (std::size_t i{ 0 }; i < packages.size(); ++i) {
      if (!materialized[i]) { continue; }
      tg.run([&, i] {
        auto const &pkg{ packages[i] };
        try {
          link_dependencies(pkg);
          linked[i] = 1;
        } catch (std::exception const &e) { record_failure(pkg, e); }
      });
    }
    tg.wait();
  });

  if (m->options.scripts == lifecycle_mode::inline_scripts) {
    batch.execute([&] {
      tbb::task_group tg;
      for (std::size_t i{ 0 }; i < packages.size(); ++i) {
        if (!linked[i]) { continue; }
        tg.run([&, i] { run_lifecycle_scripts(packages[i]); });
      }
      tg.wait();
    });
  }

  report.installed = static_cast<std::size_t>(std::count(linked.begin(), linked.end(), 1));
  return report;
}

install_report installer::link_all_to_root(
    std::vector<std::pair<std::string, std::string>> const &roots) {
  install_report report;
  std::mutex report_mutex;
  std::atomic<std::size_t> linked{ 0 };

  std::filesystem::create_directories(m->options.project_root / "node_modules" / ".bin");

  tbb::parallel_for_each(roots.begin(), roots.end(), [&](std::pair<std::string, std::string> const &root) {
    auto const &[name, version]{ root };
    try {
      link_to_root(name, version);
      ++linked;
    } catch (std::exception const &e) {
      tui::error("installer: linking %s@%s: %s", name.c_str(), version.c_str(), e.what());
      std::lock_guard lock{ report_mutex };
      report.failures.push_back(
          install_failure{ .package = name + "@" + version, .message = e.what() });
    }
  });

  report.installed = linked.load();
  return report;
}

void installer::remove_package(std::string const &name, std::string const &version) {
  auto const dir{ package_dir(name, version) };
  auto const node_modules{ m->options.project_root / "node_modules" };

  std::map<std::string, std::string> bins;
  try {
    if (auto const manifest{ package_manifest::load(dir / "package.json") }) {
      bins = manifest->bin_links(name);
    }
  } catch (std::runtime_error const &e) {
    tui::debug("installer: %s@%s has no readable package.json: %s",
               name.c_str(),
               version.c_str(),
               e.what());
  }

  std::error_code ec;
  auto const root_link{ node_modules / name };
  if (std::filesystem::is_symlink(root_link, ec) &&
      std::filesystem::equivalent(root_link, dir, ec)) {
    std::filesystem::remove(root_link, ec);
  }

  std::filesystem::remove_all(m->options.virtual_store_root /
                              util_package_store_name(name, version));

  // Bin links into the removed entry are now dangling.
  for (auto const &[command, rel_path] : bins) {
    auto const link{ node_modules / ".bin" / std::string{ package_unscoped_name(command) } };
    if (std::filesystem::is_symlink(link, ec) && !std::filesystem::exists(link, ec)) {
      std::filesystem::remove(link, ec);
    }
  }

  tui::debug("installer: removed %s@%s", name.c_str(), version.c_str());
}

}  // namespace xpm
