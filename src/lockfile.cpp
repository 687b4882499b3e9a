#include "lockfile.h"

#include "tui.h"
#include "util.h"
#include "version_range.h"

#include "picojson.h"
#include "tbb/task_group.h"

#include <deque>
#include <stdexcept>
#include <utility>

namespace xpm {

namespace {

std::string required_string(picojson::object const &o,
                            char const *key,
                            std::string const &owner) {
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<std::string>()) {
    throw std::runtime_error("lockfile: entry '" + owner + "' lacks string field '" + key +
                             "'");
  }
  return it->second.get<std::string>();
}

bool is_any_version(std::string_view requirement) {
  return requirement.empty() || requirement == "latest" || requirement == "*" ||
         requirement == "x";
}

}  // namespace

lockfile lockfile::from_resolved(std::vector<resolved_package> const &resolved) {
  lockfile lf;
  for (auto const &pkg : resolved) {
    lf.packages[pkg.name] =
        lockfile_entry{ .version = pkg.version,
                        .resolved = pkg.metadata ? pkg.metadata->dist.tarball : std::string{},
                        .dependencies = pkg.resolved_dependencies };
  }
  return lf;
}

lockfile lockfile::parse(std::string_view json) {
  picojson::value root;
  if (std::string const err{ picojson::parse(root, std::string{ json }) }; !err.empty()) {
    throw std::runtime_error("lockfile: malformed JSON: " + err);
  }

  if (!root.is<picojson::object>()) {
    throw std::runtime_error("lockfile: document is not an object");
  }
  auto const &doc{ root.get<picojson::object>() };

  auto const version{ doc.find("lockfileVersion") };
  if (version == doc.end() || !version->second.is<double>()) {
    throw std::runtime_error("lockfile: missing lockfileVersion");
  }
  if (version->second.get<double>() != kLockfileVersion) {
    throw std::runtime_error("lockfile: unsupported lockfileVersion " +
                             version->second.to_str());
  }

  auto const packages{ doc.find("packages") };
  if (packages == doc.end() || !packages->second.is<picojson::object>()) {
    throw std::runtime_error("lockfile: 'packages' must be an object");
  }

  lockfile lf;
  for (auto const &[name, value] : packages->second.get<picojson::object>()) {
    if (!value.is<picojson::object>()) {
      throw std::runtime_error("lockfile: entry '" + name + "' is not an object");
    }
    auto const &entry{ value.get<picojson::object>() };

    lockfile_entry e{ .version = required_string(entry, "version", name),
                      .resolved = required_string(entry, "resolved", name) };

    if (auto const deps{ entry.find("dependencies") }; deps != entry.end()) {
      if (!deps->second.is<picojson::object>()) {
        throw std::runtime_error("lockfile: dependencies of '" + name + "' must be an object");
      }
      for (auto const &[dep, dep_version] : deps->second.get<picojson::object>()) {
        if (!dep_version.is<std::string>()) {
          throw std::runtime_error("lockfile: dependency '" + dep + "' of '" + name +
                                   "' is not a string");
        }
        e.dependencies.emplace(dep, dep_version.get<std::string>());
      }
    }
    lf.packages.emplace(name, std::move(e));
  }
  return lf;
}

std::optional<lockfile> lockfile::load(std::filesystem::path const &path) {
  if (!std::filesystem::exists(path)) { return std::nullopt; }
  return parse(util_load_text_file(path));
}

std::string lockfile::dump() const {
  picojson::object packages_obj;
  for (auto const &[name, entry] : packages) {
    picojson::object deps;
    for (auto const &[dep, version] : entry.dependencies) {
      deps.emplace(dep, picojson::value(version));
    }
    picojson::object e;
    e.emplace("version", picojson::value(entry.version));
    e.emplace("resolved", picojson::value(entry.resolved));
    e.emplace("dependencies", picojson::value(std::move(deps)));
    packages_obj.emplace(name, picojson::value(std::move(e)));
  }

  picojson::object doc;
  doc.emplace("lockfileVersion", picojson::value(static_cast<double>(kLockfileVersion)));
  doc.emplace("packages", picojson::value(std::move(packages_obj)));

  auto text{ picojson::value(std::move(doc)).serialize(true) };
  if (text.empty() || text.back() != '\n') { text.push_back('\n'); }
  return text;
}

void lockfile::save(std::filesystem::path const &path) const {
  util_write_file_atomic(path, dump());
}

std::set<std::string> lockfile::reachable_from(
    std::set<std::string> const &required_names) const {
  std::set<std::string> seen;
  std::deque<std::string> queue(required_names.begin(), required_names.end());

  while (!queue.empty()) {
    auto name{ std::move(queue.front()) };
    queue.pop_front();

    auto const it{ packages.find(name) };
    if (it == packages.end() || !seen.insert(name).second) { continue; }
    for (auto const &[dep, version] : it->second.dependencies) {
      if (!seen.contains(dep)) { queue.push_back(dep); }
    }
  }
  return seen;
}

std::vector<std::string> lockfile::prune(std::set<std::string> const &required_names) {
  auto const keep{ reachable_from(required_names) };

  std::vector<std::string> removed;
  for (auto it{ packages.begin() }; it != packages.end();) {
    if (keep.contains(it->first)) {
      ++it;
    } else {
      removed.push_back(it->first);
      it = packages.erase(it);
    }
  }
  return removed;
}

std::vector<std::string> lockfile::dangling_references() const {
  std::set<std::string> missing;
  for (auto const &[name, entry] : packages) {
    for (auto const &[dep, version] : entry.dependencies) {
      if (!packages.contains(dep)) { missing.insert(dep); }
    }
  }
  return std::vector<std::string>(missing.begin(), missing.end());
}

bool lockfile::satisfies(dependency_map const &requirements) const {
  for (auto const &[name, requirement] : requirements) {
    auto const it{ packages.find(name) };
    if (it == packages.end()) { return false; }
    if (is_any_version(requirement)) { continue; }

    auto const range{ version_range::parse(requirement) };
    if (!range || !range->satisfied_by(it->second.version)) {
      tui::debug("lockfile: %s@%s does not satisfy %s",
                 name.c_str(),
                 it->second.version.c_str(),
                 requirement.c_str());
      return false;
    }
  }

  if (auto const dangling{ dangling_references() }; !dangling.empty()) {
    tui::debug("lockfile: %zu dangling reference(s), starting with %s",
               dangling.size(),
               dangling.front().c_str());
    return false;
  }
  return true;
}

std::vector<resolved_package> lockfile::to_resolved(registry_client &registry) const {
  std::vector<resolved_package> out;
  out.reserve(packages.size());
  for (auto const &[name, entry] : packages) {
    out.push_back(resolved_package{ .name = name,
                                    .version = entry.version,
                                    .resolved_dependencies = entry.dependencies });
  }

  tbb::task_group tg;
  for (auto &pkg : out) {
    tg.run([&registry, &pkg] {
      pkg.metadata = registry.get_version_metadata(pkg.name, pkg.version);
    });
  }
  tg.wait();
  return out;
}

}  // namespace xpm
