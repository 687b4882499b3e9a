#include "project_manifest.h"

#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <stdexcept>
#include <utility>

namespace xpm {

namespace {

std::map<std::string, std::string> string_map_field(picojson::object const &o,
                                                    char const *key) {
  std::map<std::string, std::string> out;
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<picojson::object>()) { return out; }
  for (auto const &[k, v] : it->second.get<picojson::object>()) {
    if (v.is<std::string>()) { out.emplace(k, v.get<std::string>()); }
  }
  return out;
}

std::string string_field(picojson::object const &o, char const *key) {
  auto const it{ o.find(key) };
  if (it == o.end() || !it->second.is<std::string>()) { return {}; }
  return it->second.get<std::string>();
}

}  // namespace

package_manifest package_manifest::parse(std::string_view json) {
  picojson::value root;
  if (std::string const err{ picojson::parse(root, std::string{ json }) }; !err.empty()) {
    throw std::runtime_error("manifest: malformed package.json: " + err);
  }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("manifest: package.json is not an object");
  }
  auto const &obj{ root.get<picojson::object>() };

  package_manifest m{ .name = string_field(obj, "name"),
                      .version = string_field(obj, "version"),
                      .dependencies = string_map_field(obj, "dependencies"),
                      .dev_dependencies = string_map_field(obj, "devDependencies"),
                      .optional_dependencies = string_map_field(obj, "optionalDependencies"),
                      .scripts = string_map_field(obj, "scripts") };

  if (auto const bin{ obj.find("bin") }; bin != obj.end()) {
    if (bin->second.is<std::string>()) {
      m.bin_path = bin->second.get<std::string>();
    } else if (bin->second.is<picojson::object>()) {
      m.bin = string_map_field(obj, "bin");
    }
  }
  return m;
}

std::optional<package_manifest> package_manifest::load(std::filesystem::path const &path) {
  if (!std::filesystem::exists(path)) { return std::nullopt; }
  try {
    return parse(util_load_text_file(path));
  } catch (std::runtime_error const &e) {
    throw std::runtime_error(std::string(e.what()) + " (" + path.string() + ")");
  }
}

dependency_map package_manifest::install_requirements() const {
  dependency_map out{ dependencies };
  out.insert(dev_dependencies.begin(), dev_dependencies.end());
  out.insert(optional_dependencies.begin(), optional_dependencies.end());
  return out;
}

std::map<std::string, std::string> package_manifest::bin_links(
    std::string_view package_name) const {
  if (bin_path) {
    return { { std::string{ package_unscoped_name(package_name) }, *bin_path } };
  }
  return bin;
}

std::optional<std::string> package_manifest::script(std::string_view stage) const {
  if (auto const it{ scripts.find(std::string{ stage }) };
      it != scripts.end() && !it->second.empty()) {
    return it->second;
  }
  return std::nullopt;
}

std::string_view package_unscoped_name(std::string_view name) {
  auto const slash{ name.rfind('/') };
  return slash == std::string_view::npos ? name : name.substr(slash + 1);
}

void package_manifest_record_versions(std::filesystem::path const &path,
                                      std::map<std::string, std::string> const &versions) {
  if (versions.empty() || !std::filesystem::exists(path)) { return; }

  picojson::value doc;
  if (std::string const err{ picojson::parse(doc, util_load_text_file(path)) }; !err.empty()) {
    throw std::runtime_error("manifest: malformed " + path.string() + ": " + err);
  }
  if (!doc.is<picojson::object>()) {
    throw std::runtime_error("manifest: " + path.string() + " is not an object");
  }
  auto &obj{ doc.get<picojson::object>() };

  for (auto const &[name, version] : versions) {
    picojson::value const range{ "^" + version };

    if (auto dev{ obj.find("devDependencies") };
        dev != obj.end() && dev->second.is<picojson::object>() &&
        dev->second.get<picojson::object>().contains(name)) {
      dev->second.get<picojson::object>()[name] = range;
      continue;
    }

    auto &deps{ obj["dependencies"] };
    if (!deps.is<picojson::object>()) { deps = picojson::value{ picojson::object{} }; }
    deps.get<picojson::object>()[name] = range;
  }

  auto text{ doc.serialize(true) };
  if (text.empty() || text.back() != '\n') { text.push_back('\n'); }
  util_write_file_atomic(path, text);
  tui::debug("manifest: recorded %zu version(s) in %s", versions.size(), path.c_str());
}

std::optional<std::string> package_installed_version(
    std::filesystem::path const &node_modules,
    std::string const &name) {
  auto const manifest_path{ node_modules / name / "package.json" };
  std::error_code ec;
  if (!std::filesystem::exists(manifest_path, ec)) { return std::nullopt; }

  try {
    auto const m{ package_manifest::parse(util_load_text_file(manifest_path)) };
    if (m.version.empty()) { return std::nullopt; }
    return m.version;
  } catch (std::runtime_error const &e) {
    tui::debug("manifest: ignoring unreadable %s: %s", manifest_path.c_str(), e.what());
    return std::nullopt;
  }
}

}  // namespace xpm
