#include "cmds/cmd_install.h"

#include "lockfile.h"
#include "test_support.h"
#include "util.h"

#include "picojson.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <map>
#include <vector>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

using pair_t = std::pair<std::string, std::string>;

TEST_CASE("cmd_install_parse_package_arg splits name and range") {
  CHECK(xpm::cmd_install_parse_package_arg("lodash") == pair_t{ "lodash", "latest" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@") == pair_t{ "lodash", "latest" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@^4.17.0") == pair_t{ "lodash", "^4.17.0" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@next") == pair_t{ "lodash", "next" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@>=1 <2") == pair_t{ "lodash", ">=1 <2" });
}

TEST_CASE("cmd_install_parse_package_arg pins bare versions") {
  CHECK(xpm::cmd_install_parse_package_arg("lodash@4.17.21") == pair_t{ "lodash", "=4.17.21" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@v4.17.21") == pair_t{ "lodash", "=4.17.21" });
  CHECK(xpm::cmd_install_parse_package_arg("lodash@4.17") == pair_t{ "lodash", "4.17" });
}

TEST_CASE("cmd_install_parse_package_arg keeps the scope marker") {
  CHECK(xpm::cmd_install_parse_package_arg("@types/node") == pair_t{ "@types/node", "latest" });
  CHECK(xpm::cmd_install_parse_package_arg("@types/node@20.1.0") ==
        pair_t{ "@types/node", "=20.1.0" });
  CHECK(xpm::cmd_install_parse_package_arg("@types/node@~20.1") == pair_t{ "@types/node", "~20.1" });
}

TEST_CASE("cmd_install config defaults") {
  xpm::cmd_install::cfg const cfg{};
  CHECK(std::is_same_v<xpm::cmd_install::cfg::cmd_t, xpm::cmd_install>);
  CHECK(cfg.retries == 2);
  CHECK(cfg.batch_size == 50);
  CHECK(cfg.script_timeout == 300);
  CHECK(cfg.materialize == xpm::materialize_mode::hard_link_or_copy);
  CHECK(cfg.scripts == xpm::lifecycle_mode::runner);
  CHECK_FALSE(cfg.global);
  CHECK_FALSE(cfg.frozen_lockfile);
}

namespace {

struct install_fixture {
  install_fixture() : root{ xpm::test::make_temp_dir("xpm-cmd-install-test") } {
    fs::create_directories(project());
    registry.add_version("a", "1.0.0", { { "c", "^1.0.0" } });
    registry.add_version("b", "2.0.0");
    registry.add_version("c", "1.0.0");
    registry.add_version("c", "1.1.0");
  }

  ~install_fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path project() const { return root / "project"; }
  fs::path store_root() const { return root / "store"; }
  fs::path node_modules() const { return project() / "node_modules"; }
  fs::path virtual_store() const { return node_modules() / ".xpm" / "virtual_store"; }

  void write_manifest(std::string const &dependencies) const {
    xpm::test::write_file(project() / "package.json",
                          R"({ "name": "app", "version": "1.0.0", "dependencies": )" +
                              dependencies + " }");
  }

  xpm::cmd_install::cfg make_cfg(std::vector<std::string> packages = {}) const {
    xpm::cmd_install::cfg cfg;
    cfg.packages = std::move(packages);
    cfg.registry = xpm::test::fake_registry::kBase;
    cfg.retries = 0;
    cfg.project_dir = project();
    cfg.materialize = xpm::materialize_mode::copy;
    cfg.scripts = xpm::lifecycle_mode::none;
    return cfg;
  }

  bool run(xpm::cmd_install::cfg const &cfg) {
    return xpm::cmd_install_run(cfg, store_root(), registry);
  }

  std::string package_url(std::string const &name) const {
    return std::string{ xpm::test::fake_registry::kBase } + "/" + name;
  }

  fs::path root;
  xpm::test::fake_registry registry;
};

}  // namespace

TEST_CASE_FIXTURE(install_fixture, "cmd_install writes the lockfile and links roots") {
  write_manifest(R"({ "a": "^1.0.0", "b": "^2.0.0" })");
  REQUIRE(run(make_cfg()));

  auto const lock{ xpm::lockfile::load(project() / xpm::kLockfileName) };
  REQUIRE(lock.has_value());
  CHECK(lock->packages.size() == 3);
  CHECK(lock->packages.at("a").dependencies ==
        std::map<std::string, std::string>{ { "c", "1.1.0" } });
  CHECK(lock->packages.at("c").version == "1.1.0");

  CHECK(fs::is_symlink(node_modules() / "a"));
  CHECK(fs::is_symlink(node_modules() / "b"));
  CHECK_FALSE(fs::exists(fs::symlink_status(node_modules() / "c")));
  CHECK(fs::exists(xpm::util_virtual_store_package_dir(virtual_store(), "c", "1.1.0") /
                   "package.json"));
  CHECK(fs::is_symlink(xpm::util_virtual_store_package_dir(virtual_store(), "a", "1.0.0")
                           .parent_path() /
                       "c"));
}

TEST_CASE_FIXTURE(install_fixture, "cmd_install reuses a satisfying lockfile") {
  write_manifest(R"({ "a": "^1.0.0", "b": "^2.0.0" })");
  REQUIRE(run(make_cfg()));
  REQUIRE(registry.get_count_for(package_url("a")) == 1);

  // A newer c would be picked by a fresh resolution.
  registry.add_version("c", "1.2.0");
  REQUIRE(run(make_cfg()));

  CHECK(registry.get_count_for(package_url("a")) == 1);
  CHECK(registry.get_count_for(package_url("b")) == 1);
  CHECK(registry.get_count_for(package_url("c")) == 1);
  auto const lock{ xpm::lockfile::load(project() / xpm::kLockfileName) };
  REQUIRE(lock.has_value());
  CHECK(lock->packages.at("c").version == "1.1.0");
}

TEST_CASE_FIXTURE(install_fixture, "cmd_install prunes packages dropped from package.json") {
  write_manifest(R"({ "a": "^1.0.0", "b": "^2.0.0" })");
  REQUIRE(run(make_cfg()));
  REQUIRE(fs::is_symlink(node_modules() / "b"));

  write_manifest(R"({ "a": "^1.0.0" })");
  REQUIRE(run(make_cfg()));

  CHECK_FALSE(fs::exists(fs::symlink_status(node_modules() / "b")));
  CHECK_FALSE(fs::exists(virtual_store() / xpm::util_package_store_name("b", "2.0.0")));
  CHECK(fs::is_symlink(node_modules() / "a"));

  auto const lock{ xpm::lockfile::load(project() / xpm::kLockfileName) };
  REQUIRE(lock.has_value());
  CHECK_FALSE(lock->packages.contains("b"));
  CHECK(lock->packages.contains("c"));
}

TEST_CASE_FIXTURE(install_fixture, "cmd_install --frozen-lockfile rejects a stale lockfile") {
  write_manifest(R"({ "a": "^1.0.0" })");
  auto cfg{ make_cfg() };
  cfg.frozen_lockfile = true;
  CHECK_THROWS_AS(run(cfg), std::runtime_error);  // no lockfile yet

  REQUIRE(run(make_cfg()));
  CHECK(run(cfg));

  write_manifest(R"({ "a": "^1.0.0", "b": "^2.0.0" })");
  CHECK_THROWS_AS(run(cfg), std::runtime_error);
  CHECK_FALSE(fs::exists(fs::symlink_status(node_modules() / "b")));
}

TEST_CASE_FIXTURE(install_fixture, "cmd_install skips packages already at the pinned version") {
  write_manifest("{}");
  REQUIRE(run(make_cfg({ "b@2.0.0" })));
  REQUIRE(fs::is_symlink(node_modules() / "b"));
  auto const gets{ registry.get_calls.load() };

  CHECK(run(make_cfg({ "b@2.0.0" })));
  CHECK(registry.get_calls.load() == gets);
}

TEST_CASE_FIXTURE(install_fixture, "cmd_install records caret ranges in package.json") {
  write_manifest(R"({ "a": "latest" })");
  REQUIRE(run(make_cfg({ "b" })));

  picojson::value doc;
  REQUIRE(picojson::parse(doc, xpm::test::read_file(project() / "package.json")).empty());
  auto const &deps{ doc.get("dependencies") };
  CHECK(deps.get("b").to_str() == "^2.0.0");
  CHECK(deps.get("a").to_str() == "latest");  // only named packages are recorded

  REQUIRE(run(make_cfg()));
  REQUIRE(picojson::parse(doc, xpm::test::read_file(project() / "package.json")).empty());
  CHECK(doc.get("dependencies").get("a").to_str() == "^1.0.0");
}
