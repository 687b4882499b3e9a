#include "installer.h"

#include "test_support.h"

#include <doctest/doctest.h>

#include "picojson.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

using xpm::test::archive_entry_spec;

std::vector<archive_entry_spec> package_files(std::string const &name,
                                              std::string const &version,
                                              std::string const &extra_manifest = "{}",
                                              std::vector<archive_entry_spec> more = {}) {
  auto manifest{ xpm::test::parse_object(extra_manifest) };
  manifest["name"] = picojson::value(name);
  manifest["version"] = picojson::value(version);

  std::vector<archive_entry_spec> files{
    { .path = "package/package.json", .contents = picojson::value(manifest).serialize() },
    { .path = "package/index.js", .contents = "module.exports = '" + name + "';\n" },
  };
  files.insert(files.end(), more.begin(), more.end());
  return files;
}

mode_t file_mode(fs::path const &path) {
  struct stat st{};
  REQUIRE(::stat(path.c_str(), &st) == 0);
  return st.st_mode & 0777;
}

struct installer_fixture {
  installer_fixture()
      : root{ xpm::test::make_temp_dir("xpm-installer-test") },
        store{ root / "store" },
        client{ transport, options() } {
    fs::create_directories(project());
  }

  ~installer_fixture() {
    std::error_code ec;
    // Store blobs are read-only; removal only needs the directories writable.
    fs::remove_all(root, ec);
  }

  static xpm::registry_options options() {
    return xpm::registry_options{ .base_url = xpm::test::fake_registry::kBase,
                                  .retries = 0,
                                  .backoff_base = std::chrono::milliseconds{ 1 } };
  }

  fs::path project() const { return root / "project"; }
  fs::path vstore() const { return root / "project" / "node_modules" / ".xpm" / "vs"; }

  xpm::installer_options install_opts(
      xpm::materialize_mode mode = xpm::materialize_mode::hard_link_or_copy) const {
    return xpm::installer_options{ .virtual_store_root = vstore(),
                                   .project_root = project(),
                                   .materialize = mode,
                                   .script_timeout = std::chrono::seconds{ 10 },
                                   .batch_size = 8 };
  }

  void publish(std::string const &name,
               std::string const &version,
               xpm::dependency_map const &deps = {},
               std::string const &extra_manifest = "{}",
               std::vector<archive_entry_spec> more = {}) {
    transport.add_version(name,
                          version,
                          deps,
                          package_files(name, version, extra_manifest, std::move(more)));
  }

  xpm::resolved_package resolved(std::string const &name,
                                 std::string const &version,
                                 std::map<std::string, std::string> deps = {}) {
    return xpm::resolved_package{ .name = name,
                                  .version = version,
                                  .metadata = client.get_version_metadata(name, version),
                                  .resolved_dependencies = std::move(deps) };
  }

  fs::path root;
  xpm::test::fake_registry transport;
  xpm::content_store store;
  xpm::registry_client client;
};

}  // namespace

TEST_CASE_FIXTURE(installer_fixture, "installer materializes package files from the store") {
  publish("left-pad", "1.3.0", {}, "{}", { { .path = "package/lib/pad.js", .contents = "pad" } });
  xpm::installer inst{ store, client, install_opts() };
  auto const pkg{ resolved("left-pad", "1.3.0") };

  auto const index{ inst.ensure_extracted(pkg) };
  CHECK(index.size() == 3);
  CHECK(index.contains("package/lib/pad.js"));
  CHECK(store.get_index("left-pad", "1.3.0").has_value());
  CHECK(fs::exists(store.tarballs_dir() / "left-pad@1.3.0.tgz"));

  inst.materialize(pkg, index);
  auto const dir{ inst.package_dir("left-pad", "1.3.0") };
  CHECK(dir == vstore() / "left-pad@1.3.0" / "node_modules" / "left-pad");
  CHECK(xpm::test::read_file(dir / "lib" / "pad.js") == "pad");
  CHECK(fs::hard_link_count(dir / "index.js") >= 2);
  CHECK(fs::exists(dir / "package.json"));
}

TEST_CASE_FIXTURE(installer_fixture, "installer copy mode leaves the store untouched") {
  publish("a", "1.0.0");
  xpm::installer inst{ store, client, install_opts(xpm::materialize_mode::copy) };
  auto const pkg{ resolved("a", "1.0.0") };
  inst.materialize(pkg, inst.ensure_extracted(pkg));

  auto const file{ inst.package_dir("a", "1.0.0") / "index.js" };
  CHECK(fs::hard_link_count(file) == 1);
  CHECK(xpm::test::read_file(file) == "module.exports = 'a';\n");
}

TEST_CASE_FIXTURE(installer_fixture, "installer extracts a package once under concurrency") {
  publish("a", "1.0.0");
  xpm::installer inst{ store, client, install_opts() };
  auto const pkg{ resolved("a", "1.0.0") };

  std::vector<std::thread> threads;
  std::vector<std::size_t> sizes(8, 0);
  for (std::size_t i{ 0 }; i < sizes.size(); ++i) {
    threads.emplace_back([&, i] { sizes[i] = inst.ensure_extracted(pkg).size(); });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(transport.download_calls.load() == 1);
  CHECK(std::all_of(sizes.begin(), sizes.end(), [](std::size_t s) { return s == 2; }));
}

TEST_CASE_FIXTURE(installer_fixture, "installer reruns skip network for persisted indices") {
  publish("a", "1.0.0");
  publish("b", "2.0.0");
  {
    xpm::installer inst{ store, client, install_opts() };
    auto const report{ inst.install_all({ resolved("a", "1.0.0"), resolved("b", "2.0.0") }) };
    REQUIRE(report.ok());
  }

  // Fresh transport and client: nothing cached in memory.
  xpm::test::fake_registry offline;
  xpm::registry_client offline_client{ offline, options() };
  xpm::installer again{ store, offline_client, install_opts() };

  auto const report{ again.install_all({ xpm::resolved_package{ .name = "a", .version = "1.0.0" },
                                         xpm::resolved_package{ .name = "b", .version = "2.0.0" } }) };
  CHECK(report.ok());
  CHECK(report.installed == 2);
  CHECK(offline.get_calls.load() == 0);
  CHECK(offline.download_calls.load() == 0);
}

TEST_CASE_FIXTURE(installer_fixture, "installer rejects a tarball with the wrong checksum") {
  transport.add_version("bad",
                        "1.0.0",
                        {},
                        package_files("bad", "1.0.0"),
                        R"({ "dist": { "shasum": ")" + std::string(40, '0') + R"(" } })");
  xpm::installer inst{ store, client, install_opts() };
  auto const pkg{ resolved("bad", "1.0.0") };

  CHECK_THROWS_AS(inst.ensure_extracted(pkg), std::runtime_error);
  CHECK_FALSE(fs::exists(store.tarballs_dir() / "bad@1.0.0.tgz"));
  CHECK_FALSE(store.get_index("bad", "1.0.0").has_value());

  // The failure is not memoized; a second attempt downloads again.
  CHECK_THROWS_AS(inst.ensure_extracted(pkg), std::runtime_error);
  CHECK(transport.download_calls.load() == 2);
}

TEST_CASE_FIXTURE(installer_fixture, "installer links dependencies inside the virtual store") {
  publish("app-lib", "1.0.0", { { "@s/dep", "^1.0.0" } });
  publish("@s/dep", "1.2.0");
  xpm::installer inst{ store, client, install_opts() };

  auto const report{ inst.install_all(
      { resolved("app-lib", "1.0.0", { { "@s/dep", "1.2.0" } }), resolved("@s/dep", "1.2.0") }) };
  REQUIRE(report.ok());
  CHECK(report.installed == 2);

  auto const link{ vstore() / "app-lib@1.0.0" / "node_modules" / "@s" / "dep" };
  REQUIRE(fs::is_symlink(link));
  CHECK(fs::read_symlink(link).is_relative());
  CHECK(fs::equivalent(link, inst.package_dir("@s/dep", "1.2.0")));
  CHECK(xpm::test::read_file(link / "index.js") == "module.exports = '@s/dep';\n");
}

TEST_CASE_FIXTURE(installer_fixture, "installer reports a missing dependency entry") {
  publish("a", "1.0.0");
  xpm::installer inst{ store, client, install_opts() };
  auto const pkg{ resolved("a", "1.0.0", { { "ghost", "9.9.9" } }) };
  inst.materialize(pkg, inst.ensure_extracted(pkg));
  try {
    inst.link_dependencies(pkg);
    FAIL("expected link_dependencies to throw");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() }.find("missing dependency target") != std::string::npos);
  }
}

TEST_CASE_FIXTURE(installer_fixture, "installer install_all collects failures per package") {
  publish("good", "1.0.0");
  xpm::installer inst{ store, client, install_opts() };

  auto const report{ inst.install_all(
      { resolved("good", "1.0.0"), xpm::resolved_package{ .name = "nope", .version = "1.0.0" } }) };
  CHECK(report.installed == 1);
  REQUIRE(report.failures.size() == 1);
  CHECK(report.failures[0].package == "nope@1.0.0");
  CHECK(fs::exists(inst.package_dir("good", "1.0.0") / "index.js"));
}

TEST_CASE_FIXTURE(installer_fixture, "installer links roots and bins into the project") {
  publish("@s/tool",
          "1.0.0",
          {},
          R"({ "bin": "./cli.js" })",
          { { .path = "package/cli.js", .contents = "#!/bin/sh\necho tool\n" } });
  publish("multi",
          "2.0.0",
          {},
          R"({ "bin": { "multi-a": "bin/a.js", "multi-gone": "bin/missing.js" } })",
          { { .path = "package/bin/a.js", .contents = "#!/bin/sh\necho a\n" } });

  xpm::installer inst{ store, client, install_opts(xpm::materialize_mode::copy) };
  REQUIRE(inst.install_all({ resolved("@s/tool", "1.0.0"), resolved("multi", "2.0.0") }).ok());

  auto const report{ inst.link_all_to_root({ { "@s/tool", "1.0.0" }, { "multi", "2.0.0" } }) };
  REQUIRE(report.ok());
  CHECK(report.installed == 2);

  auto const nm{ project() / "node_modules" };
  REQUIRE(fs::is_symlink(nm / "@s" / "tool"));
  CHECK(fs::equivalent(nm / "@s" / "tool", inst.package_dir("@s/tool", "1.0.0")));
  CHECK(fs::is_symlink(nm / "multi"));

  REQUIRE(fs::is_symlink(nm / ".bin" / "tool"));
  CHECK(fs::read_symlink(nm / ".bin" / "tool").is_relative());
  CHECK(file_mode(inst.package_dir("@s/tool", "1.0.0") / "cli.js") == 0755);
  CHECK(fs::is_symlink(nm / ".bin" / "multi-a"));
  CHECK_FALSE(fs::exists(fs::symlink_status(nm / ".bin" / "multi-gone")));
}

TEST_CASE_FIXTURE(installer_fixture, "installer keeps hard-linked bins read-only") {
  publish("t",
          "1.0.0",
          {},
          R"({ "bin": { "t": "t.sh" } })",
          { { .path = "package/t.sh", .contents = "#!/bin/sh\n" } });
  xpm::installer inst{ store, client, install_opts(xpm::materialize_mode::hard_link) };
  REQUIRE(inst.install_all({ resolved("t", "1.0.0") }).ok());

  auto const linked{ inst.link_binaries_to("t", "1.0.0", root / "global-bin") };
  REQUIRE(linked == std::vector<std::string>{ "t" });
  CHECK(file_mode(inst.package_dir("t", "1.0.0") / "t.sh") == 0555);
  CHECK(fs::is_symlink(root / "global-bin" / "t"));
}

TEST_CASE_FIXTURE(installer_fixture, "installer link_to_root requires a materialized package") {
  xpm::installer inst{ store, client, install_opts() };
  CHECK_THROWS_AS(inst.link_to_root("absent", "1.0.0"), std::runtime_error);
}

TEST_CASE_FIXTURE(installer_fixture, "installer runs lifecycle stages in order") {
  publish("scripted",
          "1.0.0",
          {},
          R"({ "scripts": {
                 "postinstall": "echo post >> ../../order.txt",
                 "preinstall": "echo pre >> ../../order.txt",
                 "install": "echo install >> ../../order.txt" } })");
  publish("failing",
          "1.0.0",
          {},
          R"({ "scripts": { "preinstall": "exit 4", "postinstall": "touch ran-post" } })");

  xpm::installer inst{ store, client, install_opts(xpm::materialize_mode::copy) };
  REQUIRE(inst.install_all({ resolved("scripted", "1.0.0"), resolved("failing", "1.0.0") }).ok());

  CHECK(inst.run_lifecycle_scripts(resolved("scripted", "1.0.0")));
  CHECK(xpm::test::read_file(vstore() / "scripted@1.0.0" / "order.txt") ==
        "pre\ninstall\npost\n");

  CHECK_FALSE(inst.run_lifecycle_scripts(resolved("failing", "1.0.0")));
  CHECK_FALSE(fs::exists(inst.package_dir("failing", "1.0.0") / "ran-post"));
}

TEST_CASE_FIXTURE(installer_fixture, "installer remove_package clears links and entry") {
  publish("t",
          "1.0.0",
          {},
          R"({ "bin": "t.sh" })",
          { { .path = "package/t.sh", .contents = "#!/bin/sh\n" } });
  xpm::installer inst{ store, client, install_opts(xpm::materialize_mode::copy) };
  REQUIRE(inst.install_all({ resolved("t", "1.0.0") }).ok());
  inst.link_to_root("t", "1.0.0");
  REQUIRE(fs::is_symlink(project() / "node_modules" / ".bin" / "t"));

  inst.remove_package("t", "1.0.0");
  CHECK_FALSE(fs::exists(vstore() / "t@1.0.0"));
  CHECK_FALSE(fs::exists(fs::symlink_status(project() / "node_modules" / "t")));
  CHECK_FALSE(fs::exists(fs::symlink_status(project() / "node_modules" / ".bin" / "t")));
  CHECK(store.get_index("t", "1.0.0").has_value());
}
