#include "project_manifest.h"

#include "test_support.h"

#include <doctest/doctest.h>

#include "picojson.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("package_manifest::parse reads dependency sections and scripts") {
  auto const m{ xpm::package_manifest::parse(R"({
    "name": "app",
    "version": "1.0.0",
    "dependencies": { "left-pad": "^1.3.0", "broken": 7 },
    "devDependencies": { "tap": "~16.0.0" },
    "optionalDependencies": { "fsevents": "*" },
    "scripts": { "postinstall": "node setup.js", "install": "" }
  })") };

  CHECK(m.name == "app");
  CHECK(m.version == "1.0.0");
  CHECK(m.dependencies == xpm::dependency_map{ { "left-pad", "^1.3.0" } });
  CHECK(m.dev_dependencies.at("tap") == "~16.0.0");
  CHECK(m.optional_dependencies.at("fsevents") == "*");
  CHECK(m.script("postinstall") == "node setup.js");
  CHECK_FALSE(m.script("install").has_value());
  CHECK_FALSE(m.script("preinstall").has_value());
}

TEST_CASE("package_manifest::parse rejects malformed documents") {
  CHECK_THROWS_AS(xpm::package_manifest::parse("{ nope"), std::runtime_error);
  CHECK_THROWS_AS(xpm::package_manifest::parse("[1, 2]"), std::runtime_error);
  CHECK_NOTHROW(xpm::package_manifest::parse("{}"));
}

TEST_CASE("package_manifest::install_requirements merges all sections") {
  auto const m{ xpm::package_manifest::parse(R"({
    "dependencies": { "a": "^1.0.0", "shared": "1.0.0" },
    "devDependencies": { "b": "2.x", "shared": "2.0.0" },
    "optionalDependencies": { "c": "latest" }
  })") };

  auto const reqs{ m.install_requirements() };
  CHECK(reqs.size() == 4);
  CHECK(reqs.at("a") == "^1.0.0");
  CHECK(reqs.at("b") == "2.x");
  CHECK(reqs.at("c") == "latest");
  CHECK(reqs.at("shared") == "1.0.0");
}

TEST_CASE("package_manifest::bin_links handles both forms") {
  SUBCASE("map form") {
    auto const m{ xpm::package_manifest::parse(
        R"({ "bin": { "tool": "bin/tool.js", "tool-dev": "bin/dev.js" } })") };
    auto const links{ m.bin_links("@scope/tool") };
    CHECK(links.size() == 2);
    CHECK(links.at("tool") == "bin/tool.js");
  }

  SUBCASE("string form uses the unscoped name") {
    auto const m{ xpm::package_manifest::parse(R"({ "bin": "./cli.js" })") };
    auto const links{ m.bin_links("@scope/tool") };
    REQUIRE(links.size() == 1);
    CHECK(links.at("tool") == "./cli.js");
  }

  SUBCASE("absent") {
    CHECK(xpm::package_manifest::parse("{}").bin_links("x").empty());
  }
}

TEST_CASE("package_unscoped_name strips the scope") {
  CHECK(xpm::package_unscoped_name("@scope/pkg") == "pkg");
  CHECK(xpm::package_unscoped_name("pkg") == "pkg");
}

struct manifest_dir_fixture {
  manifest_dir_fixture() : root{ xpm::test::make_temp_dir("xpm-manifest-test") } {}
  ~manifest_dir_fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path root;
};

TEST_CASE_FIXTURE(manifest_dir_fixture, "package_manifest::load distinguishes missing files") {
  CHECK_FALSE(xpm::package_manifest::load(root / "package.json").has_value());

  xpm::test::write_file(root / "package.json", R"({ "name": "x", "version": "0.1.0" })");
  auto const m{ xpm::package_manifest::load(root / "package.json") };
  REQUIRE(m.has_value());
  CHECK(m->name == "x");

  xpm::test::write_file(root / "package.json", "not json");
  CHECK_THROWS_AS(xpm::package_manifest::load(root / "package.json"), std::runtime_error);
}

TEST_CASE_FIXTURE(manifest_dir_fixture,
                  "package_manifest_record_versions updates the right section") {
  auto const path{ root / "package.json" };
  xpm::test::write_file(path, R"({
    "name": "app",
    "version": "1.0.0",
    "private": true,
    "devDependencies": { "tap": "latest" }
  })");

  xpm::package_manifest_record_versions(path, { { "tap", "16.3.0" }, { "lodash", "4.17.21" } });

  picojson::value doc;
  REQUIRE(picojson::parse(doc, xpm::test::read_file(path)).empty());
  CHECK(doc.get("private").is<bool>());
  CHECK(doc.get("private").get<bool>());
  CHECK(doc.get("name").to_str() == "app");
  CHECK(doc.get("devDependencies").get("tap").to_str() == "^16.3.0");
  CHECK(doc.get("dependencies").get("lodash").to_str() == "^4.17.21");
  CHECK_FALSE(doc.get("dependencies").contains("tap"));
}

TEST_CASE_FIXTURE(manifest_dir_fixture,
                  "package_manifest_record_versions skips a missing package.json") {
  xpm::package_manifest_record_versions(root / "package.json", { { "a", "1.0.0" } });
  CHECK_FALSE(fs::exists(root / "package.json"));
}

TEST_CASE_FIXTURE(manifest_dir_fixture, "package_installed_version reads node_modules") {
  auto const nm{ root / "node_modules" };
  CHECK_FALSE(xpm::package_installed_version(nm, "a").has_value());

  xpm::test::write_file(nm / "@s" / "a" / "package.json", R"({ "version": "2.1.0" })");
  CHECK(xpm::package_installed_version(nm, "@s/a") == "2.1.0");

  xpm::test::write_file(nm / "b" / "package.json", "{ garbage");
  CHECK_FALSE(xpm::package_installed_version(nm, "b").has_value());
}
