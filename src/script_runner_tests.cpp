#include "script_runner.h"

#include "test_support.h"

#include <doctest/doctest.h>

#include "picojson.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct script_fixture {
  script_fixture() : root{ xpm::test::make_temp_dir("xpm-scripts-test") } {
    fs::create_directories(project());
  }

  ~script_fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  fs::path project() const { return root / "project"; }
  fs::path vstore() const { return root / "project" / "node_modules" / ".xpm" / "vs"; }

  // Lay out a virtual-store entry with the given scripts.
  xpm::resolved_package add_package(std::string const &name,
                                    std::string const &version,
                                    std::map<std::string, std::string> const &scripts) {
    auto const dir{ xpm::util_virtual_store_package_dir(vstore(), name, version) };
    picojson::object doc;
    doc["name"] = picojson::value(name);
    doc["version"] = picojson::value(version);
    if (!scripts.empty()) {
      picojson::object s;
      for (auto const &[stage, command] : scripts) { s[stage] = picojson::value(command); }
      doc["scripts"] = picojson::value(s);
    }
    xpm::test::write_file(dir / "package.json", picojson::value(doc).serialize());
    return xpm::resolved_package{ .name = name, .version = version };
  }

  xpm::script_runner make_runner(std::chrono::seconds timeout = std::chrono::seconds{ 30 }) {
    return xpm::script_runner{ xpm::script_runner_options{ .project_root = project(),
                                                           .virtual_store_root = vstore(),
                                                           .timeout = timeout,
                                                           .max_parallel = 4,
                                                           .global_bin_dir = root / "gbin" } };
  }

  xpm::script_task task(std::string const &name,
                        xpm::script_stage stage,
                        std::string const &command) {
    auto const dir{ xpm::util_virtual_store_package_dir(vstore(), name, "1.0.0") };
    fs::create_directories(dir);
    return xpm::script_task{ .package_name = name,
                             .package_version = "1.0.0",
                             .package_dir = dir,
                             .stage = stage,
                             .command = command };
  }

  fs::path root;
};

}  // namespace

TEST_CASE("script_stage_name spells npm lifecycle events") {
  CHECK(std::string{ xpm::script_stage_name(xpm::script_stage::preinstall) } == "preinstall");
  CHECK(std::string{ xpm::script_stage_name(xpm::script_stage::install) } == "install");
  CHECK(std::string{ xpm::script_stage_name(xpm::script_stage::postinstall) } ==
        "postinstall");
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::scan emits one task per declared stage") {
  std::vector<xpm::resolved_package> const packages{
    add_package("a", "1.0.0", { { "postinstall", "echo post" }, { "preinstall", "echo pre" } }),
    add_package("@s/b", "2.0.0", { { "install", "echo b" }, { "test", "echo no" } }),
    add_package("c", "1.0.0", {}),
    xpm::resolved_package{ .name = "missing", .version = "1.0.0" },
  };

  auto runner{ make_runner() };
  auto const tasks{ runner.scan(packages) };
  REQUIRE(tasks.size() == 3);
  CHECK(tasks[0].package_name == "a");
  CHECK(tasks[0].stage == xpm::script_stage::preinstall);
  CHECK(tasks[1].stage == xpm::script_stage::postinstall);
  CHECK(tasks[2].package_name == "@s/b");
  CHECK(tasks[2].command == "echo b");
  CHECK(tasks[2].package_dir ==
        xpm::util_virtual_store_package_dir(vstore(), "@s/b", "2.0.0"));

  SUBCASE("explicit key filter") {
    auto const filtered{ runner.scan(packages, std::set<std::string>{ "@s/b@2.0.0" }) };
    REQUIRE(filtered.size() == 1);
    CHECK(filtered[0].package_name == "@s/b");
  }
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::scan honors only_built_dependencies") {
  std::vector<xpm::resolved_package> const packages{
    add_package("a", "1.0.0", { { "install", "true" } }),
    add_package("b", "1.0.0", { { "install", "true" } }),
  };

  xpm::script_runner runner{ xpm::script_runner_options{
      .project_root = project(),
      .virtual_store_root = vstore(),
      .only_built_dependencies = { "b" } } };
  auto const tasks{ runner.scan(packages) };
  REQUIRE(tasks.size() == 1);
  CHECK(tasks[0].package_name == "b");
}

TEST_CASE("script_runner::order buckets by stage and keeps relative order") {
  auto const make{ [](std::string name, xpm::script_stage stage) {
    return xpm::script_task{ .package_name = std::move(name), .stage = stage };
  } };

  auto const ordered{ xpm::script_runner::order({
      make("a", xpm::script_stage::postinstall),
      make("b", xpm::script_stage::preinstall),
      make("c", xpm::script_stage::install),
      make("d", xpm::script_stage::preinstall),
  }) };

  REQUIRE(ordered.size() == 4);
  CHECK(ordered[0].package_name == "b");
  CHECK(ordered[1].package_name == "d");
  CHECK(ordered[2].package_name == "c");
  CHECK(ordered[3].package_name == "a");
}

TEST_CASE("script_runner::max_parallel defaults to at least four") {
  xpm::script_runner const runner{ xpm::script_runner_options{} };
  CHECK(runner.max_parallel() >= 4);

  xpm::script_runner const pinned{ xpm::script_runner_options{ .max_parallel = 2 } };
  CHECK(pinned.max_parallel() == 2);
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::run_one runs in the package dir") {
  auto runner{ make_runner() };
  auto const t{ task("a", xpm::script_stage::install, "pwd > where.txt") };

  auto const outcome{ runner.run_one(t) };
  CHECK(outcome.success);
  CHECK(outcome.message.empty());
  auto const where{ xpm::test::read_file(t.package_dir / "where.txt") };
  CHECK(fs::equivalent(fs::path{ where.substr(0, where.find('\n')) }, t.package_dir));
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::run_one sets the lifecycle environment") {
  fs::create_directories(project() / "node_modules" / ".bin");
  auto runner{ make_runner() };
  auto const t{ task("env-check", xpm::script_stage::postinstall,
                     "printf '%s\\n%s\\n%s\\n%s\\n' \"$NODE_ENV\" \"$CI\" "
                     "\"$npm_config_foreground_scripts\" \"$PATH\" > env.txt") };

  REQUIRE(runner.run_one(t).success);
  auto const text{ xpm::test::read_file(t.package_dir / "env.txt") };
  CHECK(text.rfind("production\ntrue\ntrue\n", 0) == 0);

  auto const path_line{ text.substr(std::string{ "production\ntrue\ntrue\n" }.size()) };
  auto const project_bin{ (project() / "node_modules" / ".bin").string() };
  CHECK(path_line.rfind(project_bin, 0) == 0);
  CHECK(path_line.find((root / "gbin").string()) == std::string::npos);  // absent dir
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::run_one reports failures") {
  auto runner{ make_runner() };
  auto const outcome{ runner.run_one(task("bad", xpm::script_stage::install, "exit 3")) };
  CHECK_FALSE(outcome.success);
  CHECK_FALSE(outcome.timed_out);
  CHECK(outcome.exit_code == 3);
  CHECK(outcome.message == "Script exited with code 3");
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::run_one kills scripts past the timeout") {
  auto runner{ make_runner(std::chrono::seconds{ 1 }) };
  auto const start{ std::chrono::steady_clock::now() };
  auto const outcome{ runner.run_one(task("slow", xpm::script_stage::install, "sleep 30")) };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK_FALSE(outcome.success);
  CHECK(outcome.timed_out);
  CHECK(outcome.message == "Script timed out after 1 seconds");
  CHECK(elapsed < std::chrono::seconds{ 10 });
}

TEST_CASE_FIXTURE(script_fixture,
                  "script_runner::run_one times out scripts that silence their output") {
  auto runner{ make_runner(std::chrono::seconds{ 1 }) };
  auto const start{ std::chrono::steady_clock::now() };
  auto const outcome{ runner.run_one(
      task("quiet", xpm::script_stage::install, "exec >/dev/null 2>&1; sleep 30")) };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK_FALSE(outcome.success);
  CHECK(outcome.timed_out);
  CHECK(elapsed < std::chrono::seconds{ 10 });
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::execute isolates failing siblings") {
  auto runner{ make_runner(std::chrono::seconds{ 1 }) };

  std::vector<xpm::script_task> const tasks{
    task("slow", xpm::script_stage::install, "sleep 30"),
    task("broken", xpm::script_stage::preinstall, "exit 1"),
    task("broken", xpm::script_stage::postinstall, "touch should-not-exist"),
    task("ok", xpm::script_stage::preinstall, "touch pre"),
    task("ok", xpm::script_stage::postinstall, "test -f pre && touch post"),
  };

  auto const summary{ runner.execute(tasks) };
  CHECK(summary.succeeded == 2);
  CHECK(summary.failed == 2);
  CHECK(summary.timed_out == 1);
  CHECK(summary.failures.size() == 2);

  CHECK(fs::exists(tasks[4].package_dir / "post"));
  CHECK_FALSE(fs::exists(tasks[2].package_dir / "should-not-exist"));
}

TEST_CASE_FIXTURE(script_fixture, "script_runner::execute with no tasks is a no-op") {
  auto const summary{ make_runner().execute({}) };
  CHECK(summary.succeeded == 0);
  CHECK(summary.failed == 0);
}
