#include <catch2/catch.hpp>
#include <stackup/frontend.hpp>
#include "fakes.hpp"
#include "temp_dir.hpp"

using namespace stackup;

static const char* MANIFEST = R"(name:          my-app
version:       0.3.0
homepage:      https://github.com/example/my-app

library
  hs-source-dirs: src

executable my-app-exe
  main-is: Main.hs

test-suite my-app-test
  type: exitcode-stdio-1.0
  main-is: Spec.hs
)";

// Stands in for the build tool: echoes its arguments and prints haddock
// output for the haddock operation
static const char* FAKE_TOOL = R"(#!/bin/sh
echo "$@"
if [ "$1" = "haddock" ]; then
  echo "Documentation created:"
  echo ".stack-work/doc/html/my-app/,"
fi
)";

struct Fixture {
    TempDir td;
    fs::path tool;
    ScriptedPrompter prompter;
    RecordingOpener opener;
    Config config = Config::defaults();

    Fixture() {
        td.write_file("stack.yaml", "resolver: lts-21.25\n");
        td.write_file("my-app.cabal", MANIFEST);
        tool = td.write_file("bin/fake-stack", FAKE_TOOL);
        fs::permissions(tool, fs::perms::owner_all, fs::perm_options::add);

        config.tool.path = tool.string();
        config.tool.package_query = {
            "/bin/sh", "-c", "echo base-4.18.2.0 text-1.2.5.0 '(text-2.0.2)'"};
    }
};

// ===== make_command =====

TEST_CASE("package operation with automatic target", "[frontend]") {
    Fixture fx;
    fx.config.behavior.auto_target = true;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    auto cmd = fe.make_command("build", std::nullopt, {"--fast"});
    REQUIRE(cmd.is_ok());
    REQUIRE(cmd.value().argv() ==
            std::vector<std::string>{fx.tool.string(), "build", "my-app", "--fast"});
    REQUIRE(cmd.value().working_dir == fx.td.path);
    REQUIRE(cmd.value().channel_key == "my-app.stackup.log");
    REQUIRE(fx.prompter.asked.empty());
    REQUIRE(fe.session().last_target() == std::string("my-app"));
}

TEST_CASE("package operation asks for a target", "[frontend]") {
    Fixture fx;
    fx.prompter.answers = {"my-app:test:my-app-test"};
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    auto cmd = fe.make_command("test", std::string("test"), {"--coverage"});
    REQUIRE(cmd.is_ok());
    REQUIRE(fx.prompter.asked.at(0) ==
            std::vector<std::string>{"my-app", "my-app:test:my-app-test"});
    REQUIRE(fx.prompter.require_match.at(0));
    REQUIRE(cmd.value().text() == fx.tool.string() + " test my-app:test:my-app-test --coverage");
    REQUIRE(fe.session().last_target() == std::string("my-app:test:my-app-test"));
}

TEST_CASE("cancelled target choice issues nothing", "[frontend]") {
    Fixture fx;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    auto cmd = fe.make_command("build", std::nullopt, {});
    REQUIRE(cmd.is_err());
    REQUIRE(cmd.error().code == StackupError::Cancelled);
    REQUIRE_FALSE(fe.session().last_target());
}

TEST_CASE("project operation runs at the root", "[frontend]") {
    Fixture fx;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path / "bin").is_ok());

    auto cmd = fe.make_command("dot", std::nullopt, {"--external"});
    REQUIRE(cmd.is_ok());
    REQUIRE(cmd.value().argv() ==
            std::vector<std::string>{fx.tool.string(), "dot", "--external"});
    REQUIRE(cmd.value().working_dir == fx.td.path);
    REQUIRE(cmd.value().channel_key == "project.stackup.log");
    REQUIRE(fx.prompter.asked.empty());
}

TEST_CASE("global operation needs no project", "[frontend]") {
    Fixture fx;
    Frontend fe(fx.config, fx.prompter, fx.opener);

    auto cmd = fe.make_command("update", std::nullopt, {});
    REQUIRE(cmd.is_ok());
    REQUIRE(cmd.value().argv() == std::vector<std::string>{fx.tool.string(), "update"});

    auto pkg_cmd = fe.make_command("build", std::nullopt, {});
    REQUIRE(pkg_cmd.is_err());
    REQUIRE(pkg_cmd.error().code == StackupError::NoProjectFound);
}

TEST_CASE("make_command rejects bad requests", "[frontend]") {
    Fixture fx;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    REQUIRE(fe.make_command("deploy", std::nullopt, {}).error().code ==
            StackupError::InvalidArg);
    REQUIRE(fe.make_command("build", std::nullopt, {"--turbo"}).error().code ==
            StackupError::InvalidArg);
    REQUIRE(fx.prompter.asked.empty());
}

TEST_CASE("missing build tool is reported", "[frontend]") {
    Fixture fx;
    fx.config.tool.path = (fx.td.path / "bin/no-such-stack").string();
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    auto cmd = fe.make_command("update", std::nullopt, {});
    REQUIRE(cmd.error().code == StackupError::ExternalToolMissing);
}

TEST_CASE("quote mode reaches the command text", "[frontend]") {
    Fixture fx;
    fx.config.behavior.quote = QuoteMode::Always;
    Frontend fe(fx.config, fx.prompter, fx.opener);

    auto cmd = fe.make_command("setup", std::nullopt, {});
    REQUIRE(cmd.value().text() == "'" + fx.tool.string() + "' 'setup'");
}

TEST_CASE("edit before run rewrites the command", "[frontend]") {
    Fixture fx;
    fx.config.behavior.auto_target = true;
    fx.config.behavior.edit_before_run = true;
    fx.prompter.edit = [](const std::string& text) { return text + " --pedantic"; };
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    auto cmd = fe.make_command("build", std::nullopt, {});
    REQUIRE(cmd.is_ok());
    REQUIRE(fx.prompter.edited.at(0) == fx.tool.string() + " build my-app");
    REQUIRE(cmd.value().edited_text == fx.tool.string() + " build my-app --pedantic");
    REQUIRE(cmd.value().argv().at(0) == "/bin/sh");

    fx.prompter.edit = [](const std::string&) { return std::string(); };
    REQUIRE(fe.make_command("build", std::nullopt, {}).error().code ==
            StackupError::Cancelled);
}

// ===== run =====

TEST_CASE("finished haddock run opens the documentation", "[frontend]") {
    Fixture fx;
    fx.config.behavior.auto_target = true;
    fx.config.behavior.auto_open_haddock = true;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    REQUIRE(fe.run("haddock", std::nullopt, {}).is_ok());
    fe.runner().wait_all();

    std::lock_guard<std::mutex> lock(fx.opener.mutex);
    REQUIRE(fx.opener.opened ==
            std::vector<std::string>{(fx.td.path / ".stack-work/doc/html/my-app/index.html").string()});
}

TEST_CASE("artifacts stay closed when opening is off", "[frontend]") {
    Fixture fx;
    fx.config.behavior.auto_target = true;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());

    REQUIRE(fe.run("haddock", std::nullopt, {}).is_ok());
    fe.runner().wait_all();
    REQUIRE(fx.opener.opened.empty());
}

// ===== open_package_page =====

TEST_CASE("package page at the newest version", "[frontend]") {
    Fixture fx;
    fx.config.behavior.auto_newest_version = true;
    Frontend fe(fx.config, fx.prompter, fx.opener);

    REQUIRE(fe.open_package_page("text").is_ok());
    REQUIRE(fx.opener.opened ==
            std::vector<std::string>{"https://hackage.haskell.org/package/text-2.0.2"});
    REQUIRE(fx.prompter.asked.empty());
}

TEST_CASE("package page at a chosen version", "[frontend]") {
    Fixture fx;
    fx.prompter.answers = {"1.2.5.0"};
    Frontend fe(fx.config, fx.prompter, fx.opener);

    REQUIRE(fe.open_package_page("text").is_ok());
    REQUIRE(fx.opener.opened ==
            std::vector<std::string>{"https://hackage.haskell.org/package/text-1.2.5.0"});
    REQUIRE(fe.open_package_page("lens").error().code == StackupError::NotFound);
    REQUIRE(fe.registry().query_count() == 1);
}

// ===== discover_config =====

TEST_CASE("discover_config picks up the project layer", "[frontend]") {
    TempDir home;
    ScopedEnv env("HOME", home.path.string());
    Fixture fx;
    home.write_file(".stackup/config.toml", "[behavior]\nauto-newest-version = true\n");
    fx.td.write_file(".stackup.toml", "[behavior]\nauto-target = true\n");

    auto inside = discover_config(fx.td.path / "bin");
    REQUIRE(inside.is_ok());
    REQUIRE(inside.value().behavior.auto_target);
    REQUIRE(inside.value().behavior.auto_newest_version);

    auto outside = discover_config(home.path);
    REQUIRE(outside.is_ok());
    REQUIRE_FALSE(outside.value().behavior.auto_target);
    REQUIRE(outside.value().behavior.auto_newest_version);
}

// ===== open_homepage =====

TEST_CASE("homepage of the current or a named package", "[frontend]") {
    Fixture fx;
    fx.td.write_file("cabal.project", "packages: .\n");
    fx.td.write_file("lib/util/util.cabal",
        "name: util\nsource-repository head\n  location: https://git.example.org/util\n");
    fx.td.write_file("lib/bare/bare.cabal", "name: bare\n");
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.prepare(fx.td.path).is_ok());
    REQUIRE(fe.session().current_package()->name == "my-app");

    REQUIRE(fe.open_homepage(std::nullopt).is_ok());
    REQUIRE(fe.open_homepage(std::string("util")).is_ok());
    REQUIRE(fx.opener.opened == std::vector<std::string>{
        "https://github.com/example/my-app", "https://git.example.org/util"});

    REQUIRE(fe.open_homepage(std::string("bare")).error().code == StackupError::NotFound);
    REQUIRE(fe.open_homepage(std::string("lens")).error().code == StackupError::NotFound);
    REQUIRE(fx.opener.opened.size() == 2);
}

TEST_CASE("homepage needs a loaded project", "[frontend]") {
    Fixture fx;
    Frontend fe(fx.config, fx.prompter, fx.opener);
    REQUIRE(fe.open_homepage(std::nullopt).error().code == StackupError::NoProjectFound);
}
