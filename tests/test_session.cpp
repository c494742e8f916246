#include <catch2/catch.hpp>
#include <stackup/session.hpp>
#include "temp_dir.hpp"

using namespace stackup;

static void setup_compound(TempDir& td) {
    td.write_file("stack.yaml", "packages:\n- alpha\n- beta\n");
    td.write_file("cabal.project", "packages: alpha beta\n");
    td.write_file("alpha/alpha.cabal", R"(
name: alpha
version: 1.0.0
library
executable alpha-cli
)");
    td.write_file("beta/beta.cabal", R"(
name: beta
version: 0.2.0
library
test-suite beta-spec
)");
}

static void setup_simple(TempDir& td) {
    td.write_file("stack.yaml", "resolver: lts-22.0\n");
    td.write_file("solo.cabal", "name: solo\nversion: 0.0.1\nexecutable solo\n");
}

// ===== Project shape =====

TEST_CASE("compound project loads every package", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;

    auto r = s.prepare(td.path / "beta");
    REQUIRE(r.is_ok());
    const ProjectState& st = *r.value();
    REQUIRE(st.is_compound);
    REQUIRE(st.packages.size() == 2);
    REQUIRE(st.root_dir == td.path);
    REQUIRE(st.project_name == td.path.filename().string());
    REQUIRE(st.packages[0]->name == "alpha");
    REQUIRE(st.packages[1]->name == "beta");
    REQUIRE(st.current == 0);
    REQUIRE(st.marker_mtime.has_value());
}

TEST_CASE("simple project has one package named after its manifest", "[session]") {
    TempDir td;
    setup_simple(td);
    Session s;

    auto r = s.prepare(td.path);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value()->is_compound);
    REQUIRE(r.value()->packages.size() == 1);
    REQUIRE(r.value()->project_name == "solo");
    REQUIRE(s.current_package()->targets == std::vector<std::string>{"solo:exe:solo"});
    REQUIRE_FALSE(r.value()->marker_mtime.has_value());
}

TEST_CASE("compound marker with a single package is not compound", "[session]") {
    TempDir td;
    td.write_file("stack.yaml", "");
    td.write_file("cabal.project", "");
    td.write_file("only/only.cabal", "name: only\n");
    Session s;

    auto r = s.prepare(td.path);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value()->is_compound);
}

TEST_CASE("simple project needs exactly one manifest", "[session]") {
    TempDir td;
    td.write_file("stack.yaml", "");
    Session s;

    auto none = s.prepare(td.path);
    REQUIRE(none.is_err());
    REQUIRE(none.error().code == StackupError::NoManifestFound);

    td.write_file("a.cabal", "name: a\n");
    td.write_file("b.cabal", "name: b\n");
    auto two = s.prepare(td.path);
    REQUIRE(two.is_err());
    REQUIRE(two.error().code == StackupError::NoManifestFound);
}

TEST_CASE("prepare outside any project is NoProjectFound", "[session]") {
    TempDir td;
    ProjectLayout layout;
    layout.markers = {"no-such-marker-4f1c2e.yaml"};
    Session s(layout);

    auto r = s.prepare(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StackupError::NoProjectFound);
    REQUIRE(s.state() == nullptr);
}

// ===== Cache behaviour =====

TEST_CASE("prepare twice without changes reparses nothing", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;

    auto first = s.prepare(td.path);
    REQUIRE(first.is_ok());
    REQUIRE(s.parse_count() == 2);
    std::vector<PackagePtr> before = first.value()->packages;

    auto second = s.prepare(td.path);
    REQUIRE(second.is_ok());
    REQUIRE(s.parse_count() == 2);
    REQUIRE(second.value()->packages.size() == before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        REQUIRE(second.value()->packages[i] == before[i]);
    }
}

TEST_CASE("only the touched manifest is reparsed", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;

    auto first = s.prepare(td.path);
    REQUIRE(first.is_ok());
    PackagePtr alpha = first.value()->packages[0];
    PackagePtr beta = first.value()->packages[1];

    td.write_file("beta/beta.cabal", "name: beta\nversion: 0.3.0\nlibrary\nbenchmark perf\n");
    td.touch_later("beta/beta.cabal");

    auto second = s.prepare(td.path);
    REQUIRE(second.is_ok());
    REQUIRE(s.parse_count() == 3);
    REQUIRE(second.value()->packages[0] == alpha);
    REQUIRE(second.value()->packages[1] != beta);
    REQUIRE(second.value()->packages[1]->version == "0.3.0");
    REQUIRE(second.value()->packages[1]->targets ==
            std::vector<std::string>{"beta:lib", "beta:bench:perf"});
}

TEST_CASE("a newer compound marker forces a full reload", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;
    REQUIRE(s.prepare(td.path).is_ok());
    REQUIRE(s.parse_count() == 2);

    td.write_file("gamma/gamma.cabal", "name: gamma\n");
    // Adding a package without touching the marker goes unnoticed
    REQUIRE(s.prepare(td.path).value()->packages.size() == 2);

    td.touch_later("cabal.project");
    auto r = s.prepare(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value()->packages.size() == 3);
    REQUIRE(s.parse_count() == 5);
}

TEST_CASE("unreadable manifest falls back without blocking others", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;
    REQUIRE(s.prepare(td.path).is_ok());

    fs::remove(td.path / "beta" / "beta.cabal");
    auto r = s.prepare(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value()->packages[0]->name == "alpha");
    REQUIRE(r.value()->packages[1]->name.empty());
    REQUIRE(r.value()->packages[1]->version.empty());
    size_t parses = s.parse_count();

    // The fallback record is kept while the file stays missing
    REQUIRE(s.prepare(td.path).is_ok());
    REQUIRE(s.parse_count() == parses);
}

// ===== Project switches and selection =====

TEST_CASE("switching projects replaces state and resets selection", "[session]") {
    TempDir a, b;
    setup_compound(a);
    setup_simple(b);
    Session s;

    REQUIRE(s.prepare(a.path).is_ok());
    REQUIRE(s.select_package("beta").is_ok());
    s.remember_target("beta:test:beta-spec");

    // Same project again keeps the selection
    REQUIRE(s.prepare(a.path / "alpha").is_ok());
    REQUIRE(s.current_package()->name == "beta");
    REQUIRE(s.last_target().has_value());

    auto r = s.prepare(b.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value()->project_name == "solo");
    REQUIRE(r.value()->current == 0);
    REQUIRE_FALSE(s.last_target().has_value());
}

TEST_CASE("current package survives a refresh of its manifest", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;
    REQUIRE(s.prepare(td.path).is_ok());
    REQUIRE(s.select_package("beta").is_ok());

    td.write_file("beta/beta.cabal", "name: beta\nversion: 9\n");
    td.touch_later("beta/beta.cabal");
    REQUIRE(s.prepare(td.path).is_ok());
    REQUIRE(s.current_package()->version == "9");
}

TEST_CASE("select_package errors", "[session]") {
    Session s;
    REQUIRE(s.select_package("x").error().code == StackupError::NoProjectFound);

    TempDir td;
    setup_compound(td);
    REQUIRE(s.prepare(td.path).is_ok());
    REQUIRE(s.select_package("missing").error().code == StackupError::NotFound);
}

TEST_CASE("changing the current package clears the remembered target", "[session]") {
    TempDir td;
    setup_compound(td);
    Session s;
    REQUIRE(s.prepare(td.path).is_ok());
    s.remember_target("alpha:lib");

    REQUIRE(s.select_package("alpha").is_ok());
    REQUIRE(s.last_target() == std::optional<std::string>("alpha:lib"));
    REQUIRE(s.select_package("beta").is_ok());
    REQUIRE_FALSE(s.last_target().has_value());
}

TEST_CASE("reset drops the project", "[session]") {
    TempDir td;
    setup_simple(td);
    Session s;
    REQUIRE(s.prepare(td.path).is_ok());
    s.reset();
    REQUIRE(s.state() == nullptr);
    REQUIRE(s.current_package() == nullptr);
}
