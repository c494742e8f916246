#include <catch2/catch.hpp>
#include <stackup/registry.hpp>
#include "fakes.hpp"

using namespace stackup;

static const char* LISTING = R"(/opt/ghc/lib/package.conf.d
    Cabal-3.10.1.0
    array-0.5.4.0
    base-4.18.0.0
    (haskeline-0.8.2.1)
    {broken-pkg-1.0}
/home/user/.stack/snapshots/pkgdb
    aeson-2.1.2.1
    aeson-2.2.0.0
    text-2.0.2 text-1.2.5.0
)";

static PackageRegistry fixed_registry(size_t& calls, std::string listing = LISTING) {
    return PackageRegistry([&calls, listing]() -> Result<std::string> {
        ++calls;
        return Result<std::string>::ok(listing);
    });
}

// ===== Token parsing =====

TEST_CASE("parse_package_token splits at the last hyphen", "[registry]") {
    auto p = parse_package_token("regex-tdfa-1.3.2");
    REQUIRE(p.has_value());
    REQUIRE(p->name == "regex-tdfa");
    REQUIRE(p->version == "1.3.2");
}

TEST_CASE("parse_package_token strips hidden and broken markers", "[registry]") {
    REQUIRE(parse_package_token("(haskeline-0.8.2.1)")->name == "haskeline");
    REQUIRE(parse_package_token("{broken-pkg-1.0}")->name == "broken-pkg");
}

TEST_CASE("parse_package_token rejects non package tokens", "[registry]") {
    REQUIRE_FALSE(parse_package_token("/opt/ghc/lib/package.conf.d").has_value());
    REQUIRE_FALSE(parse_package_token("nohyphen").has_value());
    REQUIRE_FALSE(parse_package_token("-1.0").has_value());
    REQUIRE_FALSE(parse_package_token("pkg-1.0a").has_value());
    REQUIRE_FALSE(parse_package_token("pkg--1.0").has_value());
}

TEST_CASE("parse_package_listing groups every version by name", "[registry]") {
    auto grouped = parse_package_listing(LISTING);
    REQUIRE(grouped.size() == 7);
    REQUIRE(grouped.at("aeson") == std::vector<std::string>{"2.1.2.1", "2.2.0.0"});
    REQUIRE(grouped.at("text") == std::vector<std::string>{"2.0.2", "1.2.5.0"});
    REQUIRE(grouped.at("base") == std::vector<std::string>{"4.18.0.0"});
}

TEST_CASE("parse_package_listing keeps duplicate versions", "[registry]") {
    auto grouped = parse_package_listing("mtl-2.3.1 mtl-2.3.1");
    REQUIRE(grouped.at("mtl").size() == 2);
}

// ===== Cache =====

TEST_CASE("registry queries once and caches", "[registry]") {
    size_t calls = 0;
    auto reg = fixed_registry(calls);
    REQUIRE_FALSE(reg.is_loaded());

    auto names = reg.installed_packages();
    REQUIRE(names.is_ok());
    REQUIRE(names.value().count("Cabal") == 1);
    REQUIRE(reg.versions("aeson").value().size() == 2);
    REQUIRE(reg.versions("base").is_ok());
    REQUIRE(calls == 1);
    REQUIRE(reg.query_count() == 1);
}

TEST_CASE("refresh replaces the cache wholesale", "[registry]") {
    size_t calls = 0;
    std::string listing = "old-1.0";
    PackageRegistry reg([&]() -> Result<std::string> {
        ++calls;
        return Result<std::string>::ok(listing);
    });

    REQUIRE(reg.installed_packages().value() == std::set<std::string>{"old"});
    listing = "new-2.0";
    // No automatic invalidation
    REQUIRE(reg.installed_packages().value() == std::set<std::string>{"old"});

    REQUIRE(reg.refresh().is_ok());
    REQUIRE(reg.installed_packages().value() == std::set<std::string>{"new"});
    REQUIRE(calls == 2);
}

TEST_CASE("query failure is reported and nothing is cached", "[registry]") {
    PackageRegistry reg([]() -> Result<std::string> {
        return StackupError{StackupError::Spawn, "cannot execute ghc-pkg"};
    });
    auto r = reg.installed_packages();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StackupError::Spawn);
    REQUIRE_FALSE(reg.is_loaded());
}

TEST_CASE("registry runs an external query command", "[registry]") {
    PackageRegistry reg(std::vector<std::string>{"/bin/sh", "-c", "echo base-4.18.0.0 mtl-2.3.1"});
    auto names = reg.installed_packages();
    REQUIRE(names.is_ok());
    REQUIRE(names.value() == std::set<std::string>{"base", "mtl"});
}

TEST_CASE("failing query command is an error", "[registry]") {
    PackageRegistry reg(std::vector<std::string>{"/bin/sh", "-c", "echo oops >&2; exit 3"});
    auto r = reg.installed_packages();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StackupError::IO);
    REQUIRE(r.error().hint.find("oops") != std::string::npos);
}

TEST_CASE("unknown package is NotFound", "[registry]") {
    size_t calls = 0;
    auto reg = fixed_registry(calls);
    REQUIRE(reg.versions("lens").error().code == StackupError::NotFound);
}

// ===== Version choice =====

TEST_CASE("newest_version uses numeric ordering", "[registry]") {
    size_t calls = 0;
    auto reg = fixed_registry(calls, "pkg-1.2.0 pkg-1.10.0 pkg-1.9.9");
    REQUIRE(reg.newest_version("pkg").value() == "1.10.0");
}

TEST_CASE("choose_version asks only when several versions exist", "[registry]") {
    size_t calls = 0;
    auto reg = fixed_registry(calls);
    ScriptedPrompter p;

    REQUIRE(reg.choose_version("base", false, p).value() == "4.18.0.0");
    REQUIRE(p.asked.empty());

    REQUIRE(reg.choose_version("aeson", true, p).value() == "2.2.0.0");
    REQUIRE(p.asked.empty());

    p.answers = {"2.1.2.1"};
    REQUIRE(reg.choose_version("aeson", false, p).value() == "2.1.2.1");
    REQUIRE(p.asked.size() == 1);

    p.answers = {"9.9"};
    REQUIRE(reg.choose_version("aeson", false, p).error().code == StackupError::InvalidArg);
}

TEST_CASE("hackage_location", "[registry]") {
    REQUIRE(hackage_location("text") == "https://hackage.haskell.org/package/text");
    REQUIRE(hackage_location("text", "2.0.2") ==
            "https://hackage.haskell.org/package/text-2.0.2");
}
