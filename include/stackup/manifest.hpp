#pragma once

#include <stackup/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stackup {

// What a single manifest line is, as far as discovery cares
enum class LineKind {
    Name,        // name: <value>
    Version,     // version: <value>
    Homepage,    // homepage: <value>
    Location,    // location: <value>
    Library,     // library stanza header (presence only)
    Executable,  // executable <ident>
    TestSuite,   // test-suite <ident>
    Benchmark,   // benchmark <ident>
    Other
};

struct ManifestLine {
    LineKind kind = LineKind::Other;
    std::string value;   // field value or stanza identifier, trimmed
};

// Classify one line. Keys are matched case-insensitively after optional
// leading blanks; values keep their original case.
ManifestLine classify_line(const std::string& line);

// Intermediate form between line classification and target synthesis
struct ManifestSummary {
    std::string name;
    std::string version;
    std::string homepage;
    std::string location;
    bool has_library = false;
    std::vector<std::string> executables;
    std::vector<std::string> test_suites;
    std::vector<std::string> benchmarks;
};

// Scalar fields: first occurrence wins. Stanzas: collected in file order.
ManifestSummary scan_manifest(const std::string& text);

// Always in the order lib, exe, test, bench:
//   name:lib, name:exe:<id>..., name:test:<id>..., name:bench:<id>...
std::vector<std::string> synthesize_targets(const ManifestSummary& summary);

struct PackageRecord {
    std::string name;
    std::string version;
    std::string homepage;
    std::string location;
    std::vector<std::string> targets;
    std::filesystem::path directory;       // absolute dir holding the manifest
    std::filesystem::path manifest_path;   // absolute path to the manifest
    std::filesystem::file_time_type manifest_mtime{};  // mtime the fields derive from

    // Record for a manifest that could not be read; name/version stay empty
    static PackageRecord fallback(const std::filesystem::path& manifest_path);
};

// Read and parse one manifest. Fails with ManifestNotFound if unreadable.
// The mtime is captured before reading, so a concurrent write is picked up
// as stale by the next refresh.
Result<PackageRecord> parse_manifest(const std::filesystem::path& path);

} // namespace stackup
