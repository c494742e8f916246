#include <stackup/manifest.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace stackup {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Line classification
// ---------------------------------------------------------------------------

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

static std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && is_blank(s[begin])) ++begin;
    size_t end = s.size();
    while (end > begin && is_blank(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

// Case-insensitive prefix test at pos
static bool starts_with_ci(const std::string& s, size_t pos, const char* prefix) {
    for (size_t i = 0; prefix[i] != '\0'; ++i) {
        if (pos + i >= s.size()) return false;
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(s[pos + i])));
        if (a != prefix[i]) return false;
    }
    return true;
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '-' || c == '_' || c == '.' || c == '\'';
}

// "<keyword> <ident>" stanza header; returns the identifier or empty
static std::string stanza_ident(const std::string& line, size_t pos, const char* keyword) {
    size_t len = std::char_traits<char>::length(keyword);
    if (!starts_with_ci(line, pos, keyword)) return "";
    size_t p = pos + len;
    if (p >= line.size() || !is_blank(line[p])) return "";
    while (p < line.size() && is_blank(line[p])) ++p;
    size_t start = p;
    while (p < line.size() && is_ident_char(line[p])) ++p;
    return line.substr(start, p - start);
}

ManifestLine classify_line(const std::string& line) {
    ManifestLine result;

    size_t pos = 0;
    while (pos < line.size() && is_blank(line[pos])) ++pos;
    if (pos >= line.size() || line.compare(pos, 2, "--") == 0) return result;

    struct Field { const char* key; LineKind kind; };
    static const Field fields[] = {
        {"name:",     LineKind::Name},
        {"version:",  LineKind::Version},
        {"homepage:", LineKind::Homepage},
        {"location:", LineKind::Location},
    };
    for (const auto& f : fields) {
        if (starts_with_ci(line, pos, f.key)) {
            result.kind = f.kind;
            result.value = trim(line.substr(pos + std::char_traits<char>::length(f.key)));
            return result;
        }
    }

    if (starts_with_ci(line, pos, "library")) {
        size_t after = pos + 7;
        if (after >= line.size() || is_blank(line[after])) {
            result.kind = LineKind::Library;
            return result;
        }
    }

    struct Stanza { const char* keyword; LineKind kind; };
    static const Stanza stanzas[] = {
        {"executable", LineKind::Executable},
        {"test-suite", LineKind::TestSuite},
        {"benchmark",  LineKind::Benchmark},
    };
    for (const auto& st : stanzas) {
        std::string ident = stanza_ident(line, pos, st.keyword);
        if (!ident.empty()) {
            result.kind = st.kind;
            result.value = std::move(ident);
            return result;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Summary and targets
// ---------------------------------------------------------------------------

ManifestSummary scan_manifest(const std::string& text) {
    ManifestSummary summary;
    bool seen_name = false, seen_version = false;
    bool seen_homepage = false, seen_location = false;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        ManifestLine ml = classify_line(line);
        switch (ml.kind) {
        case LineKind::Name:
            if (!seen_name) { summary.name = ml.value; seen_name = true; }
            break;
        case LineKind::Version:
            if (!seen_version) { summary.version = ml.value; seen_version = true; }
            break;
        case LineKind::Homepage:
            if (!seen_homepage) { summary.homepage = ml.value; seen_homepage = true; }
            break;
        case LineKind::Location:
            if (!seen_location) { summary.location = ml.value; seen_location = true; }
            break;
        case LineKind::Library:
            summary.has_library = true;
            break;
        case LineKind::Executable:
            summary.executables.push_back(ml.value);
            break;
        case LineKind::TestSuite:
            summary.test_suites.push_back(ml.value);
            break;
        case LineKind::Benchmark:
            summary.benchmarks.push_back(ml.value);
            break;
        case LineKind::Other:
            break;
        }
    }

    return summary;
}

std::vector<std::string> synthesize_targets(const ManifestSummary& summary) {
    std::vector<std::string> targets;
    const std::string& n = summary.name;

    if (summary.has_library) targets.push_back(n + ":lib");
    for (const auto& e : summary.executables) targets.push_back(n + ":exe:" + e);
    for (const auto& t : summary.test_suites) targets.push_back(n + ":test:" + t);
    for (const auto& b : summary.benchmarks)  targets.push_back(n + ":bench:" + b);

    return targets;
}

// ---------------------------------------------------------------------------
// PackageRecord
// ---------------------------------------------------------------------------

static fs::path absolute_path(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::weakly_canonical(p, ec);
    if (ec) abs = fs::absolute(p, ec);
    if (ec) return p;
    return abs;
}

PackageRecord PackageRecord::fallback(const fs::path& manifest_path) {
    PackageRecord rec;
    rec.manifest_path = absolute_path(manifest_path);
    rec.directory = rec.manifest_path.parent_path();
    std::error_code ec;
    auto mtime = fs::last_write_time(rec.manifest_path, ec);
    rec.manifest_mtime = ec ? fs::file_time_type::min() : mtime;
    return rec;
}

Result<PackageRecord> parse_manifest(const fs::path& path) {
    fs::path abs = absolute_path(path);

    std::error_code ec;
    auto mtime = fs::last_write_time(abs, ec);
    if (ec) {
        return StackupError{StackupError::ManifestNotFound,
            "cannot stat manifest: " + ec.message(), "", abs.string()};
    }

    std::ifstream file(abs);
    if (!file.is_open()) {
        return StackupError{StackupError::ManifestNotFound,
            "cannot open manifest", "", abs.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    ManifestSummary summary = scan_manifest(ss.str());

    PackageRecord rec;
    rec.targets = synthesize_targets(summary);
    rec.name = std::move(summary.name);
    rec.version = std::move(summary.version);
    rec.homepage = std::move(summary.homepage);
    rec.location = std::move(summary.location);
    rec.manifest_path = abs;
    rec.directory = abs.parent_path();
    rec.manifest_mtime = mtime;

    return Result<PackageRecord>::ok(std::move(rec));
}

} // namespace stackup
