#include <stackup/output_scanner.hpp>
#include <stackup/command.hpp>
#include <stackup/log.hpp>
#include <sstream>
#include <vector>

namespace stackup {

namespace fs = std::filesystem;

static const char* const COVERAGE_MARKERS[] = {
    "The coverage report for ",
    "An index of the generated HTML coverage reports",
};
static const char* const AVAILABLE_AT = " is available at ";
static const char* const HADDOCK_INDEX = "Updating Haddock index for local packages in";
static const char* const DOCS_CREATED = "Documentation created:";

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// First non-empty line after index i
static std::optional<std::string> next_line(const std::vector<std::string>& lines, size_t i) {
    for (size_t j = i + 1; j < lines.size(); ++j) {
        std::string t = trim(lines[j]);
        if (!t.empty()) return t;
    }
    return std::nullopt;
}

static std::optional<std::string> coverage_path(const std::string& line) {
    bool marked = false;
    for (const char* m : COVERAGE_MARKERS) {
        if (line.find(m) != std::string::npos) { marked = true; break; }
    }
    if (!marked) return std::nullopt;

    size_t at = line.find(AVAILABLE_AT);
    if (at == std::string::npos) return std::nullopt;
    std::string path = trim(line.substr(at + std::char_traits<char>::length(AVAILABLE_AT)));
    if (path.empty()) return std::nullopt;
    return path;
}

ArtifactScan scan_output(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) lines.push_back(line);

    ArtifactScan scan;
    std::optional<std::string> index_form, created_form;

    for (size_t i = 0; i < lines.size(); ++i) {
        std::string t = trim(lines[i]);

        if (!scan.coverage) scan.coverage = coverage_path(t);

        if (!index_form && t.compare(0, std::char_traits<char>::length(HADDOCK_INDEX),
                                     HADDOCK_INDEX) == 0) {
            std::string rest = trim(t.substr(std::char_traits<char>::length(HADDOCK_INDEX)));
            index_form = rest.empty() ? next_line(lines, i) : std::optional<std::string>(rest);
        }

        if (!created_form && t.compare(0, std::char_traits<char>::length(DOCS_CREATED),
                                       DOCS_CREATED) == 0) {
            auto dir = next_line(lines, i);
            if (dir) {
                while (!dir->empty() && dir->back() == ',') dir->pop_back();
                fs::path p(*dir);
                if (p.extension() != ".html") p /= "index.html";
                created_form = p.string();
            }
        }
    }

    scan.haddock = index_form ? index_form : created_form;
    return scan;
}

std::string resolve_location(const std::string& raw, const fs::path& base_dir) {
    if (raw.find("://") != std::string::npos) return raw;
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty()) return p.lexically_normal().string();
    return (base_dir / p).lexically_normal().string();
}

Result<int> surface_artifacts(const ArtifactScan& scan,
                              const fs::path& base_dir,
                              const ArtifactOptions& options,
                              Opener& opener) {
    int opened = 0;
    if (scan.coverage && options.open_coverage) {
        std::string loc = resolve_location(*scan.coverage, base_dir);
        log::debug("opening coverage report: %s", loc.c_str());
        STACKUP_TRY(opener.open(loc));
        ++opened;
    }
    if (scan.haddock && options.open_haddock) {
        std::string loc = resolve_location(*scan.haddock, base_dir);
        log::debug("opening haddock index: %s", loc.c_str());
        STACKUP_TRY(opener.open(loc));
        ++opened;
    }
    return Result<int>::ok(opened);
}

Result<int> handle_finished(const ProcessOutcome& outcome,
                            const ArtifactOptions& options,
                            Opener& opener) {
    if (!is_engine_channel(outcome.command.channel_key)) {
        return Result<int>::ok(0);
    }
    return surface_artifacts(scan_output(outcome.output),
                             outcome.command.package_dir, options, opener);
}

} // namespace stackup
