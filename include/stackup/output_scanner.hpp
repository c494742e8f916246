#pragma once

#include <stackup/result.hpp>
#include <stackup/prompter.hpp>
#include <stackup/process.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace stackup {

// Artifact locations found in finished build output, as printed
struct ArtifactScan {
    std::optional<std::string> coverage;
    std::optional<std::string> haddock;
};

// Top-to-bottom scan. Coverage: first report line wins. Haddock: the
// "Updating Haddock index" form is preferred over "Documentation created".
ArtifactScan scan_output(const std::string& text);

// URLs and absolute paths are returned unchanged, relative paths are
// resolved against base_dir
std::string resolve_location(const std::string& raw, const std::filesystem::path& base_dir);

struct ArtifactOptions {
    bool open_coverage = false;
    bool open_haddock = false;
};

// Open the artifacts whose class is enabled. Returns how many were opened.
Result<int> surface_artifacts(const ArtifactScan& scan,
                              const std::filesystem::path& base_dir,
                              const ArtifactOptions& options,
                              Opener& opener);

// Scan a finished run and surface its artifacts, if the run's output went
// to a channel created by this engine. Returns how many were opened.
Result<int> handle_finished(const ProcessOutcome& outcome,
                            const ArtifactOptions& options,
                            Opener& opener);

} // namespace stackup
