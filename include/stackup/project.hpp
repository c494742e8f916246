#pragma once

#include <stackup/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stackup {

// Filenames that shape a project on disk
struct ProjectLayout {
    // Presence of any of these marks a project root
    std::vector<std::string> markers = {"stack.yaml", "cabal.config", "cabal.sandbox.config"};
    // Presence of this at the root marks a compound (multi-package) project
    std::string compound_marker = "cabal.project";
    std::string manifest_extension = ".cabal";
};

// Check if dir contains any of the project marker files
bool has_project_marker(const std::filesystem::path& dir, const ProjectLayout& layout);

// Check if dir contains the compound-project marker
bool is_compound_root(const std::filesystem::path& dir, const ProjectLayout& layout);

// Walk up from start_dir (inclusive) to the nearest directory holding a
// project marker. NoProjectFound once the filesystem root is passed.
Result<std::filesystem::path> locate_root(const std::filesystem::path& start_dir,
                                          const ProjectLayout& layout);

// Depth-first search below root_dir for manifest files. A subdirectory that
// carries its own project or compound marker is a separate project and is
// not descended into; hidden directories are skipped too.
Result<std::vector<std::filesystem::path>> find_manifests(
    const std::filesystem::path& root_dir, const ProjectLayout& layout);

// Manifest files directly inside dir, sorted
Result<std::vector<std::filesystem::path>> find_local_manifests(
    const std::filesystem::path& dir, const ProjectLayout& layout);

} // namespace stackup
