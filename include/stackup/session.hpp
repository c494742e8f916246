#pragma once

#include <stackup/result.hpp>
#include <stackup/manifest.hpp>
#include <stackup/project.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

using PackagePtr = std::shared_ptr<const PackageRecord>;

struct ProjectState {
    std::filesystem::path root_dir;
    std::string project_name;
    bool is_compound = false;
    std::vector<PackagePtr> packages;   // unique by name, discovery order
    size_t current = 0;                 // index of the active package
    // Compound marker mtime at last full load; unset for simple projects
    std::optional<std::filesystem::file_time_type> marker_mtime;

    const PackageRecord* current_package() const;
    const PackageRecord* find_package(const std::string& name) const;
};

// Owns the active project. prepare() loads it on first use and afterwards
// reparses only manifests whose mtime moved past the one captured at parse.
class Session {
public:
    explicit Session(ProjectLayout layout = ProjectLayout{});

    Result<const ProjectState*> prepare(const std::filesystem::path& start_dir);

    // nullptr until the first successful prepare
    const ProjectState* state() const;

    const PackageRecord* current_package() const;
    Status select_package(const std::string& name);

    void reset();

    // Package-scoped selection, cleared when the project or package changes
    const std::optional<std::string>& last_target() const;
    void remember_target(std::string target);

    // Manifest parses performed by this session
    size_t parse_count() const;

    const ProjectLayout& layout() const;

private:
    ProjectLayout layout_;
    std::optional<ProjectState> state_;
    std::optional<std::string> last_target_;
    size_t parse_count_ = 0;

    PackagePtr load_manifest(const std::filesystem::path& manifest_path);
    Result<std::vector<PackagePtr>> load_all(const std::filesystem::path& root_dir,
                                             bool compound,
                                             const std::filesystem::path& simple_manifest);
    std::vector<PackagePtr> refresh_stale(const std::vector<PackagePtr>& packages);
};

} // namespace stackup
