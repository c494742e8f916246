#include <stackup/project.hpp>
#include <stackup/log.hpp>
#include <algorithm>
#include <set>

namespace stackup {

namespace fs = std::filesystem;

static bool is_manifest_file(const fs::directory_entry& entry, const ProjectLayout& layout) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return false;
    return entry.path().extension() == layout.manifest_extension;
}

static Result<std::vector<fs::directory_entry>> sorted_entries(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return StackupError{StackupError::IO,
            "cannot list directory: " + ec.message(), "", dir.string()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return StackupError{StackupError::IO,
                "error while listing directory: " + ec.message(), "", dir.string()};
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });
    return Result<std::vector<fs::directory_entry>>::ok(std::move(entries));
}

bool has_project_marker(const fs::path& dir, const ProjectLayout& layout) {
    std::error_code ec;
    for (const auto& marker : layout.markers) {
        if (fs::exists(dir / marker, ec)) return true;
    }
    return false;
}

bool is_compound_root(const fs::path& dir, const ProjectLayout& layout) {
    std::error_code ec;
    return fs::exists(dir / layout.compound_marker, ec);
}

Result<fs::path> locate_root(const fs::path& start_dir, const ProjectLayout& layout) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return StackupError{StackupError::IO,
                "cannot resolve path", "", start_dir.string()};
        }
    }

    while (true) {
        if (has_project_marker(dir, layout)) {
            log::debug("project root: %s", dir.c_str());
            return Result<fs::path>::ok(dir);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return StackupError{StackupError::NoProjectFound,
                "no project found in " + start_dir.string() + " or any parent directory",
                "a project root holds stack.yaml or another project marker"};
        }
        dir = parent;
    }
}

static Status collect_manifests(const fs::path& dir, const ProjectLayout& layout,
                                std::set<fs::path>& visited, std::vector<fs::path>& out) {
    // Symlinked directories can lead back into the tree
    std::error_code cec;
    fs::path real = fs::canonical(dir, cec);
    if (!visited.insert(cec ? dir : real).second) {
        log::debug("already searched: %s", dir.c_str());
        return ok_status();
    }

    auto entries = sorted_entries(dir);
    if (entries.is_err()) return std::move(entries).error();

    std::vector<fs::path> subdirs;
    for (const auto& entry : entries.value()) {
        std::error_code ec;
        if (entry.is_directory(ec) && !ec) {
            std::string name = entry.path().filename().string();
            if (!name.empty() && name[0] == '.') continue;
            subdirs.push_back(entry.path());
        } else if (is_manifest_file(entry, layout)) {
            out.push_back(entry.path());
        }
    }

    for (const auto& sub : subdirs) {
        if (has_project_marker(sub, layout) || is_compound_root(sub, layout)) {
            log::debug("skipping nested project: %s", sub.c_str());
            continue;
        }
        STACKUP_TRY(collect_manifests(sub, layout, visited, out));
    }

    return ok_status();
}

Result<std::vector<fs::path>> find_manifests(const fs::path& root_dir,
                                             const ProjectLayout& layout) {
    std::vector<fs::path> manifests;
    std::set<fs::path> visited;
    STACKUP_TRY(collect_manifests(root_dir, layout, visited, manifests));
    return Result<std::vector<fs::path>>::ok(std::move(manifests));
}

Result<std::vector<fs::path>> find_local_manifests(const fs::path& dir,
                                                   const ProjectLayout& layout) {
    auto entries = sorted_entries(dir);
    if (entries.is_err()) return std::move(entries).error();

    std::vector<fs::path> manifests;
    for (const auto& entry : entries.value()) {
        if (is_manifest_file(entry, layout)) manifests.push_back(entry.path());
    }
    return Result<std::vector<fs::path>>::ok(std::move(manifests));
}

} // namespace stackup
