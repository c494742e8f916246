#include <stackup/session.hpp>
#include <stackup/log.hpp>

namespace stackup {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// ProjectState
// ---------------------------------------------------------------------------

const PackageRecord* ProjectState::current_package() const {
    if (current >= packages.size()) return nullptr;
    return packages[current].get();
}

const PackageRecord* ProjectState::find_package(const std::string& name) const {
    for (const auto& p : packages) {
        if (p->name == name) return p.get();
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

Session::Session(ProjectLayout layout)
    : layout_(std::move(layout)) {}

PackagePtr Session::load_manifest(const fs::path& manifest_path) {
    ++parse_count_;
    auto rec = parse_manifest(manifest_path);
    if (rec.is_err()) {
        log::warn("%s", rec.error().format().c_str());
        return std::make_shared<const PackageRecord>(PackageRecord::fallback(manifest_path));
    }
    log::debug("parsed manifest: %s", manifest_path.c_str());
    return std::make_shared<const PackageRecord>(std::move(rec).value());
}

Result<std::vector<PackagePtr>> Session::load_all(const fs::path& root_dir,
                                                  bool compound,
                                                  const fs::path& simple_manifest) {
    std::vector<fs::path> manifests;
    if (compound) {
        auto found = find_manifests(root_dir, layout_);
        if (found.is_err()) return std::move(found).error();
        manifests = std::move(found).value();
    } else {
        manifests.push_back(simple_manifest);
    }

    std::vector<PackagePtr> packages;
    for (const auto& m : manifests) {
        PackagePtr rec = load_manifest(m);
        bool duplicate = false;
        if (!rec->name.empty()) {
            for (const auto& p : packages) {
                if (p->name == rec->name) { duplicate = true; break; }
            }
        }
        if (duplicate) {
            log::warn("duplicate package '%s' ignored: %s",
                      rec->name.c_str(), m.c_str());
            continue;
        }
        packages.push_back(std::move(rec));
    }
    return Result<std::vector<PackagePtr>>::ok(std::move(packages));
}

std::vector<PackagePtr> Session::refresh_stale(const std::vector<PackagePtr>& packages) {
    std::vector<PackagePtr> refreshed;
    refreshed.reserve(packages.size());

    for (const auto& p : packages) {
        std::error_code ec;
        auto now = fs::last_write_time(p->manifest_path, ec);
        bool stale;
        if (ec) {
            // Gone or unreadable: reparse once to produce a fallback record,
            // then keep that record until the file reappears.
            stale = p->manifest_mtime != fs::file_time_type::min();
        } else {
            stale = now > p->manifest_mtime;
        }

        if (stale) {
            log::debug("manifest changed: %s", p->manifest_path.c_str());
            refreshed.push_back(load_manifest(p->manifest_path));
        } else {
            refreshed.push_back(p);
        }
    }
    return refreshed;
}

// ---------------------------------------------------------------------------
// prepare
// ---------------------------------------------------------------------------

Result<const ProjectState*> Session::prepare(const fs::path& start_dir) {
    auto root = locate_root(start_dir, layout_);
    if (root.is_err()) return std::move(root).error();
    const fs::path& root_dir = root.value();

    bool compound = is_compound_root(root_dir, layout_);
    std::string project_name;
    fs::path simple_manifest;
    std::optional<fs::file_time_type> marker_mtime;

    if (compound) {
        project_name = root_dir.filename().string();
        std::error_code ec;
        auto mt = fs::last_write_time(root_dir / layout_.compound_marker, ec);
        if (ec) {
            return StackupError{StackupError::IO,
                "cannot stat compound marker: " + ec.message(), "",
                (root_dir / layout_.compound_marker).string()};
        }
        marker_mtime = mt;
    } else {
        auto local = find_local_manifests(root_dir, layout_);
        if (local.is_err()) return std::move(local).error();
        if (local.value().size() != 1) {
            return StackupError{StackupError::NoManifestFound,
                "expected exactly one " + layout_.manifest_extension + " manifest, found " +
                    std::to_string(local.value().size()),
                "add a " + layout_.compound_marker + " file for multi-package projects",
                root_dir.string()};
        }
        simple_manifest = local.value().front();
        project_name = simple_manifest.stem().string();
    }

    bool different = !state_.has_value() || state_->root_dir != root_dir;
    bool full_reload = different ||
        (compound && (!state_->marker_mtime || *state_->marker_mtime < *marker_mtime));

    std::vector<PackagePtr> packages;
    if (full_reload) {
        log::debug("loading project %s", root_dir.c_str());
        auto loaded = load_all(root_dir, compound, simple_manifest);
        if (loaded.is_err()) return std::move(loaded).error();
        packages = std::move(loaded).value();
    } else {
        packages = refresh_stale(state_->packages);
    }

    if (packages.empty()) {
        return StackupError{StackupError::NoManifestFound,
            "no " + layout_.manifest_extension + " manifests below project root",
            "", root_dir.string()};
    }

    ProjectState next;
    next.root_dir = root_dir;
    next.project_name = std::move(project_name);
    next.packages = std::move(packages);
    next.is_compound = next.packages.size() > 1;
    next.marker_mtime = marker_mtime;

    if (different) {
        next.current = 0;
        last_target_.reset();
    } else {
        // Keep the active package across refreshes, tracked by manifest path
        const fs::path& active = state_->packages[state_->current]->manifest_path;
        for (size_t i = 0; i < next.packages.size(); ++i) {
            if (next.packages[i]->manifest_path == active) {
                next.current = i;
                break;
            }
        }
    }

    state_ = std::move(next);
    return Result<const ProjectState*>::ok(&*state_);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const ProjectState* Session::state() const {
    return state_ ? &*state_ : nullptr;
}

const PackageRecord* Session::current_package() const {
    return state_ ? state_->current_package() : nullptr;
}

Status Session::select_package(const std::string& name) {
    if (!state_) {
        return StackupError{StackupError::NoProjectFound,
            "no project loaded", "call prepare() first"};
    }
    for (size_t i = 0; i < state_->packages.size(); ++i) {
        if (state_->packages[i]->name == name) {
            if (i != state_->current) last_target_.reset();
            state_->current = i;
            return ok_status();
        }
    }
    return StackupError{StackupError::NotFound,
        "no package named '" + name + "' in project " + state_->project_name};
}

void Session::reset() {
    state_.reset();
    last_target_.reset();
}

const std::optional<std::string>& Session::last_target() const {
    return last_target_;
}

void Session::remember_target(std::string target) {
    last_target_ = std::move(target);
}

size_t Session::parse_count() const {
    return parse_count_;
}

const ProjectLayout& Session::layout() const {
    return layout_;
}

} // namespace stackup
