#include <stackup/frontend.hpp>
#include <stackup/log.hpp>
#include <stackup/target.hpp>

namespace stackup {

namespace fs = std::filesystem;

Frontend::Frontend(Config config, Prompter& prompter, Opener& opener)
    : config_(std::move(config)),
      prompter_(prompter),
      opener_(opener),
      session_(config_.layout),
      registry_(config_.tool.package_query),
      runner_(config_.log_dir) {
    runner_.on_finish([this](const ProcessOutcome& outcome) { on_finished(outcome); });
}

Result<const ProjectState*> Frontend::prepare(const fs::path& start_dir) {
    return session_.prepare(start_dir);
}

Result<std::string> Frontend::ensure_tool() {
    if (tool_path_) return Result<std::string>::ok(*tool_path_);
    auto located = locate_tool(config_.tool.path);
    if (located.is_err()) return std::move(located).error();
    tool_path_ = located.value();
    log::debug("build tool: %s", tool_path_->c_str());
    return located;
}

Result<Command> Frontend::make_command(const std::string& operation,
                                       const std::optional<std::string>& fragment,
                                       const std::vector<std::string>& flags) {
    const Operation* op = find_operation(operation);
    if (!op) {
        return StackupError{StackupError::InvalidArg,
            "unknown operation '" + operation + "'"};
    }
    STACKUP_TRY(validate_flags(*op, flags));

    auto tool = ensure_tool();
    if (tool.is_err()) return std::move(tool).error();

    const ProjectState* state = session_.state();
    if (op->scope != OperationScope::Global && !state) {
        return StackupError{StackupError::NoProjectFound,
            "no project loaded for '" + operation + "'", "call prepare() first"};
    }

    std::vector<std::optional<std::string>> args;
    const PackageRecord* pkg = nullptr;

    if (op->scope == OperationScope::Package) {
        pkg = state->current_package();
        if (!pkg) {
            return StackupError{StackupError::NoManifestFound,
                "project has no packages", "", state->root_dir.string()};
        }
        auto target = resolve_target(*pkg, fragment, config_.behavior.auto_target, prompter_);
        if (target.is_err()) return std::move(target).error();
        session_.remember_target(target.value());
        args.emplace_back(std::move(target).value());
    }
    for (const auto& f : flags) args.emplace_back(f);

    Command cmd = build_command(tool.value(), op->name, args, config_.behavior.quote);
    if (state) {
        bind_to_package(cmd, pkg, state->root_dir);
    } else {
        std::error_code ec;
        bind_to_package(cmd, nullptr, fs::current_path(ec));
    }

    if (config_.behavior.edit_before_run) {
        STACKUP_TRY(apply_edit(cmd, prompter_));
    }

    return Result<Command>::ok(std::move(cmd));
}

Status Frontend::run(const std::string& operation,
                     const std::optional<std::string>& fragment,
                     const std::vector<std::string>& flags) {
    auto cmd = make_command(operation, fragment, flags);
    if (cmd.is_err()) return std::move(cmd).error();
    return runner_.run(cmd.value());
}

Status Frontend::open_package_page(const std::string& name) {
    auto version = registry_.choose_version(name, config_.behavior.auto_newest_version,
                                            prompter_);
    if (version.is_err()) return std::move(version).error();
    return opener_.open(hackage_location(name, version.value()));
}

Status Frontend::open_homepage(const std::optional<std::string>& package_name) {
    const ProjectState* state = session_.state();
    if (!state) {
        return StackupError{StackupError::NoProjectFound,
            "no project loaded", "call prepare() first"};
    }

    const PackageRecord* pkg = package_name ? state->find_package(*package_name)
                                            : state->current_package();
    if (!pkg) {
        return StackupError{StackupError::NotFound,
            "no package named '" + package_name.value_or("") + "' in project " +
                state->project_name};
    }

    const std::string& page = pkg->homepage.empty() ? pkg->location : pkg->homepage;
    if (page.empty()) {
        return StackupError{StackupError::NotFound,
            "package '" + pkg->name + "' declares no homepage or repository location",
            "", pkg->manifest_path.string()};
    }
    return opener_.open(page);
}

void Frontend::on_finished(const ProcessOutcome& outcome) {
    if (outcome.exit_code != 0) {
        log::warn("%s exited with code %d", outcome.command.operation.c_str(),
                  outcome.exit_code);
    }

    ArtifactOptions options;
    options.open_coverage = config_.behavior.auto_open_coverage;
    options.open_haddock = config_.behavior.auto_open_haddock;

    auto opened = handle_finished(outcome, options, opener_);
    if (opened.is_err()) {
        log::error("%s", opened.error().format().c_str());
    }
}

Result<Config> discover_config(const fs::path& start_dir) {
    auto global = Config::effective("");
    if (global.is_err()) return std::move(global).error();

    auto root = locate_root(start_dir, global.value().layout);
    if (root.is_err()) {
        // Global-only config still drives operations that need no project
        if (root.error().code == StackupError::NoProjectFound) return global;
        return std::move(root).error();
    }
    return Config::effective(root.value());
}

} // namespace stackup
