#pragma once

#include <stackup/result.hpp>
#include <stackup/command.hpp>
#include <stackup/config.hpp>
#include <stackup/operation.hpp>
#include <stackup/output_scanner.hpp>
#include <stackup/process.hpp>
#include <stackup/prompter.hpp>
#include <stackup/registry.hpp>
#include <stackup/session.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

// The engine as a UI layer sees it: one project session, the installed
// package cache and a process runner, driven through the injected prompter
// and opener.
class Frontend {
public:
    Frontend(Config config, Prompter& prompter, Opener& opener);

    Result<const ProjectState*> prepare(const std::filesystem::path& start_dir);

    // Assemble the command for an operation. Package-scoped operations act on
    // the session's current package and resolve a target (fragment narrows
    // the choice); project ones run at the root; global ones need no project.
    Result<Command> make_command(const std::string& operation,
                                 const std::optional<std::string>& fragment,
                                 const std::vector<std::string>& flags);

    // make_command, then launch it in the background
    Status run(const std::string& operation,
               const std::optional<std::string>& fragment,
               const std::vector<std::string>& flags);

    // Open the Hackage page of an installed package at a chosen version
    Status open_package_page(const std::string& name);

    // Open a project package's homepage, or its source repository when it
    // declares no homepage. Without a name the current package is used.
    Status open_homepage(const std::optional<std::string>& package_name);

    Session& session() { return session_; }
    PackageRegistry& registry() { return registry_; }
    ProcessRunner& runner() { return runner_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Prompter& prompter_;
    Opener& opener_;
    Session session_;
    PackageRegistry registry_;
    ProcessRunner runner_;
    std::optional<std::string> tool_path_;

    // Locate the build tool once, before the first command is issued
    Result<std::string> ensure_tool();
    void on_finished(const ProcessOutcome& outcome);
};

// Effective config for a start directory: the global layer decides how a
// project root looks, and the root (if any) contributes its own layer.
Result<Config> discover_config(const std::filesystem::path& start_dir);

} // namespace stackup
