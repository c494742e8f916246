#pragma once

#include <stackup/result.hpp>
#include <stackup/command.hpp>
#include <stackup/project.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

// [tool]
struct ToolConfig {
    std::string path;                         // build tool, bare name or path
    std::vector<std::string> package_query;   // installed-package listing command
};

// [behavior]
struct BehaviorConfig {
    bool auto_target = false;
    bool edit_before_run = false;
    bool auto_open_coverage = false;
    bool auto_open_haddock = false;
    bool auto_newest_version = false;
    QuoteMode quote = QuoteMode::Minimal;
};

// Layered configuration: defaults, then ~/.stackup/config.toml, then the
// project's .stackup.toml. A later layer overrides only what it sets.
struct Config {
    ToolConfig tool;
    BehaviorConfig behavior;
    ProjectLayout layout;
    std::string log_level;   // [log] level
    std::string log_dir;     // [log] dir, output channel files

    // Track which fields a parsed layer set explicitly (for merge)
    bool auto_target_set = false;
    bool edit_before_run_set = false;
    bool auto_open_coverage_set = false;
    bool auto_open_haddock_set = false;
    bool auto_newest_version_set = false;
    bool quote_set = false;
    bool markers_set = false;
    bool compound_marker_set = false;
    bool manifest_extension_set = false;

    // Built-in values every merge starts from
    static Config defaults();

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // defaults -> global -> project; absent files are skipped
    static Result<Config> effective(const std::filesystem::path& project_root);

    // Apply [log] level to the logger
    Status apply_logging() const;
};

// ~/.stackup/config.toml, empty if HOME is unset
std::string global_config_path();

// <root>/.stackup.toml
std::filesystem::path project_config_path(const std::filesystem::path& project_root);

} // namespace stackup
