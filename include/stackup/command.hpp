#pragma once

#include <stackup/result.hpp>
#include <stackup/prompter.hpp>
#include <stackup/manifest.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

enum class QuoteMode {
    Minimal,   // quote only tokens holding shell metacharacters
    Always     // wrap every token in single quotes
};

// Appended to every output channel this engine creates
constexpr const char* CHANNEL_SUFFIX = ".stackup.log";
// Channel stem used when no package is in scope
constexpr const char* FALLBACK_CHANNEL = "project";

struct Command {
    std::string tool_path;
    std::string operation;
    std::vector<std::string> positional_args;
    std::filesystem::path working_dir;
    std::filesystem::path package_dir;     // base for relative artifact paths
    std::string channel_key;
    QuoteMode quote = QuoteMode::Minimal;
    // Set when the user rewrote the command text before running it
    std::optional<std::string> edited_text;

    // [tool, operation, args...], or a shell invocation of the edited text
    std::vector<std::string> argv() const;

    // Shell-quoted tokens joined by single spaces (or the edited text)
    std::string text() const;
};

// POSIX shell quoting of a single token
std::string shell_quote(const std::string& token, QuoteMode mode = QuoteMode::Minimal);

// Absent arguments are dropped; order is [tool, operation, args...]
Command build_command(const std::string& tool_path,
                      const std::string& operation,
                      const std::vector<std::optional<std::string>>& args,
                      QuoteMode quote = QuoteMode::Minimal);

// Point a command at a package (or the project root when pkg is null):
// sets working directory, artifact base and output channel.
void bind_to_package(Command& cmd, const PackageRecord* pkg,
                     const std::filesystem::path& project_root);

// Lowercased package name, whitespace runs as '-', plus CHANNEL_SUFFIX
std::string channel_key(const std::string& package_name);

bool is_engine_channel(const std::string& key);

// Hand the assembled text to the prompter; whatever comes back is what runs
Status apply_edit(Command& cmd, Prompter& prompter);

} // namespace stackup
