#include <stackup/command.hpp>
#include <cctype>
#include <cstring>

namespace stackup {

static bool is_shell_safe(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           std::strchr("_@%+=:,./-", c) != nullptr;
}

std::string shell_quote(const std::string& token, QuoteMode mode) {
    if (token.empty()) return "''";

    if (mode == QuoteMode::Minimal) {
        bool safe = true;
        for (char c : token) {
            if (!is_shell_safe(c)) { safe = false; break; }
        }
        if (safe) return token;
    }

    std::string quoted = "'";
    for (char c : token) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> Command::argv() const {
    if (edited_text) {
        return {"/bin/sh", "-c", *edited_text};
    }
    std::vector<std::string> args;
    args.reserve(positional_args.size() + 2);
    args.push_back(tool_path);
    args.push_back(operation);
    args.insert(args.end(), positional_args.begin(), positional_args.end());
    return args;
}

std::string Command::text() const {
    if (edited_text) return *edited_text;

    std::string s = shell_quote(tool_path, quote);
    s += " ";
    s += shell_quote(operation, quote);
    for (const auto& arg : positional_args) {
        s += " ";
        s += shell_quote(arg, quote);
    }
    return s;
}

Command build_command(const std::string& tool_path,
                      const std::string& operation,
                      const std::vector<std::optional<std::string>>& args,
                      QuoteMode quote) {
    Command cmd;
    cmd.tool_path = tool_path;
    cmd.operation = operation;
    cmd.quote = quote;
    for (const auto& arg : args) {
        if (arg) cmd.positional_args.push_back(*arg);
    }
    cmd.channel_key = channel_key("");
    return cmd;
}

void bind_to_package(Command& cmd, const PackageRecord* pkg,
                     const std::filesystem::path& project_root) {
    if (pkg) {
        cmd.working_dir = pkg->directory;
        cmd.package_dir = pkg->directory;
        cmd.channel_key = channel_key(pkg->name);
    } else {
        cmd.working_dir = project_root;
        cmd.package_dir = project_root;
        cmd.channel_key = channel_key("");
    }
}

std::string channel_key(const std::string& package_name) {
    std::string stem = package_name.empty() ? FALLBACK_CHANNEL : package_name;

    std::string key;
    bool in_space = false;
    for (char c : stem) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) key += '-';
            in_space = true;
            continue;
        }
        in_space = false;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key + CHANNEL_SUFFIX;
}

bool is_engine_channel(const std::string& key) {
    size_t n = std::strlen(CHANNEL_SUFFIX);
    return key.size() > n && key.compare(key.size() - n, n, CHANNEL_SUFFIX) == 0;
}

Status apply_edit(Command& cmd, Prompter& prompter) {
    auto edited = prompter.edit_text("Command: ", cmd.text());
    if (edited.is_err()) return std::move(edited).error();
    if (edited.value().empty()) {
        return StackupError{StackupError::Cancelled, "empty command, nothing to run"};
    }
    cmd.edited_text = std::move(edited).value();
    return ok_status();
}

} // namespace stackup
