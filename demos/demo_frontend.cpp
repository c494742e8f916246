// demo_frontend.cpp
//
// Console front-end over the stackup engine. Run it from inside a Haskell
// project:
//
//     ./demo_frontend                          # list packages and targets
//     ./demo_frontend build                    # pick a target, run stack build
//     ./demo_frontend test spec --coverage     # targets containing "spec"
//     ./demo_frontend --docs text              # open Hackage page for "text"
//     ./demo_frontend --homepage [pkg]         # open a project package's homepage
//
// Choices and command edits are read from stdin.

#include <stackup/frontend.hpp>
#include <stackup/log.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stackup;

class ConsolePrompter : public Prompter {
public:
    Result<std::string> select(const std::string& prompt,
                               const std::vector<std::string>& options,
                               bool require_match) override {
        for (size_t i = 0; i < options.size(); ++i) {
            std::cout << "  [" << (i + 1) << "] " << options[i] << "\n";
        }
        std::cout << prompt << std::flush;

        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return StackupError{StackupError::Cancelled, "no answer"};
        }
        // A number picks by position
        if (!answer.empty() &&
            answer.find_first_not_of("0123456789") == std::string::npos &&
            answer.size() < 6) {
            size_t idx = std::stoul(answer);
            if (idx >= 1 && idx <= options.size()) {
                return Result<std::string>::ok(options[idx - 1]);
            }
        }
        if (require_match) {
            for (const auto& o : options) {
                if (o == answer) return Result<std::string>::ok(answer);
            }
            return StackupError{StackupError::InvalidArg, "no such choice: " + answer};
        }
        return Result<std::string>::ok(answer);
    }

    Result<std::string> edit_text(const std::string& prompt,
                                  const std::string& initial) override {
        std::cout << prompt << initial << "\n(new command, empty keeps it)> " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return StackupError{StackupError::Cancelled, "no answer"};
        }
        return Result<std::string>::ok(answer.empty() ? initial : answer);
    }
};

class XdgOpener : public Opener {
public:
    Status open(const std::string& location) override {
        auto r = run_command({"xdg-open", location}, "", 10);
        if (r.is_err()) return std::move(r).error();
        if (r.value().exit_code != 0) {
            return StackupError{StackupError::IO, "xdg-open failed", "", location};
        }
        return ok_status();
    }
};

static void print_project(const ProjectState& state) {
    std::cout << state.project_name << " (" << state.root_dir.string() << ")"
              << (state.is_compound ? " [compound]" : "") << "\n";
    for (size_t i = 0; i < state.packages.size(); ++i) {
        const auto& p = *state.packages[i];
        std::cout << (i == state.current ? "* " : "  ")
                  << (p.name.empty() ? "<unnamed>" : p.name) << " "
                  << p.version << "\n";
        for (const auto& t : p.targets) std::cout << "      " << t << "\n";
    }
}

static int fail(const StackupError& err) {
    std::cerr << err.format() << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        std::cerr << "error: cannot determine working directory\n";
        return 1;
    }

    auto config = discover_config(cwd);
    if (config.is_err()) return fail(config.error());
    auto logging = config.value().apply_logging();
    if (logging.is_err()) return fail(logging.error());

    ConsolePrompter prompter;
    XdgOpener opener;
    Frontend frontend(std::move(config).value(), prompter, opener);

    if (args.size() == 2 && args[0] == "--docs") {
        auto s = frontend.open_package_page(args[1]);
        if (s.is_err()) return fail(s.error());
        return 0;
    }

    if (!args.empty() && args[0] == "--homepage" && args.size() <= 2) {
        auto state = frontend.prepare(cwd);
        if (state.is_err()) return fail(state.error());
        std::optional<std::string> name;
        if (args.size() == 2) name = args[1];
        auto s = frontend.open_homepage(name);
        if (s.is_err()) return fail(s.error());
        return 0;
    }

    const Operation* op = args.empty() ? nullptr : find_operation(args[0]);
    if (!op || op->scope != OperationScope::Global) {
        auto state = frontend.prepare(cwd);
        if (state.is_err()) return fail(state.error());
        if (args.empty()) {
            print_project(*state.value());
            return 0;
        }
    }

    // First bare word narrows the target choice, the rest are switches
    std::optional<std::string> fragment;
    std::vector<std::string> flags;
    for (size_t i = 1; i < args.size(); ++i) {
        if (!fragment && flags.empty() && args[i].rfind("-", 0) != 0) {
            fragment = args[i];
        } else {
            flags.push_back(args[i]);
        }
    }

    auto s = frontend.run(args[0], fragment, flags);
    if (s.is_err()) return fail(s.error());
    frontend.runner().wait_all();
    return 0;
}
