#include <stackup/operation.hpp>
#include <algorithm>

namespace stackup {

const std::vector<Operation>& operations() {
    static const std::vector<std::string> build_flags = {
        "--dry-run", "--pedantic", "--fast", "--only-snapshot", "--only-dependencies",
        "--only-configure", "--trace", "--profile", "--no-strip", "--coverage",
        "--no-run-tests", "--no-run-benchmarks", "--file-watch", "--copy-bins",
        "--haddock", "--no-haddock-deps", "--open", "--force-dirty",
        "--ghc-options=", "--flag=", "--test-arguments=", "--benchmark-arguments="};

    static const std::vector<Operation> ops = {
        {"build",   OperationScope::Package, build_flags},
        {"test",    OperationScope::Package, build_flags},
        {"bench",   OperationScope::Package, build_flags},
        {"install", OperationScope::Package, build_flags},
        {"haddock", OperationScope::Package,
            {"--open", "--no-haddock-deps", "--haddock-arguments=", "--fast"}},
        {"clean",   OperationScope::Package, {"--full"}},
        {"sdist",   OperationScope::Package, {"--ignore-check", "--pvp-bounds=", "--tar-dir="}},
        {"upload",  OperationScope::Package, {"--ignore-check", "--no-signature", "--pvp-bounds="}},
        {"exec",    OperationScope::Package, {"--package=", "--"}},
        {"dot",     OperationScope::Project, {"--external", "--no-include-base", "--depth="}},
        {"path",    OperationScope::Project,
            {"--project-root", "--local-install-root", "--dist-dir", "--local-doc-root",
             "--local-hpc-root", "--compiler-exe"}},
        {"update",  OperationScope::Global, {}},
        {"upgrade", OperationScope::Global, {"--binary-only", "--source-only", "--git"}},
        {"setup",   OperationScope::Global, {"--reinstall", "--upgrade-cabal"}},
    };
    return ops;
}

const Operation* find_operation(const std::string& name) {
    for (const auto& op : operations()) {
        if (op.name == name) return &op;
    }
    return nullptr;
}

static bool accepts(const Operation& op, const std::string& flag) {
    size_t eq = flag.find('=');
    std::string key = eq == std::string::npos ? flag : flag.substr(0, eq + 1);
    return std::find(op.flags.begin(), op.flags.end(), key) != op.flags.end();
}

Status validate_flags(const Operation& op, const std::vector<std::string>& flags) {
    for (const auto& flag : flags) {
        // Everything after "--" belongs to the program being run
        if (flag == "--" && accepts(op, flag)) break;
        if (!accepts(op, flag)) {
            return StackupError{StackupError::InvalidArg,
                "'" + op.name + "' does not accept " + flag};
        }
    }
    return ok_status();
}

} // namespace stackup
