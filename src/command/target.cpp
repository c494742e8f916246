#include <stackup/target.hpp>
#include <algorithm>

namespace stackup {

std::vector<std::string> target_candidates(const PackageRecord& pkg,
                                           const std::optional<std::string>& fragment) {
    std::vector<std::string> candidates;
    candidates.push_back(pkg.name);
    for (const auto& t : pkg.targets) {
        if (fragment && t.find(*fragment) == std::string::npos) continue;
        candidates.push_back(t);
    }
    return candidates;
}

Result<std::string> resolve_target(const PackageRecord& pkg,
                                   const std::optional<std::string>& fragment,
                                   bool auto_mode,
                                   Prompter& prompter) {
    if (auto_mode) return Result<std::string>::ok(pkg.name);

    auto candidates = target_candidates(pkg, fragment);
    auto choice = prompter.select("Target: ", candidates, true);
    if (choice.is_err()) return std::move(choice).error();

    if (std::find(candidates.begin(), candidates.end(), choice.value()) == candidates.end()) {
        return StackupError{StackupError::InvalidArg,
            "'" + choice.value() + "' is not a target of " + pkg.name};
    }
    return choice;
}

} // namespace stackup
