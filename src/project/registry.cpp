#include <stackup/registry.hpp>
#include <stackup/process.hpp>
#include <stackup/version.hpp>
#include <stackup/log.hpp>
#include <cctype>
#include <sstream>

namespace stackup {

std::optional<InstalledPackage> parse_package_token(const std::string& token) {
    std::string t = token;
    while (!t.empty() && (t.front() == '(' || t.front() == '{')) t.erase(0, 1);
    while (!t.empty() && (t.back() == ')' || t.back() == '}')) t.pop_back();

    size_t dash = t.rfind('-');
    if (dash == std::string::npos || dash == 0) return std::nullopt;

    InstalledPackage pkg;
    pkg.name = t.substr(0, dash);
    pkg.version = t.substr(dash + 1);
    if (!is_version_string(pkg.version)) return std::nullopt;

    // Package names are alphanumeric words joined by single hyphens
    if (pkg.name.back() == '-') return std::nullopt;
    for (char c : pkg.name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return std::nullopt;
    }
    return pkg;
}

std::map<std::string, std::vector<std::string>> parse_package_listing(const std::string& text) {
    std::map<std::string, std::vector<std::string>> grouped;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        auto pkg = parse_package_token(token);
        if (!pkg) continue;
        grouped[pkg->name].push_back(pkg->version);
    }
    return grouped;
}

std::string hackage_location(const std::string& name, const std::string& version) {
    std::string url = "https://hackage.haskell.org/package/" + name;
    if (!version.empty()) url += "-" + version;
    return url;
}

// ---------------------------------------------------------------------------
// PackageRegistry
// ---------------------------------------------------------------------------

PackageRegistry::PackageRegistry(std::vector<std::string> query_args)
    : query_([args = std::move(query_args)]() -> Result<std::string> {
          auto r = run_command(args);
          if (r.is_err()) return std::move(r).error();
          if (r.value().exit_code != 0) {
              std::string cmd = args.empty() ? "" : args[0];
              return StackupError{StackupError::IO,
                  "installed-package query '" + cmd + "' exited with code " +
                      std::to_string(r.value().exit_code),
                  r.value().stderr_str};
          }
          return Result<std::string>::ok(std::move(r.value().stdout_str));
      }) {}

PackageRegistry::PackageRegistry(QueryFn query)
    : query_(std::move(query)) {}

Status PackageRegistry::refresh() {
    ++query_count_;
    auto listing = query_();
    if (listing.is_err()) return std::move(listing).error();

    installed_ = parse_package_listing(listing.value());
    loaded_ = true;
    log::debug("installed packages: %zu", installed_.size());
    return ok_status();
}

Status PackageRegistry::ensure_loaded() {
    if (loaded_) return ok_status();
    return refresh();
}

Result<std::set<std::string>> PackageRegistry::installed_packages() {
    STACKUP_TRY(ensure_loaded());
    std::set<std::string> names;
    for (const auto& entry : installed_) names.insert(entry.first);
    return Result<std::set<std::string>>::ok(std::move(names));
}

Result<std::vector<std::string>> PackageRegistry::versions(const std::string& name) {
    STACKUP_TRY(ensure_loaded());
    auto it = installed_.find(name);
    if (it == installed_.end()) {
        return StackupError{StackupError::NotFound,
            "package '" + name + "' is not installed"};
    }
    return Result<std::vector<std::string>>::ok(it->second);
}

Result<std::string> PackageRegistry::newest_version(const std::string& name) {
    auto vs = versions(name);
    if (vs.is_err()) return std::move(vs).error();
    return latest_version(vs.value());
}

Result<std::string> PackageRegistry::choose_version(const std::string& name,
                                                    bool auto_newest,
                                                    Prompter& prompter) {
    auto vs = versions(name);
    if (vs.is_err()) return std::move(vs).error();
    if (auto_newest || vs.value().size() == 1) return latest_version(vs.value());

    auto choice = prompter.select("Version of " + name + ": ", vs.value(), true);
    if (choice.is_err()) return std::move(choice).error();
    for (const auto& v : vs.value()) {
        if (v == choice.value()) return choice;
    }
    return StackupError{StackupError::InvalidArg,
        "'" + choice.value() + "' is not an installed version of " + name};
}

} // namespace stackup
