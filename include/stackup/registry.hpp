#pragma once

#include <stackup/result.hpp>
#include <stackup/prompter.hpp>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stackup {

// A "<name>-<version>" token from the installed-package listing
struct InstalledPackage {
    std::string name;
    std::string version;
};

// Split a listing token. Parentheses and braces that mark hidden or broken
// packages are stripped. nullopt if the token is not name-version shaped.
std::optional<InstalledPackage> parse_package_token(const std::string& token);

// Group every token of a listing by package name, keeping all versions
std::map<std::string, std::vector<std::string>> parse_package_listing(const std::string& text);

// Hackage page for a package, optionally pinned to a version
std::string hackage_location(const std::string& name, const std::string& version = "");

// Cache of globally installed packages. Filled by the first query and kept
// until refresh() is called explicitly.
class PackageRegistry {
public:
    using QueryFn = std::function<Result<std::string>()>;

    // Runs query_args as an external command; its stdout is the listing
    explicit PackageRegistry(std::vector<std::string> query_args);
    explicit PackageRegistry(QueryFn query);

    Result<std::set<std::string>> installed_packages();
    Result<std::vector<std::string>> versions(const std::string& name);

    // Newest installed version of name
    Result<std::string> newest_version(const std::string& name);

    // Newest version when auto_newest, otherwise ask the prompter
    Result<std::string> choose_version(const std::string& name, bool auto_newest,
                                       Prompter& prompter);

    // Re-run the query and replace the cache wholesale
    Status refresh();

    bool is_loaded() const { return loaded_; }
    size_t query_count() const { return query_count_; }

private:
    QueryFn query_;
    std::map<std::string, std::vector<std::string>> installed_;
    bool loaded_ = false;
    size_t query_count_ = 0;

    Status ensure_loaded();
};

} // namespace stackup
