#pragma once

#include <stackup/result.hpp>
#include <string>
#include <vector>

namespace stackup {

// Haskell package version: any number of dotted numeric components,
// e.g. "4.14.0.0". Ordering compares component by component numerically,
// a strict prefix sorts first ("1.2" < "1.2.0").
struct Version {
    std::vector<int> components;

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// True if s is one or more dot-separated runs of digits
bool is_version_string(const std::string& s);

// Highest version in the list by numeric ordering. Strings that are not
// valid versions lose against any valid one. Errors on an empty list.
Result<std::string> latest_version(const std::vector<std::string>& versions);

} // namespace stackup
