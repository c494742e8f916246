#include <stackup/version.hpp>
#include <cctype>
#include <stdexcept>

namespace stackup {

bool is_version_string(const std::string& s) {
    if (s.empty()) return false;
    bool need_digit = true;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            need_digit = false;
        } else if (c == '.' && !need_digit) {
            need_digit = true;
        } else {
            return false;
        }
    }
    return !need_digit;
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return StackupError{StackupError::Version, "empty version string"};
    }
    if (!is_version_string(s)) {
        return StackupError{StackupError::Version,
            "invalid version '" + s + "'",
            "expected dotted numeric components, e.g. 1.2.0.3"};
    }

    Version v;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t dot = s.find('.', pos);
        std::string part = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        try {
            v.components.push_back(std::stoi(part));
        } catch (const std::out_of_range&) {
            return StackupError{StackupError::Version,
                "version component out of range in '" + s + "'"};
        }
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(components[i]);
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return components == o.components;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    // std::vector's lexicographic compare is exactly numeric-segment ordering
    return components < o.components;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

Result<std::string> latest_version(const std::vector<std::string>& versions) {
    if (versions.empty()) {
        return StackupError{StackupError::NotFound, "no versions to choose from"};
    }

    const std::string* best = nullptr;
    Version best_version;
    bool best_valid = false;

    for (const auto& candidate : versions) {
        auto parsed = Version::parse(candidate);
        if (parsed.is_err()) {
            if (!best) best = &candidate;
            continue;
        }
        if (!best_valid || parsed.value() > best_version) {
            best = &candidate;
            best_version = std::move(parsed).value();
            best_valid = true;
        }
    }

    return Result<std::string>::ok(*best);
}

} // namespace stackup
