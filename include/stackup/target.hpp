#pragma once

#include <stackup/result.hpp>
#include <stackup/manifest.hpp>
#include <stackup/prompter.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stackup {

// Package name first, then its targets. With a fragment only targets that
// contain it survive; the bare package name is always kept.
std::vector<std::string> target_candidates(const PackageRecord& pkg,
                                           const std::optional<std::string>& fragment);

// auto_mode picks the whole package without asking. Otherwise the prompter
// chooses among the candidates and must return one of them.
Result<std::string> resolve_target(const PackageRecord& pkg,
                                   const std::optional<std::string>& fragment,
                                   bool auto_mode,
                                   Prompter& prompter);

} // namespace stackup
