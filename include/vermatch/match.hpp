#pragma once

#include <vermatch/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace vermatch {

// Positional match of a concrete version against a requirement.
//
//   - '*' matches any component.
//   - A pattern shorter than the version matches as a prefix:
//     "1.2" accepts 1.2.0 and 1.2.3.
//   - A pattern longer than the version sees the version zero-extended:
//     1.2 matches "1.2.0" and "1.2.*" but not "1.2.1".
bool is_compatible_with(const Version& concrete, const VersionPattern& pattern);

// Greatest candidate compatible with pattern, or nullopt when none is.
// Of several equal maxima the earliest in the list is returned.
std::optional<Version> latest_compatible_version(const VersionPattern& pattern,
                                                 const std::vector<Version>& candidates);

// Same over unparsed candidates. Text that is not a concrete version
// (wildcards, syntax errors) is skipped.
std::optional<Version> latest_compatible_version(const VersionPattern& pattern,
                                                 const std::vector<std::string>& candidates);

// Greatest candidate with no requirement applied
std::optional<Version> latest_version(const std::vector<Version>& candidates);
std::optional<Version> latest_version(const std::vector<std::string>& candidates);

} // namespace vermatch
