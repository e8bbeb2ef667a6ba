#include <vermatch/match.hpp>
#include <vermatch/log.hpp>

namespace vermatch {

bool is_compatible_with(const Version& concrete, const VersionPattern& pattern) {
    const auto& required = pattern.components();
    const auto& actual = concrete.components();

    // Positions past the end of the pattern are not visited (prefix match)
    for (size_t i = 0; i < required.size(); ++i) {
        if (required[i].is_wildcard()) continue;
        std::uint64_t have = i < actual.size() ? actual[i] : 0;
        if (have != required[i].number) return false;
    }
    return true;
}

std::optional<Version> latest_compatible_version(const VersionPattern& pattern,
                                                 const std::vector<Version>& candidates) {
    const Version* best = nullptr;
    for (const auto& candidate : candidates) {
        if (!is_compatible_with(candidate, pattern)) continue;
        if (!best || *best < candidate) {
            best = &candidate;
        }
    }

    if (!best) {
        log::debug("no version compatible with '%s' among %zu candidates",
                   pattern.to_string().c_str(), candidates.size());
        return std::nullopt;
    }
    log::trace("'%s' selects %s", pattern.to_string().c_str(),
               best->to_string().c_str());
    return *best;
}

static std::vector<Version> parse_candidates(const std::vector<std::string>& texts) {
    std::vector<Version> versions;
    versions.reserve(texts.size());
    for (const auto& text : texts) {
        auto v = Version::parse(text);
        if (v.is_err()) {
            log::debug("skipping candidate '%s': %s", text.c_str(),
                       v.error().message.c_str());
            continue;
        }
        versions.push_back(std::move(v).value());
    }
    return versions;
}

std::optional<Version> latest_compatible_version(const VersionPattern& pattern,
                                                 const std::vector<std::string>& candidates) {
    return latest_compatible_version(pattern, parse_candidates(candidates));
}

std::optional<Version> latest_version(const std::vector<Version>& candidates) {
    return latest_compatible_version(VersionPattern::any(), candidates);
}

std::optional<Version> latest_version(const std::vector<std::string>& candidates) {
    return latest_version(parse_candidates(candidates));
}

} // namespace vermatch
