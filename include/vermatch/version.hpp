#pragma once

#include <vermatch/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace vermatch {

class VersionPattern;

// One '.'-separated element: a number or the wildcard '*'
struct Component {
    enum Kind { Number, Wildcard };

    Kind kind = Number;
    std::uint64_t number = 0;  // meaningful only for Number

    static Component num(std::uint64_t n) { return Component{Number, n}; }
    static Component wildcard() { return Component{Wildcard, 0}; }

    bool is_number() const { return kind == Number; }
    bool is_wildcard() const { return kind == Wildcard; }

    std::string to_string() const;

    bool operator==(const Component& o) const;
    bool operator!=(const Component& o) const;
};

// Concrete version: "1", "1.2.3", "10.0.0.4". Never holds a wildcard.
// Comparison pads the shorter side with zeros, so 1.2 == 1.2.0.
class Version {
public:
    Version();  // "0"
    Version(std::initializer_list<std::uint64_t> numbers);
    // Throws std::invalid_argument when numbers is empty
    explicit Version(std::vector<std::uint64_t> numbers);

    static Result<Version> parse(const std::string& s);
    // Inverse of to_key(): "1_2_3"
    static Result<Version> from_key(const std::string& key);

    const std::vector<std::uint64_t>& components() const { return numbers_; }
    size_t size() const { return numbers_.size(); }

    std::string to_string() const;  // "1.2.3"
    std::string to_key() const;      // "1_2_3"

    // <0, 0, >0 like strcmp
    int compare(const Version& o) const;

    bool is_compatible_with(const VersionPattern& pattern) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    std::vector<std::uint64_t> numbers_;
};

// Version requirement: "1.*", "2.3", "*", "1.2.0".
// Only usable for matching; has no ordering.
class VersionPattern {
public:
    VersionPattern();  // "*"
    // Throws std::invalid_argument when components is empty
    explicit VersionPattern(std::vector<Component> components);
    // Exact-match requirement for v
    explicit VersionPattern(const Version& v);

    static Result<VersionPattern> parse(const std::string& s);
    static Result<VersionPattern> from_key(const std::string& key);
    static VersionPattern any();

    const std::vector<Component>& components() const { return components_; }
    size_t size() const { return components_.size(); }

    bool has_wildcards() const;
    bool is_concrete() const { return !has_wildcards(); }
    // Every component is '*'
    bool is_wildcard() const;

    // The equivalent Version when no component is a wildcard
    std::optional<Version> to_version() const;

    bool matches(const Version& v) const;

    std::string to_string() const;
    std::string to_key() const;

    // Structural: same components in the same order
    bool operator==(const VersionPattern& o) const;
    bool operator!=(const VersionPattern& o) const;

private:
    std::vector<Component> components_;
};

} // namespace vermatch

namespace std {

template<>
struct hash<vermatch::Version> {
    size_t operator()(const vermatch::Version& v) const noexcept;
};

} // namespace std
