#include <vermatch/version.hpp>
#include <vermatch/match.hpp>
#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace vermatch {

// ---------------------------------------------------------------------------
// Parsing helpers
// ---------------------------------------------------------------------------

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return c >= '0' && c <= '9'; });
}

static Result<Component> parse_component(const std::string& piece, size_t index,
                                         const std::string& source) {
    if (piece == "*") {
        return Result<Component>::ok(Component::wildcard());
    }
    if (!all_digits(piece)) {
        return VermatchError::invalid_component(index, piece, source);
    }

    std::uint64_t n = 0;
    auto [end, ec] = std::from_chars(piece.data(), piece.data() + piece.size(), n);
    if (ec != std::errc() || end != piece.data() + piece.size()) {
        auto e = VermatchError::invalid_component(index, piece, source);
        e.hint = "component exceeds the 64-bit unsigned range";
        return e;
    }
    return Result<Component>::ok(Component::num(n));
}

// sep is '.' for the text form and '_' for the key form
static Result<std::vector<Component>> parse_components(const std::string& s,
                                                       char sep) {
    if (s.empty()) {
        return VermatchError{VermatchError::Empty, "empty version string",
            std::string("expected format: N[") + sep + "N]... where N is a number or '*'"};
    }

    std::vector<Component> parts;
    size_t pos = 0;
    while (true) {
        size_t dot = s.find(sep, pos);
        std::string piece = s.substr(pos, dot == std::string::npos
                                              ? std::string::npos : dot - pos);
        auto c = parse_component(piece, parts.size(), s);
        if (c.is_err()) return std::move(c).error();
        parts.push_back(c.value());

        if (dot == std::string::npos) break;
        pos = dot + 1;
    }

    return Result<std::vector<Component>>::ok(std::move(parts));
}

template<typename T, typename F>
static std::string join(const std::vector<T>& items, char sep, F render) {
    std::string s;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) s += sep;
        s += render(items[i]);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Component
// ---------------------------------------------------------------------------

std::string Component::to_string() const {
    return is_wildcard() ? "*" : std::to_string(number);
}

bool Component::operator==(const Component& o) const {
    if (kind != o.kind) return false;
    return is_wildcard() || number == o.number;
}

bool Component::operator!=(const Component& o) const { return !(*this == o); }

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Version::Version() : numbers_{0} {}

Version::Version(std::initializer_list<std::uint64_t> numbers)
    : Version(std::vector<std::uint64_t>(numbers)) {}

Version::Version(std::vector<std::uint64_t> numbers)
    : numbers_(std::move(numbers)) {
    if (numbers_.empty()) {
        throw std::invalid_argument("a version needs at least one component");
    }
}

static Result<Version> concrete_from(Result<std::vector<Component>> parts,
                                     const std::string& s) {
    if (parts.is_err()) return std::move(parts).error();

    std::vector<std::uint64_t> numbers;
    numbers.reserve(parts.value().size());
    for (const auto& c : parts.value()) {
        if (c.is_wildcard()) {
            auto e = VermatchError::invalid_component(numbers.size(), "*", s);
            e.hint = "wildcards are only allowed in version patterns";
            return e;
        }
        numbers.push_back(c.number);
    }
    return Result<Version>::ok(Version(std::move(numbers)));
}

Result<Version> Version::parse(const std::string& s) {
    return concrete_from(parse_components(s, '.'), s);
}

Result<Version> Version::from_key(const std::string& key) {
    return concrete_from(parse_components(key, '_'), key);
}

std::string Version::to_string() const {
    return join(numbers_, '.', [](std::uint64_t n) { return std::to_string(n); });
}

std::string Version::to_key() const {
    return join(numbers_, '_', [](std::uint64_t n) { return std::to_string(n); });
}

int Version::compare(const Version& o) const {
    size_t depth = std::max(numbers_.size(), o.numbers_.size());
    for (size_t i = 0; i < depth; ++i) {
        std::uint64_t a = i < numbers_.size() ? numbers_[i] : 0;
        std::uint64_t b = i < o.numbers_.size() ? o.numbers_[i] : 0;
        if (a != b) return a < b ? -1 : 1;
    }
    return 0;
}

bool Version::is_compatible_with(const VersionPattern& pattern) const {
    return vermatch::is_compatible_with(*this, pattern);
}

bool Version::operator==(const Version& o) const { return compare(o) == 0; }
bool Version::operator!=(const Version& o) const { return compare(o) != 0; }
bool Version::operator<(const Version& o) const { return compare(o) < 0; }
bool Version::operator<=(const Version& o) const { return compare(o) <= 0; }
bool Version::operator>(const Version& o) const { return compare(o) > 0; }
bool Version::operator>=(const Version& o) const { return compare(o) >= 0; }

// ---------------------------------------------------------------------------
// VersionPattern
// ---------------------------------------------------------------------------

VersionPattern::VersionPattern() : components_{Component::wildcard()} {}

VersionPattern::VersionPattern(std::vector<Component> components)
    : components_(std::move(components)) {
    if (components_.empty()) {
        throw std::invalid_argument("a version pattern needs at least one component");
    }
}

VersionPattern::VersionPattern(const Version& v) {
    components_.reserve(v.size());
    for (std::uint64_t n : v.components()) {
        components_.push_back(Component::num(n));
    }
}

Result<VersionPattern> VersionPattern::parse(const std::string& s) {
    return parse_components(s, '.').map([](const std::vector<Component>& parts) {
        return VersionPattern(parts);
    });
}

Result<VersionPattern> VersionPattern::from_key(const std::string& key) {
    return parse_components(key, '_').map([](const std::vector<Component>& parts) {
        return VersionPattern(parts);
    });
}

VersionPattern VersionPattern::any() {
    return VersionPattern();
}

bool VersionPattern::has_wildcards() const {
    return std::any_of(components_.begin(), components_.end(),
        [](const Component& c) { return c.is_wildcard(); });
}

bool VersionPattern::is_wildcard() const {
    return std::all_of(components_.begin(), components_.end(),
        [](const Component& c) { return c.is_wildcard(); });
}

std::optional<Version> VersionPattern::to_version() const {
    if (has_wildcards()) return std::nullopt;

    std::vector<std::uint64_t> numbers;
    numbers.reserve(components_.size());
    for (const auto& c : components_) {
        numbers.push_back(c.number);
    }
    return Version(std::move(numbers));
}

bool VersionPattern::matches(const Version& v) const {
    return vermatch::is_compatible_with(v, *this);
}

std::string VersionPattern::to_string() const {
    return join(components_, '.', [](const Component& c) { return c.to_string(); });
}

std::string VersionPattern::to_key() const {
    return join(components_, '_', [](const Component& c) { return c.to_string(); });
}

bool VersionPattern::operator==(const VersionPattern& o) const {
    return components_ == o.components_;
}

bool VersionPattern::operator!=(const VersionPattern& o) const {
    return !(*this == o);
}

} // namespace vermatch

// Trailing zeros are skipped so that equal versions (1.2 == 1.2.0) hash alike
size_t std::hash<vermatch::Version>::operator()(const vermatch::Version& v) const noexcept {
    const auto& numbers = v.components();
    size_t len = numbers.size();
    while (len > 1 && numbers[len - 1] == 0) --len;

    size_t seed = 0;
    for (size_t i = 0; i < len; ++i) {
        seed ^= std::hash<std::uint64_t>{}(numbers[i]) +
                static_cast<size_t>(0x9e3779b97f4a7c15ULL) +
                (seed << 6) + (seed >> 2);
    }
    return seed;
}
