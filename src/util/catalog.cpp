#include <vermatch/catalog.hpp>
#include <vermatch/match.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace vermatch {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int line_of(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

static Result<CatalogSettings> parse_settings(const toml::table& tbl,
                                              const std::string& source) {
    CatalogSettings settings;

    if (auto lvl = tbl["level"]) {
        auto name = lvl.value<std::string>();
        if (!name) {
            return VermatchError{VermatchError::Config,
                "log.level must be a string", "", source, line_of(*lvl.node())};
        }
        auto parsed = log::parse_level(*name);
        if (parsed.is_err()) {
            return std::move(parsed.error().at(source, line_of(*lvl.node())));
        }
        settings.level = parsed.value();
    }

    if (auto color = tbl["color"]) {
        auto enabled = color.value<bool>();
        if (!enabled) {
            return VermatchError{VermatchError::Config,
                "log.color must be a boolean", "", source, line_of(*color.node())};
        }
        settings.color = *enabled;
    }

    return Result<CatalogSettings>::ok(settings);
}

static Result<PackageEntry> parse_package(const std::string& name,
                                          const toml::node& node,
                                          const std::string& source) {
    const auto* tbl = node.as_table();
    if (!tbl) {
        return VermatchError{VermatchError::Config,
            "package '" + name + "' must be a table", "", source, line_of(node)};
    }

    PackageEntry entry;
    entry.name = name;

    const auto* versions = (*tbl)["versions"].as_array();
    if (!versions) {
        return VermatchError{VermatchError::Config,
            "package '" + name + "' has no 'versions' array",
            "add versions = [\"1.0.0\", ...]", source, line_of(node)};
    }

    for (const auto& elem : *versions) {
        auto text = elem.value<std::string>();
        if (!text) {
            return VermatchError{VermatchError::Config,
                "versions of '" + name + "' must be strings", "",
                source, line_of(elem)};
        }
        auto v = Version::parse(*text);
        if (v.is_err()) {
            auto e = std::move(v).error();
            e.message = "package '" + name + "': " + e.message;
            return std::move(e.at(source, line_of(elem)));
        }
        entry.versions.push_back(std::move(v).value());
    }

    if (auto req = (*tbl)["require"]) {
        auto text = req.value<std::string>();
        if (!text) {
            return VermatchError{VermatchError::Config,
                "require of '" + name + "' must be a string", "",
                source, line_of(*req.node())};
        }
        auto pattern = VersionPattern::parse(*text);
        if (pattern.is_err()) {
            auto e = std::move(pattern).error();
            e.message = "package '" + name + "': " + e.message;
            return std::move(e.at(source, line_of(*req.node())));
        }
        entry.require = std::move(pattern).value();
    }

    return Result<PackageEntry>::ok(std::move(entry));
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

Result<Catalog> Catalog::parse(const std::string& toml_str,
                               const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return VermatchError{VermatchError::Config,
            std::string("catalog TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Catalog catalog;

    if (auto log_tbl = doc["log"].as_table()) {
        auto settings = parse_settings(*log_tbl, source);
        if (settings.is_err()) return std::move(settings).error();
        catalog.settings = settings.value();
    }

    if (auto pkgs = doc["packages"].as_table()) {
        for (const auto& [key, val] : *pkgs) {
            auto entry = parse_package(std::string(key.str()), val, source);
            if (entry.is_err()) return std::move(entry).error();
            catalog.packages.push_back(std::move(entry).value());
        }
    }

    std::sort(catalog.packages.begin(), catalog.packages.end(),
        [](const PackageEntry& a, const PackageEntry& b) { return a.name < b.name; });

    log::debug("catalog %s: %zu packages",
               source.empty() ? "<string>" : source.c_str(), catalog.packages.size());
    return Result<Catalog>::ok(std::move(catalog));
}

Result<Catalog> Catalog::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VermatchError{VermatchError::IO,
            "cannot open catalog file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Catalog::parse(ss.str(), path);
}

const PackageEntry* Catalog::find(const std::string& name) const {
    auto it = std::find_if(packages.begin(), packages.end(),
        [&](const PackageEntry& p) { return p.name == name; });
    return it != packages.end() ? &*it : nullptr;
}

Result<Version> Catalog::resolve(const std::string& name) const {
    const auto* entry = find(name);
    if (!entry) {
        return VermatchError{VermatchError::NotFound,
            "package '" + name + "' not found in catalog"};
    }

    auto latest = latest_compatible_version(entry->require, entry->versions);
    if (!latest) {
        return VermatchError{VermatchError::NotFound,
            "no version of '" + name + "' satisfies '" +
            entry->require.to_string() + "'",
            "available: " + std::to_string(entry->versions.size()) + " version(s)"};
    }

    log::debug("resolved %s %s -> %s", name.c_str(),
               entry->require.to_string().c_str(), latest->to_string().c_str());
    return Result<Version>::ok(*latest);
}

Result<std::map<std::string, Version>> Catalog::resolve_all() const {
    std::map<std::string, Version> resolved;
    for (const auto& entry : packages) {
        auto v = resolve(entry.name);
        if (v.is_err()) return std::move(v).error();
        resolved.emplace(entry.name, std::move(v).value());
    }
    return Result<std::map<std::string, Version>>::ok(std::move(resolved));
}

// ---------------------------------------------------------------------------
// CatalogSettings
// ---------------------------------------------------------------------------

void CatalogSettings::merge(const CatalogSettings& other) {
    if (other.level) level = other.level;
    if (other.color) color = other.color;
}

void CatalogSettings::apply() const {
    if (level) log::set_level(*level);
    if (color) log::set_color_enabled(*color);
}

} // namespace vermatch
