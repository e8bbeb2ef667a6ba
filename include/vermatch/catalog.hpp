#pragma once

#include <vermatch/result.hpp>
#include <vermatch/version.hpp>
#include <vermatch/log.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vermatch {

// [log] section
struct CatalogSettings {
    std::optional<log::Level> level;
    std::optional<bool> color;

    // Explicitly-set fields of other override this (command line over file)
    void merge(const CatalogSettings& other);

    // Push the explicitly-set fields into the global logger
    void apply() const;
};

// [packages.<name>] section
struct PackageEntry {
    std::string name;
    std::vector<Version> versions;   // available releases
    VersionPattern require;          // defaults to "*"
};

// A set of packages, each with its released versions and a requirement:
//
//   [packages.zlib]
//   versions = ["1.2.11", "1.2.13", "1.3.0"]
//   require = "1.2.*"
struct Catalog {
    CatalogSettings settings;
    std::vector<PackageEntry> packages;  // sorted by name

    // Parse from TOML string; source names the document in error locations
    static Result<Catalog> parse(const std::string& toml_str,
                                 const std::string& source = "");

    // Parse from file path
    static Result<Catalog> load(const std::string& path);

    const PackageEntry* find(const std::string& name) const;

    // Latest available version satisfying the package's requirement
    Result<Version> resolve(const std::string& name) const;

    Result<std::map<std::string, Version>> resolve_all() const;
};

} // namespace vermatch
