// demo_match.cpp
//
// Small command-line front end over the matching library:
//
//     ./demo_match '1.*' 1.0.0 1.2.0 2.0.0     # prints 1.2.0
//     ./demo_match '3' 1.0.0 2.0.0             # no match -> NotFound error
//     ./demo_match --catalog deps.toml         # resolve every package in a catalog
//
// Errors are printed with VermatchError::format(); pass -v for debug logs.

#include <vermatch/catalog.hpp>
#include <vermatch/log.hpp>
#include <vermatch/match.hpp>
#include <vermatch/result.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace vermatch;

static const char* kUsage =
    "usage: demo_match [-v] <pattern> <candidate>...\n"
    "       demo_match [-v] --catalog <file.toml>";

// Pick the latest candidate matching the pattern given on the command line.
static Result<Version> match_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        return VermatchError{VermatchError::InvalidArg, "no pattern specified", kUsage};
    }

    auto pattern = VersionPattern::parse(args[0]);
    if (pattern.is_err()) return std::move(pattern).error();

    std::vector<std::string> candidates(args.begin() + 1, args.end());
    auto latest = latest_compatible_version(pattern.value(), candidates);
    if (!latest) {
        return VermatchError{VermatchError::NotFound,
            "no candidate is compatible with '" + pattern.value().to_string() + "'",
            "candidates that are not concrete versions are ignored"};
    }
    return Result<Version>::ok(*latest);
}

// -v overrides the catalog's [log] level
static Status run_catalog(const std::string& path, bool verbose) {
    auto catalog = Catalog::load(path);
    if (catalog.is_err()) return std::move(catalog).error();

    CatalogSettings settings = catalog.value().settings;
    CatalogSettings cli;
    if (verbose) cli.level = log::Debug;
    settings.merge(cli);
    settings.apply();

    auto resolved = catalog.value().resolve_all();
    if (resolved.is_err()) return std::move(resolved).error();

    for (const auto& [name, version] : resolved.value()) {
        std::cout << name << " = " << version.to_string() << "\n";
    }
    return ok_status();
}

int main(int argc, char** argv) {
    std::vector<std::string> args;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    if (!args.empty() && args[0] == "--catalog") {
        if (args.size() != 2) {
            log::error("%s", kUsage);
            return 2;
        }
        auto status = run_catalog(args[1], verbose);
        if (status.is_err()) {
            std::cerr << status.error().format() << "\n";
            return 1;
        }
        return 0;
    }

    if (verbose) log::set_level(log::Debug);
    auto result = match_args(args);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }

    std::cout << result.value().to_string() << "\n";
    return 0;
}
