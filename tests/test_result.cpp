#include <catch2/catch.hpp>
#include <vermatch/result.hpp>
#include <vermatch/version.hpp>
#include <string>

using namespace vermatch;

static Result<Version> bump_major(const std::string& text) {
    auto v = Version::parse(text);
    VERMATCH_TRY(v);
    return Result<Version>::ok(Version{v.value().components()[0] + 1});
}

static Status check_all(const std::vector<std::string>& texts) {
    for (const auto& t : texts) {
        VERMATCH_TRY(Version::parse(t));
    }
    return ok_status();
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(VermatchError{VermatchError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == VermatchError::NotFound);
    REQUIRE(r.error().message == "missing item");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Version::parse("2.0").value_or(Version{}) == Version{2});
    REQUIRE(Version::parse("oops").value_or(Version{9}) == Version{9});
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto size = [](const Version& v) { return v.size(); };
    auto ok = Version::parse("1.2.3").map(size);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 3);

    auto err = Version::parse("").map(size);
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == VermatchError::Empty);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    bool called = false;
    auto chained = VersionPattern::parse("1.*").and_then([&](const VersionPattern& p) {
        called = true;
        return Result<std::string>::ok(p.to_key());
    });
    REQUIRE(called);
    REQUIRE(chained.value() == "1_*");

    called = false;
    auto failed = VersionPattern::parse("1..").and_then([&](const VersionPattern& p) {
        called = true;
        return Result<std::string>::ok(p.to_key());
    });
    REQUIRE_FALSE(called);
    REQUIRE(failed.error().code == VermatchError::InvalidComponent);
}

TEST_CASE("VERMATCH_TRY propagates errors", "[result]") {
    auto r = bump_major("1.a");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VermatchError::InvalidComponent);
    REQUIRE(r.error().text == "a");

    auto s = check_all({"1.0", "", "2.0"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VermatchError::Empty);
}

TEST_CASE("VERMATCH_TRY passes through Ok", "[result]") {
    REQUIRE(bump_major("1.4").value() == Version{2});
    REQUIRE(check_all({"1.0", "2.0.1"}).is_ok());
}

TEST_CASE("VermatchError format() output", "[error]") {
    VermatchError e{VermatchError::Config, "bad entry", "check the file", "deps.toml", 7};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]: bad entry") != std::string::npos);
    REQUIRE(formatted.find("hint: check the file") != std::string::npos);
    REQUIRE(formatted.find("--> deps.toml:7") != std::string::npos);
}

TEST_CASE("VermatchError format() without hint or file", "[error]") {
    VermatchError e{VermatchError::Empty, "empty version string"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Empty]: empty version string");
}

TEST_CASE("VermatchError at() keeps the first location", "[error]") {
    VermatchError e{VermatchError::IO, "fail"};
    e.at("a.toml", 3).at("b.toml", 9);
    REQUIRE(e.file == "a.toml");
    REQUIRE(e.line == 3);
}

TEST_CASE("VermatchError code_name() for all codes", "[error]") {
    REQUIRE(std::string(VermatchError::code_name(VermatchError::Empty)) == "Empty");
    REQUIRE(std::string(VermatchError::code_name(VermatchError::InvalidComponent)) == "InvalidComponent");
    REQUIRE(std::string(VermatchError::code_name(VermatchError::IO)) == "IO");
    REQUIRE(std::string(VermatchError::code_name(VermatchError::Config)) == "Config");
    REQUIRE(std::string(VermatchError::code_name(VermatchError::NotFound)) == "NotFound");
    REQUIRE(std::string(VermatchError::code_name(VermatchError::InvalidArg)) == "InvalidArg");
}
