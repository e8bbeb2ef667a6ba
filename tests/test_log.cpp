#include <catch2/catch.hpp>
#include <vermatch/log.hpp>
#include <vermatch/match.hpp>
#include <cstdio>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace vermatch;
using namespace vermatch::log;

// Run fn with stderr redirected into a pipe and return what it wrote
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    long n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level() accepts level names", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("warn").value() == Warn);

    auto bad = parse_level("verbose");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == VermatchError::Config);
    REQUIRE(bad.error().message.find("verbose") != std::string::npos);
    REQUIRE(parse_level("WARN").is_err());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Every level function emits at Trace", "[log]") {
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t%d", 1);
        debug("d%d", 2);
        info("i%d", 3);
        warn("w%d", 4);
        error("e%d", 5);
    });
    REQUIRE(output == "trace: t1\ndebug: d2\ninfo: i3\nwarn: w4\nerror: e5\n");

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("value: %d, name: %s", 42, "test"); });
    REQUIRE(output == "info: value: 42, name: test\n");
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] { info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("Selection logs skipped candidates at debug level", "[log]") {
    set_level(Debug);
    set_color_enabled(false);

    std::vector<std::string> candidates = {"1.0", "1.x"};
    auto output = capture_stderr([&] {
        (void)latest_compatible_version(VersionPattern::any(), candidates);
    });
    REQUIRE(output.find("debug: skipping candidate '1.x'") != std::string::npos);

    set_level(Info);
    output = capture_stderr([&] {
        (void)latest_compatible_version(VersionPattern::any(), candidates);
    });
    REQUIRE(output.empty());
}
