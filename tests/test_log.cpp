#include <catch2/catch.hpp>
#include <feedstore/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <unistd.h>

using namespace feedstore::log;

// Capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
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
    ssize_t n;
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

TEST_CASE("parse_level is the inverse of level_name", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == lvl);
    }
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("feed cache %s failed", "insert");
        error("rollback failed");
    });
    REQUIRE(output.find("warn: feed cache insert failed") != std::string::npos);
    REQUIRE(output.find("error: rollback failed") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Color output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        info("colored");
    });
    REQUIRE(output.find("\033[32minfo\033[0m: colored") != std::string::npos);

    set_color_enabled(false);
}
