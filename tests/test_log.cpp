#include <catch2/catch.hpp>
#include <strand/log.hpp>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace strand::log;

// Helper: capture stderr output from a callable
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

TEST_CASE("level_name() and level_from_string() agree", "[log]") {
    REQUIRE(std::string(level_name(Warn)) == "warn");
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = level_from_string(level_name(lvl));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == lvl);
    }
}

TEST_CASE("level_from_string() rejects unknown names", "[log]") {
    auto r = level_from_string("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == strand::StrandError::Config);
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

TEST_CASE("Messages at threshold are emitted with format args", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("no tag matches '%s' (%d tags)", "v${version}", 3);
    });
    REQUIRE(output == "warn: no tag matches 'v${version}' (3 tags)\n");

    set_level(Info);
}

TEST_CASE("Sink receives formatted messages instead of stderr", "[log]") {
    set_level(Debug);
    std::vector<std::pair<Level, std::string>> seen;
    set_sink([&](Level lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });

    auto output = capture_stderr([] {
        debug("cloning %s", "file:///repo");
        trace("dropped");
    });

    set_sink(nullptr);
    set_level(Info);

    REQUIRE(output.empty());
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].first == Debug);
    REQUIRE(seen[0].second == "cloning file:///repo");
}
