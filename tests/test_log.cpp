#include <catch2/catch.hpp>
#include <reclint/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace reclint::log;

// Run `fn` with stderr redirected into a pipe and return what it wrote.
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(fileno(stderr));
    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("level names round-trip through parse_level", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        Level parsed = Info;
        REQUIRE(parse_level(level_name(lvl), parsed));
        REQUIRE(parsed == lvl);
    }
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    Level lvl = Warn;
    REQUIRE_FALSE(parse_level("verbose", lvl));
    REQUIRE_FALSE(parse_level("INFO", lvl));
    REQUIRE(lvl == Warn);
}

TEST_CASE("set_level and set_color_enabled stick", "[log]") {
    set_level(Debug);
    REQUIRE(get_level() == Debug);
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
    set_level(Info);
}

TEST_CASE("messages below the threshold are dropped", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto out = capture_stderr([] {
        debug("resolved %d rule(s)", 3);
        info("checked %d file(s)", 10);
    });
    REQUIRE(out.empty());
    set_level(Info);
}

TEST_CASE("messages carry a level prefix and formatted body", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    auto out = capture_stderr([] {
        warn("%s: %s", "src/a.rs", "file is not valid UTF-8 text");
    });
    REQUIRE(out == "warn: src/a.rs: file is not valid UTF-8 text\n");
}

TEST_CASE("concurrent messages are written whole", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    auto out = capture_stderr([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 20; ++i) info("worker %d message %d", t, i);
            });
        }
        for (auto& th : threads) th.join();
    });

    size_t lines = 0;
    size_t pos = 0;
    while ((pos = out.find('\n', pos)) != std::string::npos) {
        ++lines;
        ++pos;
    }
    REQUIRE(lines == 80);
    REQUIRE(out.find("info: info:") == std::string::npos);
}
