#include <catch2/catch.hpp>
#include <reclint/process.hpp>

using namespace reclint;

TEST_CASE("run_command captures stdout and exit code", "[process]") {
    auto r = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE_FALSE(r.value().success());
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command success", "[process]") {
    auto r = run_command({"true"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success());
    REQUIRE(r.value().stdout_str.empty());
}

TEST_CASE("run_command with a large output does not deadlock", "[process]") {
    auto r = run_command({"sh", "-c", "yes line | head -n 50000; yes err | head -n 50000 >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.size() == 50000 * 5);
    REQUIRE(r.value().stderr_str.size() == 50000 * 4);
}

TEST_CASE("run_command in a working directory", "[process]") {
    auto r = run_command({"pwd"}, "/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "/\n");
}

TEST_CASE("missing program is a Process error", "[process]") {
    auto r = run_command({"reclint-no-such-program-xyz"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReclintError::Process);
    REQUIRE(r.error().message.find("reclint-no-such-program-xyz") != std::string::npos);
}

TEST_CASE("empty argument list is rejected", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReclintError::InvalidArg);
}

TEST_CASE("expand_command substitutes and splits", "[process]") {
    REQUIRE(expand_command("check.sh --file {file} {file}", "/p/a.rs") ==
            std::vector<std::string>{"check.sh", "--file", "/p/a.rs", "/p/a.rs"});
    REQUIRE(expand_command("  lint   -q  ", "x") == std::vector<std::string>{"lint", "-q"});
    REQUIRE(expand_command("   ", "x").empty());
    REQUIRE(expand_command("", "x").empty());
}
