#include <catch2/catch.hpp>
#include <reclint/check.hpp>
#include <yaml-cpp/yaml.h>
#include "temp_dir.hpp"

using namespace reclint;

TEST_CASE("split_lines handles CRLF and trailing newline", "[check]") {
    REQUIRE(split_lines("a\r\nb\nc") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split_lines("a\n") == std::vector<std::string>{"a"});
    REQUIRE(split_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
    REQUIRE(split_lines("").empty());
}

TEST_CASE("first keyword in declared order wins", "[check]") {
    TextRule rule{{"alpha", "beta"}};
    auto hits = check_text("beta alpha", rule);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].line == 1);
    REQUIRE(hits[0].col == 6);
    REQUIRE(hits[0].line_text == "beta alpha");
}

TEST_CASE("one hit per line, every line scanned", "[check]") {
    TextRule rule{{"TODO", "FIXME"}};
    auto hits = check_text("// TODO one TODO two\nclean\n  FIXME\n", rule);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].line == 1);
    REQUIRE(hits[0].col == 4);
    REQUIRE(hits[1].line == 3);
    REQUIRE(hits[1].col == 3);
}

TEST_CASE("columns are byte offsets", "[check]") {
    TextRule rule{{"TODO"}};
    auto hits = check_text("// あTODO", rule);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].col == 7);
}

TEST_CASE("regex check uses search and declared order", "[check]") {
    auto r = Rule::from_yaml(YAML::Load(
        "type: forbidden_patterns\nlabel: r\nmessage: m\nkeywords: ['unwrap\\(\\)', '\\bpanic!']\n"));
    REQUIRE(r.is_ok());
    const RegexRule& rule = *r.value().as<RegexRule>();

    auto hits = check_regex("panic!(); x.unwrap();\nok\nlet y = z.unwrap();", rule);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].line == 1);
    REQUIRE(hits[0].col == 13);
    REQUIRE(hits[1].line == 3);
    REQUIRE(hits[1].col == 11);
}

TEST_CASE("regex check on a very long line", "[check]") {
    auto r = Rule::from_yaml(YAML::Load(
        "type: forbidden_patterns\nlabel: r\nmessage: m\nkeywords: ['[a-z]+\\.log', 'a.*console']\n"));
    REQUIRE(r.is_ok());
    const RegexRule& rule = *r.value().as<RegexRule>();

    std::string minified(200000, 'a');
    REQUIRE(check_regex(minified, rule).empty());

    auto hits = check_regex("x\n" + minified + "console\n", rule);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].line == 2);
    REQUIRE(hits[0].col == 1);
}

TEST_CASE("command check: pass, fail with output, empty command", "[check]") {
    TempDir td;
    td.write_file("a.txt", "hello\n");
    auto file = td.path / "a.txt";

    auto pass = check_command(file, CommandRule{"grep -q hello {file}"});
    REQUIRE(pass.is_ok());
    REQUIRE_FALSE(pass.value().has_value());

    auto silent = check_command(file, CommandRule{"false"});
    REQUIRE(silent.is_ok());
    REQUIRE(silent.value().has_value());
    REQUIRE(silent.value()->empty());

    td.write_file("check.sh", "echo \"  bad: $1\"\necho warn >&2\nexit 1\n");
    auto detail = check_command(file, CommandRule{"sh " + (td.path / "check.sh").string() + " {file}"});
    REQUIRE(detail.is_ok());
    REQUIRE(detail.value().has_value());
    REQUIRE(*detail.value() == "bad: " + file.string() + "\nwarn");

    auto empty = check_command(file, CommandRule{"   "});
    REQUIRE(empty.is_ok());
    REQUIRE_FALSE(empty.value().has_value());
}

TEST_CASE("command check spawn failure is an error", "[check]") {
    auto r = check_command("/tmp/x", CommandRule{"reclint-missing-checker {file}"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReclintError::Process);
}

TEST_CASE("UTF-8 validation", "[check]") {
    REQUIRE(is_valid_utf8("plain ascii"));
    REQUIRE(is_valid_utf8("日本語のテキスト"));
    REQUIRE_FALSE(is_valid_utf8(std::string("\xff\xfe", 2)));
    REQUIRE_FALSE(is_valid_utf8(std::string("\xc0\xaf", 2)));
    REQUIRE_FALSE(is_valid_utf8(std::string("\xe3\x81", 2)));
}
