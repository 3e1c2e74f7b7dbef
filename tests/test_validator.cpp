#include <catch2/catch.hpp>
#include <reclint/validator.hpp>
#include <yaml-cpp/yaml.h>

using namespace reclint;

static Rule load_rule(const std::string& yaml) {
    auto r = Rule::from_yaml(YAML::Load(yaml));
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("registry ships the comment validators", "[validator]") {
    auto reg = ValidatorRegistry::with_builtins();
    REQUIRE(reg.find("require_japanese_comment") != nullptr);
    REQUIRE(reg.find("require_english_comment") != nullptr);
    REQUIRE(reg.find("require_java_doc") == nullptr);
    REQUIRE(reg.types() == std::vector<std::string>{"require_english_comment",
                                                    "require_japanese_comment"});
}

namespace {
struct FixedValidator : Validator {
    Result<std::vector<Finding>> validate(const std::filesystem::path&, const std::string&,
                                          const Rule&, const std::filesystem::path&) const override {
        return Result<std::vector<Finding>>::ok(std::vector<Finding>{{0, 0, "missing test"}});
    }
};
}

TEST_CASE("registry accepts external validators", "[validator]") {
    ValidatorRegistry reg;
    REQUIRE(reg.find("require_phpunit_test") == nullptr);
    reg.add("require_phpunit_test", std::make_shared<const FixedValidator>());
    REQUIRE(reg.find("require_phpunit_test") != nullptr);
}

TEST_CASE("japanese comments required", "[validator]") {
    Rule rule = load_rule(
        "type: require_japanese_comment\nlabel: jp\nmessage: write in Japanese\n"
        "comment: {lang: java}\n");
    const std::string src =
        "// 日本語のコメント\n"
        "int x; // english note\n"
        "/**\n"
        " * \n"
        " * 説明\n"
        " */\n"
        "String u = \"http://example.com\";\n";

    CommentLanguageValidator v;
    auto r = v.validate("A.java", src, rule, "/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].line == 2);
    REQUIRE(r.value()[0].col == 1);
    REQUIRE(r.value()[0].found == "english note");
}

TEST_CASE("english comments required", "[validator]") {
    Rule rule = load_rule(
        "type: require_english_comment\nlabel: en\nmessage: write in English\n"
        "comment: {lang: php}\n");
    const std::string src =
        "<?php\n"
        "# fine\n"
        "$a = 1; // カタカナ\n"
        "/* ok */ /* 漢字 */\n";

    CommentLanguageValidator v;
    auto r = v.validate("a.php", src, rule, "/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].line == 3);
    REQUIRE(r.value()[0].found == "カタカナ");
    REQUIRE(r.value()[1].line == 4);
    REQUIRE(r.value()[1].found == "漢字");
}

TEST_CASE("custom comment syntax", "[validator]") {
    Rule rule = load_rule(
        "type: require_english_comment\nlabel: en\nmessage: m\n"
        "comment:\n  custom:\n    lines: ['--']\n    blocks: [{start: '{-', end: '-}'}]\n");
    CommentLanguageValidator v;
    auto r = v.validate("a.hs", "x = 1 -- ひらがな\n{- ok -}\n", rule, "/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].line == 1);
}

TEST_CASE("validator rejects other rule kinds", "[validator]") {
    Rule rule = load_rule("type: forbidden_texts\nlabel: t\nmessage: m\nkeywords: [x]\n");
    CommentLanguageValidator v;
    auto r = v.validate("a", "x", rule, "/");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReclintError::InvalidArg);
}

TEST_CASE("truncate_comment counts characters", "[validator]") {
    REQUIRE(truncate_comment("short") == "short");
    REQUIRE(truncate_comment(std::string(40, 'a')) == std::string(40, 'a'));
    REQUIRE(truncate_comment(std::string(41, 'a')) == std::string(40, 'a') + "...");

    std::string jp;
    for (int i = 0; i < 45; ++i) jp += "あ";
    std::string expect;
    for (int i = 0; i < 40; ++i) expect += "あ";
    REQUIRE(truncate_comment(jp) == expect + "...");
}
