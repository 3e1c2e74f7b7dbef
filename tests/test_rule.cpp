#include <catch2/catch.hpp>
#include <reclint/rule.hpp>
#include <yaml-cpp/yaml.h>

using namespace reclint;
namespace fs = std::filesystem;

static Result<Rule> rule_from(const std::string& yaml) {
    return Rule::from_yaml(YAML::Load(yaml));
}

static void require_config_error(const std::string& yaml, const std::string& fragment) {
    auto r = rule_from(yaml);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ReclintError::Config);
    INFO(r.error().message);
    REQUIRE(r.error().message.find(fragment) != std::string::npos);
}

// ===== Text / regex / command =====

TEST_CASE("text rule with filters", "[rule]") {
    auto r = rule_from(R"(
type: forbidden_texts
label: no-todo
message: TODO is forbidden
keywords: [TODO, FIXME]
include_exts: [.rs]
exclude_exts: [.gen.rs]
exclude_files:
  - filter: path_contains
    keyword: /vendor/
)");
    REQUIRE(r.is_ok());
    const Rule& rule = r.value();
    REQUIRE(rule.label() == "no-todo");
    REQUIRE(rule.type_name() == "forbidden_texts");
    REQUIRE(rule.category() == Category::Forbidden);
    REQUIRE(rule.as<TextRule>() != nullptr);
    REQUIRE(*rule.keywords() == std::vector<std::string>{"TODO", "FIXME"});

    REQUIRE(rule.applies_to(fs::path("/p/src/lib.rs")));
    REQUIRE_FALSE(rule.applies_to(fs::path("/p/src/lib.gen.rs")));
    REQUIRE_FALSE(rule.applies_to(fs::path("/p/vendor/lib.rs")));
    REQUIRE_FALSE(rule.applies_to(fs::path("/p/src/lib.kt")));
}

TEST_CASE("text rule invariants", "[rule]") {
    require_config_error("type: forbidden_texts\nlabel: t\nmessage: m\n",
                         "Rule 't': type 'forbidden_texts' requires 'keywords'");
    require_config_error("type: forbidden_texts\nlabel: t\nmessage: m\nkeywords: [a]\nexec: x\n",
                         "must not have 'exec'");
}

TEST_CASE("regex rule compiles patterns", "[rule]") {
    auto r = rule_from("type: forbidden_patterns\nlabel: r\nmessage: m\nkeywords: ['unwrap\\(\\)', 'print(ln)?!']\n");
    REQUIRE(r.is_ok());
    const auto* re = r.value().as<RegexRule>();
    REQUIRE(re != nullptr);
    REQUIRE(re->patterns.size() == 2);
    REQUIRE(r.value().category() == Category::Forbidden);

    require_config_error("type: forbidden_patterns\nlabel: r\nmessage: m\nkeywords: ['(unclosed']\n",
                         "invalid regex '(unclosed'");
}

TEST_CASE("custom rule invariants", "[rule]") {
    auto r = rule_from("type: custom\nlabel: c\nmessage: m\nexec: ./check.sh {file}\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().as<CommandRule>()->exec == "./check.sh {file}");
    REQUIRE(r.value().category() == Category::Required);
    REQUIRE(r.value().keywords() == nullptr);

    require_config_error("type: custom\nlabel: c\nmessage: m\n", "type 'custom' requires 'exec'");
    require_config_error("type: custom\nlabel: c\nmessage: m\nexec: x\nkeywords: [a]\n",
                         "must not have 'keywords'");
}

// ===== Matcher conversion =====

TEST_CASE("match block converts to a matcher", "[rule]") {
    auto r = rule_from(R"(
type: forbidden_texts
label: m
message: m
keywords: [x]
match:
  - pattern: path_not_contains
    keywords: [/test/, /generated/]
    cond: or
  - pattern: file_ends_with
    keywords: [.kt]
)");
    REQUIRE(r.is_ok());
    const auto& items = r.value().matcher().items();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].pattern == MatchPattern::PathNotContains);
    REQUIRE(items[0].cond == MatchCond::Or);
    REQUIRE(items[1].cond == MatchCond::And);
    REQUIRE(r.value().applies_to(fs::path("/p/test/A.kt")));
    REQUIRE_FALSE(r.value().applies_to(fs::path("/p/test/generated/A.kt")));
}

TEST_CASE("bad match and exclude entries", "[rule]") {
    require_config_error("type: forbidden_texts\nlabel: m\nmessage: m\nkeywords: [x]\n"
                         "match: [{pattern: path_is, keywords: [a]}]\n",
                         "unknown match pattern 'path_is'");
    require_config_error("type: forbidden_texts\nlabel: m\nmessage: m\nkeywords: [x]\n"
                         "match: [{pattern: path_contains, cond: nand}]\n",
                         "unknown match cond 'nand'");
    require_config_error("type: forbidden_texts\nlabel: m\nmessage: m\nkeywords: [x]\n"
                         "exclude_files: [{filter: glob, keyword: a}]\n",
                         "unknown exclude filter 'glob'");
}

// ===== Type discriminator =====

TEST_CASE("missing or unknown type", "[rule]") {
    require_config_error("label: x\nmessage: m\n", "Rule 'x': missing 'type'");
    require_config_error("type: forbidden_words\nlabel: x\nmessage: m\n",
                         "Rule 'x': unknown type 'forbidden_words'");

    auto no_label = rule_from("type: custom\nmessage: m\nexec: x\n");
    REQUIRE(no_label.is_err());
    REQUIRE(no_label.error().message == "rule entry is missing 'label'");
}

// ===== Doc rules =====

TEST_CASE("doc rule elements and visibility", "[rule]") {
    auto r = rule_from(R"(
type: require_kotlin_doc
label: kdoc
message: document public API
kotlin_doc:
  class: public
  function: all
)");
    REQUIRE(r.is_ok());
    const auto* doc = r.value().as<DocRule>();
    REQUIRE(doc != nullptr);
    REQUIRE(doc->lang == DocLang::Kotlin);
    REQUIRE(doc->elements.at("class") == Visibility::Public);
    REQUIRE(doc->elements.at("function") == Visibility::All);
    REQUIRE(r.value().category() == Category::Required);
}

TEST_CASE("doc rule invariants", "[rule]") {
    require_config_error("type: require_java_doc\nlabel: d\nmessage: m\n",
                         "requires 'java_doc' config");
    require_config_error("type: require_rust_doc\nlabel: d\nmessage: m\nrust_doc: {}\n",
                         "requires at least one element");
    require_config_error("type: require_php_doc\nlabel: d\nmessage: m\nphp_doc: {method: public}\n",
                         "unknown 'php_doc' element 'method'");
    require_config_error("type: require_java_doc\nlabel: d\nmessage: m\njava_doc: {class: private}\n",
                         "'java_doc.class' must be 'public' or 'all'");
}

// ===== Comment rules =====

TEST_CASE("comment rule with built-in language", "[rule]") {
    auto r = rule_from("type: require_japanese_comment\nlabel: jp\nmessage: m\ncomment: {lang: rust}\n");
    REQUIRE(r.is_ok());
    const auto* c = r.value().as<CommentRule>();
    REQUIRE(c->required == CommentLanguage::Japanese);
    REQUIRE(c->lang == "rust");
    REQUIRE(c->syntax.lines == std::vector<std::string>{"//"});
}

TEST_CASE("comment rule with custom syntax", "[rule]") {
    auto r = rule_from(R"(
type: require_english_comment
label: en
message: m
comment:
  custom:
    lines: ["#"]
    blocks:
      - start: '"""'
        end: '"""'
)");
    REQUIRE(r.is_ok());
    const auto* c = r.value().as<CommentRule>();
    REQUIRE(c->required == CommentLanguage::English);
    REQUIRE(c->lang.empty());
    REQUIRE(c->syntax.blocks.size() == 1);
    REQUIRE(c->syntax.blocks[0].start == "\"\"\"");
}

TEST_CASE("comment rule invariants", "[rule]") {
    require_config_error("type: require_japanese_comment\nlabel: c\nmessage: m\n",
                         "comment config is required");
    require_config_error("type: require_japanese_comment\nlabel: c\nmessage: m\n"
                         "comment: {lang: java, custom: {lines: ['//']}}\n",
                         "cannot specify both 'lang' and 'custom'");
    require_config_error("type: require_japanese_comment\nlabel: c\nmessage: m\ncomment: {}\n",
                         "either 'lang' or 'custom' is required");
    require_config_error("type: require_japanese_comment\nlabel: c\nmessage: m\ncomment: {lang: go}\n",
                         "unknown comment language 'go'");
    require_config_error("type: require_japanese_comment\nlabel: c\nmessage: m\n"
                         "comment: {custom: {lines: []}}\n",
                         "at least one line or block marker");
}

// ===== Test rules =====

TEST_CASE("test name rules need no extra config", "[rule]") {
    auto r = rule_from("type: require_japanese_kotest_test_name\nlabel: t\nmessage: m\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().as<TestNameRule>()->framework == TestFramework::Kotest);
}

TEST_CASE("test existence rule config", "[rule]") {
    auto r = rule_from(R"(
type: require_phpunit_test
label: t
message: m
test:
  test_directory: tests
  require: all_public
)");
    REQUIRE(r.is_ok());
    const auto* t = r.value().as<TestExistenceRule>();
    REQUIRE(t->test_directory == "tests");
    REQUIRE(t->require == TestRequire::AllPublic);
    REQUIRE(t->test_file_suffix == "Test");

    auto rust = rule_from("type: require_rust_unit_test\nlabel: t\nmessage: m\n");
    REQUIRE(rust.is_ok());
    REQUIRE(rust.value().as<TestExistenceRule>()->require == TestRequire::Exists);

    require_config_error("type: require_kotest_test\nlabel: t\nmessage: m\n",
                         "requires 'test.test_directory'");
    require_config_error("type: require_phpunit_test\nlabel: t\nmessage: m\n"
                         "test: {test_directory: tests, require: some}\n",
                         "'test.require' must be 'exists' or 'all_public'");
}

TEST_CASE("every listed type name is recognised", "[rule]") {
    REQUIRE(rule_type_names().size() == 15);
    for (const auto& type : rule_type_names()) {
        auto r = rule_from("type: " + type + "\nlabel: l\nmessage: m\n");
        if (r.is_err()) {
            INFO(type);
            REQUIRE(r.error().message.find("unknown type") == std::string::npos);
        }
    }
}

// ===== Items =====

TEST_CASE("review item with matcher", "[rule]") {
    auto item = Item::from_yaml(YAML::Load(R"(
message: check error handling
match:
  - pattern: path_contains
    keywords: [/api/]
)"));
    REQUIRE(item.is_ok());
    REQUIRE(item.value().message == "check error handling");
    REQUIRE(item.value().applies_to(fs::path("/p/api/x.kt")));
    REQUIRE_FALSE(item.value().applies_to(fs::path("/p/ui/x.kt")));

    auto bad = Item::from_yaml(YAML::Load("match: []\n"));
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == ReclintError::Config);
}
