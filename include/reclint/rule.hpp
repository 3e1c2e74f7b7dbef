#pragma once

#include <reclint/result.hpp>
#include <reclint/matcher.hpp>
#include <reclint/filter.hpp>
#include <reclint/lang/comment.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }
namespace re2 { class RE2; }

namespace reclint {

// Closed, normalized set of categories. Required and Forbidden hold enforced
// rules; Review and Guideline hold advisory items.
enum class Category { Required, Forbidden, Review, Guideline };

const char* category_name(Category c);

enum class Visibility { Public, All };

const char* visibility_name(Visibility v);

// ---------------------------------------------------------------------------
// Rule variants
// ---------------------------------------------------------------------------

struct TextRule {
    std::vector<std::string> keywords;
};

struct RegexRule {
    std::vector<std::string> keywords;
    std::vector<std::shared_ptr<const re2::RE2>> patterns;   // parallel to keywords
};

struct CommandRule {
    std::string exec;   // "{file}" is replaced by the target path
};

enum class DocLang { Java, Kotlin, Php, Rust };

struct DocRule {
    DocLang lang = DocLang::Java;
    std::map<std::string, Visibility> elements;   // e.g. "class" -> Public
};

// Language a comment-language rule insists on.
enum class CommentLanguage { Japanese, English };

struct CommentRule {
    CommentLanguage required = CommentLanguage::Japanese;
    std::string lang;      // built-in syntax name, empty for a custom syntax
    CommentSyntax syntax;
};

enum class TestFramework { PhpUnit, Kotest, RustUnit };

struct TestNameRule {
    TestFramework framework = TestFramework::PhpUnit;
};

enum class TestRequire { Exists, AllPublic };

struct TestExistenceRule {
    TestFramework framework = TestFramework::PhpUnit;
    std::string test_directory;
    TestRequire require = TestRequire::Exists;
    std::string test_file_suffix = "Test";
};

// Fields shared by every rule kind.
struct RuleCommon {
    std::string type;
    std::string label;
    std::string message;
    Matcher matcher;
    ExtFilter ext_filter;
    ExcludeFilter exclude_filter;
};

// An immutable, fully validated rule. Construction is only possible through
// from_yaml(), which rejects any entry whose fields do not fit its type.
class Rule {
public:
    using Body = std::variant<TextRule, RegexRule, CommandRule, DocRule,
                              CommentRule, TestNameRule, TestExistenceRule>;

    static Result<Rule> from_yaml(const YAML::Node& node);

    const std::string& type_name() const { return common_.type; }
    const std::string& label() const { return common_.label; }
    const std::string& message() const { return common_.message; }
    const Matcher& matcher() const { return common_.matcher; }
    const ExtFilter& ext_filter() const { return common_.ext_filter; }
    const ExcludeFilter& exclude_filter() const { return common_.exclude_filter; }
    Category category() const;

    // Keyword list for text and regex rules, nullptr otherwise.
    const std::vector<std::string>* keywords() const;

    // Matcher, extension and exclude filters all accept `file`.
    bool applies_to(const std::filesystem::path& file) const;

    const Body& body() const { return body_; }

    template<typename T>
    const T* as() const { return std::get_if<T>(&body_); }

private:
    Rule(RuleCommon common, Body body)
        : common_(std::move(common)), body_(std::move(body)) {}

    RuleCommon common_;
    Body body_;
};

// Review/guideline entry: a message scoped by a matcher, with no check.
struct Item {
    std::string message;
    Matcher matcher;
    ExtFilter ext_filter;

    static Result<Item> from_yaml(const YAML::Node& node);

    bool applies_to(const std::filesystem::path& file) const;
};

// Every `type` value accepted in a rule entry, in documentation order.
const std::vector<std::string>& rule_type_names();

} // namespace reclint
