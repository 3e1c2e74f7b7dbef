#include <reclint/rule.hpp>
#include <re2/re2.h>
#include <yaml-cpp/yaml.h>
#include <optional>

namespace reclint {

namespace fs = std::filesystem;

using StringList = std::optional<std::vector<std::string>>;

const char* category_name(Category c) {
    switch (c) {
        case Category::Required:  return "required";
        case Category::Forbidden: return "forbidden";
        case Category::Review:    return "review";
        case Category::Guideline: return "guideline";
    }
    return "unknown";
}

const char* visibility_name(Visibility v) {
    return v == Visibility::Public ? "public" : "all";
}

const std::vector<std::string>& rule_type_names() {
    static const std::vector<std::string> names = {
        "forbidden_texts",
        "forbidden_patterns",
        "custom",
        "require_java_doc",
        "require_kotlin_doc",
        "require_php_doc",
        "require_rust_doc",
        "require_japanese_comment",
        "require_english_comment",
        "require_japanese_phpunit_test_name",
        "require_japanese_kotest_test_name",
        "require_japanese_rust_test_name",
        "require_phpunit_test",
        "require_kotest_test",
        "require_rust_unit_test",
    };
    return names;
}

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

static ReclintError rule_error(const std::string& label, const std::string& msg) {
    return ReclintError{ReclintError::Config, "Rule '" + label + "': " + msg};
}

static Result<std::string> optional_string(const YAML::Node& node, const char* key,
                                           const std::string& label) {
    YAML::Node v = node[key];
    if (!v || v.IsNull()) return Result<std::string>::ok("");
    if (!v.IsScalar()) return rule_error(label, std::string("'") + key + "' must be a string");
    return Result<std::string>::ok(v.as<std::string>());
}

static Result<StringList> optional_list(const YAML::Node& node, const char* key,
                                        const std::string& label) {
    YAML::Node v = node[key];
    if (!v || v.IsNull()) return Result<StringList>::ok(std::nullopt);
    if (!v.IsSequence()) {
        return rule_error(label, std::string("'") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.IsScalar()) {
            return rule_error(label, std::string("'") + key + "' must be a list of strings");
        }
        out.push_back(item.as<std::string>());
    }
    return Result<StringList>::ok(std::move(out));
}

static Result<Matcher> parse_matcher(const YAML::Node& node, const std::string& label) {
    YAML::Node list = node["match"];
    if (!list || list.IsNull()) return Result<Matcher>::ok(Matcher{});
    if (!list.IsSequence()) return rule_error(label, "'match' must be a list");

    std::vector<MatchItem> items;
    for (const auto& entry : list) {
        if (!entry.IsMap()) return rule_error(label, "each 'match' entry must be a mapping");

        auto pattern_name = optional_string(entry, "pattern", label);
        if (pattern_name.is_err()) return std::move(pattern_name).error();
        if (pattern_name.value().empty()) return rule_error(label, "match entry requires 'pattern'");

        auto pattern = parse_match_pattern(pattern_name.value());
        if (pattern.is_err()) return rule_error(label, pattern.error().message);

        MatchItem item;
        item.pattern = pattern.value();

        auto keywords = optional_list(entry, "keywords", label);
        if (keywords.is_err()) return std::move(keywords).error();
        if (keywords.value()) item.keywords = std::move(*keywords.value());

        auto cond_name = optional_string(entry, "cond", label);
        if (cond_name.is_err()) return std::move(cond_name).error();
        if (!cond_name.value().empty()) {
            auto cond = parse_match_cond(cond_name.value());
            if (cond.is_err()) return rule_error(label, cond.error().message);
            item.cond = cond.value();
        }
        items.push_back(std::move(item));
    }
    return Result<Matcher>::ok(Matcher(std::move(items)));
}

static Result<ExtFilter> parse_ext_filter(const YAML::Node& node, const std::string& label) {
    auto include = optional_list(node, "include_exts", label);
    if (include.is_err()) return std::move(include).error();
    auto exclude = optional_list(node, "exclude_exts", label);
    if (exclude.is_err()) return std::move(exclude).error();
    return Result<ExtFilter>::ok(ExtFilter(
        include.value().value_or(std::vector<std::string>{}),
        exclude.value().value_or(std::vector<std::string>{})));
}

static Result<ExcludeFilter> parse_exclude_filter(const YAML::Node& node,
                                                  const std::string& label) {
    YAML::Node list = node["exclude_files"];
    if (!list || list.IsNull()) return Result<ExcludeFilter>::ok(ExcludeFilter{});
    if (!list.IsSequence()) return rule_error(label, "'exclude_files' must be a list");

    std::vector<ExcludeEntry> entries;
    for (const auto& entry : list) {
        if (!entry.IsMap()) return rule_error(label, "each 'exclude_files' entry must be a mapping");
        auto kind_name = optional_string(entry, "filter", label);
        if (kind_name.is_err()) return std::move(kind_name).error();
        auto kind = parse_exclude_kind(kind_name.value());
        if (kind.is_err()) return rule_error(label, kind.error().message);

        auto keyword = optional_string(entry, "keyword", label);
        if (keyword.is_err()) return std::move(keyword).error();
        if (keyword.value().empty()) return rule_error(label, "exclude_files entry requires 'keyword'");

        entries.push_back(ExcludeEntry{kind.value(), keyword.value()});
    }
    return Result<ExcludeFilter>::ok(ExcludeFilter(std::move(entries)));
}

// ---------------------------------------------------------------------------
// Variant constructors
// ---------------------------------------------------------------------------

static Result<Rule::Body> make_text(const RuleCommon& c, StringList keywords, bool has_exec) {
    if (!keywords) return rule_error(c.label, "type '" + c.type + "' requires 'keywords'");
    if (has_exec) return rule_error(c.label, "type '" + c.type + "' must not have 'exec'");
    return Result<Rule::Body>::ok(TextRule{std::move(*keywords)});
}

static Result<Rule::Body> make_regex(const RuleCommon& c, StringList keywords, bool has_exec) {
    if (!keywords) return rule_error(c.label, "type '" + c.type + "' requires 'keywords'");
    if (has_exec) return rule_error(c.label, "type '" + c.type + "' must not have 'exec'");

    re2::RE2::Options opts;
    opts.set_log_errors(false);

    RegexRule r;
    for (const auto& k : *keywords) {
        auto re = std::make_shared<const re2::RE2>(k, opts);
        if (!re->ok()) {
            return rule_error(c.label, "invalid regex '" + k + "': " + re->error());
        }
        r.patterns.push_back(std::move(re));
    }
    r.keywords = std::move(*keywords);
    return Result<Rule::Body>::ok(std::move(r));
}

static Result<Rule::Body> make_command(const RuleCommon& c, const StringList& keywords,
                                       const std::string& exec) {
    if (exec.empty()) return rule_error(c.label, "type 'custom' requires 'exec'");
    if (keywords) return rule_error(c.label, "type 'custom' must not have 'keywords'");
    return Result<Rule::Body>::ok(CommandRule{exec});
}

static const std::vector<std::string>& doc_elements(DocLang lang) {
    static const std::vector<std::string> java = {
        "class", "interface", "enum", "record", "annotation", "method"};
    static const std::vector<std::string> kotlin = {
        "class", "interface", "object", "enum_class", "sealed_class",
        "sealed_interface", "data_class", "value_class", "annotation_class",
        "typealias", "function"};
    static const std::vector<std::string> php = {
        "class", "interface", "trait", "enum", "function"};
    static const std::vector<std::string> rust = {
        "struct", "enum", "trait", "type_alias", "union", "fn", "macro_rules", "mod"};
    switch (lang) {
        case DocLang::Java:   return java;
        case DocLang::Kotlin: return kotlin;
        case DocLang::Php:    return php;
        case DocLang::Rust:   return rust;
    }
    return java;
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out += ", ";
        out += v[i];
    }
    return out;
}

static Result<Rule::Body> make_doc(const RuleCommon& c, const YAML::Node& node,
                                   DocLang lang, const std::string& key) {
    const YAML::Node cfg = node[key];
    if (!cfg || cfg.IsNull()) {
        return rule_error(c.label, "type '" + c.type + "' requires '" + key + "' config");
    }
    if (!cfg.IsMap()) return rule_error(c.label, "'" + key + "' must be a mapping");

    const auto& known = doc_elements(lang);
    DocRule r;
    r.lang = lang;
    for (const auto& kv : cfg) {
        std::string element = kv.first.as<std::string>();
        bool is_known = false;
        for (const auto& k : known) {
            if (k == element) { is_known = true; break; }
        }
        if (!is_known) {
            return rule_error(c.label, "unknown '" + key + "' element '" + element +
                              "' (expected " + join(known) + ")");
        }
        std::string vis = kv.second.IsScalar() ? kv.second.as<std::string>() : "";
        if (vis == "public") {
            r.elements[element] = Visibility::Public;
        } else if (vis == "all") {
            r.elements[element] = Visibility::All;
        } else {
            return rule_error(c.label, "'" + key + "." + element +
                              "' must be 'public' or 'all'");
        }
    }
    if (r.elements.empty()) {
        return rule_error(c.label, "'" + key + "' config requires at least one element (" +
                          join(known) + ")");
    }
    return Result<Rule::Body>::ok(std::move(r));
}

static Result<CommentSyntax> parse_custom_syntax(const YAML::Node& custom,
                                                 const std::string& label) {
    if (!custom.IsMap()) return rule_error(label, "'comment.custom' must be a mapping");

    CommentSyntax syn;
    auto lines = optional_list(custom, "lines", label);
    if (lines.is_err()) return std::move(lines).error();
    if (lines.value()) syn.lines = std::move(*lines.value());

    YAML::Node blocks = custom["blocks"];
    if (blocks && !blocks.IsNull()) {
        if (!blocks.IsSequence()) return rule_error(label, "'comment.custom.blocks' must be a list");
        for (const auto& b : blocks) {
            if (!b.IsMap()) return rule_error(label, "each block needs 'start' and 'end'");
            auto start = optional_string(b, "start", label);
            if (start.is_err()) return std::move(start).error();
            auto end = optional_string(b, "end", label);
            if (end.is_err()) return std::move(end).error();
            if (start.value().empty() || end.value().empty()) {
                return rule_error(label, "each block needs 'start' and 'end'");
            }
            syn.blocks.push_back(BlockSyntax{start.value(), end.value()});
        }
    }

    for (const auto& m : syn.lines) {
        if (m.empty()) return rule_error(label, "line comment markers must not be empty");
    }
    if (syn.lines.empty() && syn.blocks.empty()) {
        return rule_error(label, "custom comment syntax needs at least one line or block marker");
    }
    return Result<CommentSyntax>::ok(std::move(syn));
}

static Result<Rule::Body> make_comment(const RuleCommon& c, const YAML::Node& node,
                                       CommentLanguage required) {
    const YAML::Node cfg = node["comment"];
    if (!cfg || cfg.IsNull()) return rule_error(c.label, "comment config is required");
    if (!cfg.IsMap()) return rule_error(c.label, "'comment' must be a mapping");

    bool has_lang = cfg["lang"] && !cfg["lang"].IsNull();
    bool has_custom = cfg["custom"] && !cfg["custom"].IsNull();
    if (has_lang && has_custom) {
        return rule_error(c.label, "cannot specify both 'lang' and 'custom'");
    }
    if (!has_lang && !has_custom) {
        return rule_error(c.label, "either 'lang' or 'custom' is required");
    }

    CommentRule r;
    r.required = required;
    if (has_lang) {
        r.lang = cfg["lang"].as<std::string>();
        auto syn = builtin_comment_syntax(r.lang);
        if (syn.is_err()) return rule_error(c.label, syn.error().message);
        r.syntax = std::move(syn).value();
    } else {
        auto syn = parse_custom_syntax(cfg["custom"], c.label);
        if (syn.is_err()) return std::move(syn).error();
        r.syntax = std::move(syn).value();
    }
    return Result<Rule::Body>::ok(std::move(r));
}

static Result<Rule::Body> make_test_existence(const RuleCommon& c, const YAML::Node& node,
                                              TestFramework fw) {
    TestExistenceRule r;
    r.framework = fw;

    const YAML::Node cfg = node["test"];
    if (cfg && !cfg.IsNull()) {
        if (!cfg.IsMap()) return rule_error(c.label, "'test' must be a mapping");

        auto dir = optional_string(cfg, "test_directory", c.label);
        if (dir.is_err()) return std::move(dir).error();
        r.test_directory = dir.value();

        auto require = optional_string(cfg, "require", c.label);
        if (require.is_err()) return std::move(require).error();
        if (require.value() == "all_public") {
            r.require = TestRequire::AllPublic;
        } else if (require.value().empty() || require.value() == "exists") {
            r.require = TestRequire::Exists;
        } else {
            return rule_error(c.label, "'test.require' must be 'exists' or 'all_public'");
        }

        auto suffix = optional_string(cfg, "test_file_suffix", c.label);
        if (suffix.is_err()) return std::move(suffix).error();
        if (!suffix.value().empty()) r.test_file_suffix = suffix.value();
    }

    if (fw != TestFramework::RustUnit && r.test_directory.empty()) {
        return rule_error(c.label, "type '" + c.type + "' requires 'test.test_directory'");
    }
    return Result<Rule::Body>::ok(std::move(r));
}

static Result<Rule::Body> make_body(const RuleCommon& c, const YAML::Node& node,
                                    StringList keywords, const std::string& exec) {
    const std::string& t = c.type;
    bool has_exec = !exec.empty();

    if (t == "forbidden_texts") return make_text(c, std::move(keywords), has_exec);
    if (t == "forbidden_patterns") return make_regex(c, std::move(keywords), has_exec);
    if (t == "custom") return make_command(c, keywords, exec);

    if (t == "require_java_doc") return make_doc(c, node, DocLang::Java, "java_doc");
    if (t == "require_kotlin_doc") return make_doc(c, node, DocLang::Kotlin, "kotlin_doc");
    if (t == "require_php_doc") return make_doc(c, node, DocLang::Php, "php_doc");
    if (t == "require_rust_doc") return make_doc(c, node, DocLang::Rust, "rust_doc");

    if (t == "require_japanese_comment") return make_comment(c, node, CommentLanguage::Japanese);
    if (t == "require_english_comment") return make_comment(c, node, CommentLanguage::English);

    if (t == "require_japanese_phpunit_test_name")
        return Result<Rule::Body>::ok(TestNameRule{TestFramework::PhpUnit});
    if (t == "require_japanese_kotest_test_name")
        return Result<Rule::Body>::ok(TestNameRule{TestFramework::Kotest});
    if (t == "require_japanese_rust_test_name")
        return Result<Rule::Body>::ok(TestNameRule{TestFramework::RustUnit});

    if (t == "require_phpunit_test") return make_test_existence(c, node, TestFramework::PhpUnit);
    if (t == "require_kotest_test") return make_test_existence(c, node, TestFramework::Kotest);
    if (t == "require_rust_unit_test") return make_test_existence(c, node, TestFramework::RustUnit);

    return rule_error(c.label, "unknown type '" + t + "'");
}

// ---------------------------------------------------------------------------
// Rule
// ---------------------------------------------------------------------------

Result<Rule> Rule::from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        return ReclintError{ReclintError::Config, "rule entry must be a mapping"};
    }

    RuleCommon common;
    try {
        if (node["label"] && node["label"].IsScalar()) {
            common.label = node["label"].as<std::string>();
        }
        if (common.label.empty()) {
            return ReclintError{ReclintError::Config, "rule entry is missing 'label'"};
        }

        auto type = optional_string(node, "type", common.label);
        if (type.is_err()) return std::move(type).error();
        if (type.value().empty()) return rule_error(common.label, "missing 'type'");
        common.type = type.value();

        auto message = optional_string(node, "message", common.label);
        if (message.is_err()) return std::move(message).error();
        if (message.value().empty()) return rule_error(common.label, "missing 'message'");
        common.message = message.value();

        auto matcher = parse_matcher(node, common.label);
        if (matcher.is_err()) return std::move(matcher).error();
        common.matcher = std::move(matcher).value();

        auto ext = parse_ext_filter(node, common.label);
        if (ext.is_err()) return std::move(ext).error();
        common.ext_filter = std::move(ext).value();

        auto excl = parse_exclude_filter(node, common.label);
        if (excl.is_err()) return std::move(excl).error();
        common.exclude_filter = std::move(excl).value();

        auto keywords = optional_list(node, "keywords", common.label);
        if (keywords.is_err()) return std::move(keywords).error();
        auto exec = optional_string(node, "exec", common.label);
        if (exec.is_err()) return std::move(exec).error();

        auto body = make_body(common, node, std::move(keywords).value(), exec.value());
        if (body.is_err()) return std::move(body).error();

        return Result<Rule>::ok(Rule(std::move(common), std::move(body).value()));
    } catch (const YAML::Exception& e) {
        return rule_error(common.label, std::string("malformed entry: ") + e.what());
    }
}

Category Rule::category() const {
    if (std::holds_alternative<TextRule>(body_) || std::holds_alternative<RegexRule>(body_)) {
        return Category::Forbidden;
    }
    return Category::Required;
}

const std::vector<std::string>* Rule::keywords() const {
    if (auto t = std::get_if<TextRule>(&body_)) return &t->keywords;
    if (auto r = std::get_if<RegexRule>(&body_)) return &r->keywords;
    return nullptr;
}

bool Rule::applies_to(const fs::path& file) const {
    return common_.matcher.matches(file) &&
           common_.ext_filter.allows(file) &&
           !common_.exclude_filter.excludes(file);
}

// ---------------------------------------------------------------------------
// Item
// ---------------------------------------------------------------------------

Result<Item> Item::from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        return ReclintError{ReclintError::Config, "review/guideline entry must be a mapping"};
    }

    Item item;
    try {
        auto message = optional_string(node, "message", "");
        if (message.is_err() || message.value().empty()) {
            return ReclintError{ReclintError::Config,
                "review/guideline entry requires a string 'message'"};
        }
        item.message = message.value();

        auto matcher = parse_matcher(node, item.message);
        if (matcher.is_err()) return std::move(matcher).error();
        item.matcher = std::move(matcher).value();

        auto ext = parse_ext_filter(node, item.message);
        if (ext.is_err()) return std::move(ext).error();
        item.ext_filter = std::move(ext).value();
    } catch (const YAML::Exception& e) {
        return ReclintError{ReclintError::Config,
            std::string("malformed review/guideline entry: ") + e.what()};
    }
    return Result<Item>::ok(std::move(item));
}

bool Item::applies_to(const fs::path& file) const {
    return matcher.matches(file) && ext_filter.allows(file);
}

} // namespace reclint
