#pragma once

#include <reclint/rule.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reclint {

inline constexpr const char* RULE_FILE = ".rec_lint.yaml";
inline constexpr const char* RULE_FILE_ALT = ".rec_lint.yml";

// One directory's rule declarations, in file order. Rules and items are
// shared read-only between every CollectedRuleSet that inherits them.
struct RuleFile {
    std::vector<std::shared_ptr<const Rule>> rules;
    std::vector<std::shared_ptr<const Item>> review;
    std::vector<std::shared_ptr<const Item>> guideline;

    // YAML syntax problems are Parse errors; entries that break their
    // type's field rules are Config errors.
    static Result<RuleFile> parse(const std::string& yaml_str);
    static Result<RuleFile> load(const std::filesystem::path& path);

    // The rule file inside `dir`, preferring .rec_lint.yaml over .rec_lint.yml.
    static std::optional<std::filesystem::path> locate(const std::filesystem::path& dir);

    bool empty() const { return rules.empty() && review.empty() && guideline.empty(); }
};

// True for the rule file and root marker names, which are never validated.
bool is_reclint_config_file(const std::filesystem::path& file);

} // namespace reclint
