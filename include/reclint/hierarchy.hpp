#pragma once

#include <reclint/rule_file.hpp>
#include <reclint/root_config.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace reclint {

struct RuleEntry {
    std::shared_ptr<const Rule> rule;
    std::filesystem::path source_dir;   // directory whose rule file declared it
};

struct ItemEntry {
    std::shared_ptr<const Item> item;
    std::filesystem::path source_dir;
};

// Effective rules for one directory: every rule file from the root down to
// the directory, concatenated root first, each in declaration order.
struct CollectedRuleSet {
    std::filesystem::path root_dir;
    RootConfig root_config;
    std::map<Category, std::vector<RuleEntry>> rules;   // Required, Forbidden
    std::map<Category, std::vector<ItemEntry>> items;   // Review, Guideline

    const std::vector<RuleEntry>& rules_in(Category c) const;
    const std::vector<ItemEntry>& items_in(Category c) const;
    size_t rule_count() const;
};

// Nearest directory at or above `start` holding the root marker. A file
// argument starts the search at its parent. NotFound at the filesystem root.
Result<std::filesystem::path> find_root(const std::filesystem::path& start);

// Memoizing resolver. Rule files and root configs are loaded at most once
// per directory for the lifetime of the resolver, so sibling directories
// share their ancestors' Rule objects.
class HierarchyResolver {
public:
    Result<CollectedRuleSet> resolve(const std::filesystem::path& target_dir);

    // Rule files parsed so far, not counting directories without one.
    size_t loaded_rule_files() const;

private:
    using RuleFilePtr = std::shared_ptr<const RuleFile>;

    // nullptr when the directory has no rule file
    Result<RuleFilePtr> rule_file_for(const std::filesystem::path& dir);
    Result<RootConfig> root_config_for(const std::filesystem::path& root);

    std::map<std::filesystem::path, Result<RuleFilePtr>> rule_files_;
    std::map<std::filesystem::path, Result<RootConfig>> root_configs_;
};

// One-shot form of HierarchyResolver::resolve.
Result<CollectedRuleSet> resolve_effective_rules(const std::filesystem::path& target_dir);

} // namespace reclint
