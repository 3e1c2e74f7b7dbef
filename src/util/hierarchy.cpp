#include <reclint/hierarchy.hpp>
#include <reclint/log.hpp>

namespace reclint {

namespace fs = std::filesystem;

static Result<fs::path> canonical_dir(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::canonical(start, ec);
    if (ec) {
        return ReclintError{ReclintError::IO,
            "cannot resolve path: " + start.string(), ec.message()};
    }
    if (!fs::is_directory(dir, ec)) dir = dir.parent_path();
    return Result<fs::path>::ok(std::move(dir));
}

static bool has_root_marker(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / ROOT_MARKER_FILE, ec);
}

static ReclintError no_root_error(const fs::path& start) {
    return ReclintError{ReclintError::NotFound,
        std::string("no ") + ROOT_MARKER_FILE + " found in " + start.string() +
        " or any parent directory",
        std::string("create an empty ") + ROOT_MARKER_FILE + " at the project root"};
}

Result<fs::path> find_root(const fs::path& start) {
    auto canon = canonical_dir(start);
    if (canon.is_err()) return std::move(canon).error();
    fs::path dir = canon.value();

    while (true) {
        if (has_root_marker(dir)) return Result<fs::path>::ok(dir);

        fs::path parent = dir.parent_path();
        if (parent == dir) return no_root_error(start);
        dir = parent;
    }
}

// ---------------------------------------------------------------------------
// CollectedRuleSet
// ---------------------------------------------------------------------------

const std::vector<RuleEntry>& CollectedRuleSet::rules_in(Category c) const {
    static const std::vector<RuleEntry> none;
    auto it = rules.find(c);
    return it == rules.end() ? none : it->second;
}

const std::vector<ItemEntry>& CollectedRuleSet::items_in(Category c) const {
    static const std::vector<ItemEntry> none;
    auto it = items.find(c);
    return it == items.end() ? none : it->second;
}

size_t CollectedRuleSet::rule_count() const {
    size_t n = 0;
    for (const auto& [cat, entries] : rules) n += entries.size();
    return n;
}

// ---------------------------------------------------------------------------
// HierarchyResolver
// ---------------------------------------------------------------------------

Result<HierarchyResolver::RuleFilePtr> HierarchyResolver::rule_file_for(const fs::path& dir) {
    auto it = rule_files_.find(dir);
    if (it != rule_files_.end()) return it->second;

    Result<RuleFilePtr> loaded = Result<RuleFilePtr>::ok(nullptr);
    if (auto path = RuleFile::locate(dir)) {
        log::trace("loading rule file %s", path->string().c_str());
        auto rf = RuleFile::load(*path);
        if (rf.is_err()) {
            loaded = std::move(rf).error();
        } else {
            loaded = Result<RuleFilePtr>::ok(
                std::make_shared<const RuleFile>(std::move(rf).value()));
        }
    }
    rule_files_.emplace(dir, loaded);
    return loaded;
}

size_t HierarchyResolver::loaded_rule_files() const {
    size_t n = 0;
    for (const auto& [dir, rf] : rule_files_) {
        if (rf.is_ok() && rf.value()) ++n;
    }
    return n;
}

Result<RootConfig> HierarchyResolver::root_config_for(const fs::path& root) {
    auto it = root_configs_.find(root);
    if (it != root_configs_.end()) return it->second;

    auto cfg = RootConfig::load(root / ROOT_MARKER_FILE);
    root_configs_.emplace(root, cfg);
    return cfg;
}

Result<CollectedRuleSet> HierarchyResolver::resolve(const fs::path& target_dir) {
    auto canon = canonical_dir(target_dir);
    if (canon.is_err()) return std::move(canon).error();
    fs::path dir = canon.value();

    // Walk upward collecting rule files until the root marker is found.
    std::vector<std::pair<RuleFilePtr, fs::path>> chain;
    fs::path root;
    while (true) {
        auto rf = rule_file_for(dir);
        if (rf.is_err()) return rf.error();
        if (rf.value()) chain.emplace_back(rf.value(), dir);

        if (has_root_marker(dir)) {
            root = dir;
            break;
        }
        fs::path parent = dir.parent_path();
        if (parent == dir) return no_root_error(target_dir);
        dir = parent;
    }

    auto root_cfg = root_config_for(root);
    if (root_cfg.is_err()) return root_cfg.error();

    CollectedRuleSet set;
    set.root_dir = root;
    set.root_config = root_cfg.value();

    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const RuleFile& rf = *it->first;
        const fs::path& source = it->second;
        for (const auto& rule : rf.rules) {
            set.rules[rule->category()].push_back(RuleEntry{rule, source});
        }
        for (const auto& item : rf.review) {
            set.items[Category::Review].push_back(ItemEntry{item, source});
        }
        for (const auto& item : rf.guideline) {
            set.items[Category::Guideline].push_back(ItemEntry{item, source});
        }
    }

    log::debug("resolved %zu rule(s) for %s (root %s, %zu rule file(s))",
               set.rule_count(), canon.value().string().c_str(),
               root.string().c_str(), chain.size());
    return Result<CollectedRuleSet>::ok(std::move(set));
}

Result<CollectedRuleSet> resolve_effective_rules(const fs::path& target_dir) {
    HierarchyResolver resolver;
    return resolver.resolve(target_dir);
}

} // namespace reclint
