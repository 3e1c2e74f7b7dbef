#include <reclint/describe.hpp>

namespace reclint {

namespace fs = std::filesystem;

static std::string provenance(const fs::path& source_dir, const fs::path& root) {
    if (source_dir == root) return "";
    fs::path rel = source_dir.lexically_relative(root);
    if (rel.empty()) return " @ " + source_dir.string();
    return " @ " + rel.string();
}

std::vector<std::string> describe_rules(const CollectedRuleSet& set) {
    std::vector<std::string> out;
    for (Category c : {Category::Required, Category::Forbidden}) {
        for (const auto& entry : set.rules_in(c)) {
            std::string line = std::string(category_name(c)) + ": " + entry.rule->label();
            if (const auto* kws = entry.rule->keywords()) {
                line += " [ ";
                for (size_t i = 0; i < kws->size(); ++i) {
                    if (i > 0) line += ", ";
                    line += (*kws)[i];
                }
                line += " ]";
            }
            line += provenance(entry.source_dir, set.root_dir);
            out.push_back(std::move(line));
        }
    }
    return out;
}

static std::string item_line(const ItemEntry& entry, Category category, const fs::path& root) {
    return std::string(category_name(category)) + ": " + entry.item->message +
           provenance(entry.source_dir, root);
}

std::vector<std::string> describe_items(const CollectedRuleSet& set, Category category) {
    std::vector<std::string> out;
    for (const auto& entry : set.items_in(category)) {
        out.push_back(item_line(entry, category, set.root_dir));
    }
    return out;
}

std::vector<std::string> describe_items(const CollectedRuleSet& set, Category category,
                                        const fs::path& file) {
    std::vector<std::string> out;
    for (const auto& entry : set.items_in(category)) {
        if (!entry.item->applies_to(file)) continue;
        out.push_back(item_line(entry, category, set.root_dir));
    }
    return out;
}

} // namespace reclint
