#pragma once

#include <reclint/hierarchy.hpp>
#include <string>
#include <vector>

namespace reclint {

// One line per effective rule, grouped by category and root first within
// each category:
//   "<category>: <label> [ kw1, kw2 ]"
// suffixed with " @ <dir>" when the rule comes from below the root.
std::vector<std::string> describe_rules(const CollectedRuleSet& set);

// One line per review or guideline item: "<category>: <message>", with the
// same provenance suffix.
std::vector<std::string> describe_items(const CollectedRuleSet& set, Category category);

// Same, restricted to the items whose matcher and extension filter accept
// `file`.
std::vector<std::string> describe_items(const CollectedRuleSet& set, Category category,
                                        const std::filesystem::path& file);

} // namespace reclint
