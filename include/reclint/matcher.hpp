#pragma once

#include <reclint/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace reclint {

enum class MatchPattern {
    FileStartsWith,
    FileEndsWith,
    PathContains,
    FileNotStartsWith,
    FileNotEndsWith,
    PathNotContains
};

enum class MatchCond { And, Or };

// One matcher clause: a pattern kind applied to each keyword, then combined
// with `cond`.
struct MatchItem {
    MatchPattern pattern = MatchPattern::PathContains;
    std::vector<std::string> keywords;
    MatchCond cond = MatchCond::And;
};

// Boolean predicate over a file path. Items are AND-combined; an empty
// matcher accepts every path.
//
// Negative pattern kinds negate each keyword test before `cond` combines
// them, so `path_not_contains [A, B] or` is false only when the path
// contains both A and B.
class Matcher {
public:
    Matcher() = default;
    explicit Matcher(std::vector<MatchItem> items);

    bool matches(const std::filesystem::path& file) const;

    // Same test with the filename (last component) and the full path string
    // supplied directly.
    bool matches(const std::string& filename, const std::string& path) const;

    const std::vector<MatchItem>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

private:
    std::vector<MatchItem> items_;
};

bool is_negative(MatchPattern p);
const char* match_pattern_name(MatchPattern p);
const char* match_cond_name(MatchCond c);

Result<MatchPattern> parse_match_pattern(const std::string& name);
Result<MatchCond> parse_match_cond(const std::string& name);

} // namespace reclint
