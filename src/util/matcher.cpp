#include <reclint/matcher.hpp>

namespace reclint {

namespace fs = std::filesystem;

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Positive form of the test; negative kinds are handled by the caller.
static bool positive_test(MatchPattern p, const std::string& keyword,
                          const std::string& filename, const std::string& path) {
    switch (p) {
        case MatchPattern::FileStartsWith:
        case MatchPattern::FileNotStartsWith:
            return starts_with(filename, keyword);
        case MatchPattern::FileEndsWith:
        case MatchPattern::FileNotEndsWith:
            return ends_with(filename, keyword);
        case MatchPattern::PathContains:
        case MatchPattern::PathNotContains:
            return path.find(keyword) != std::string::npos;
    }
    return false;
}

static bool item_matches(const MatchItem& item,
                         const std::string& filename, const std::string& path) {
    bool negate = is_negative(item.pattern);
    auto check = [&](const std::string& kw) {
        bool hit = positive_test(item.pattern, kw, filename, path);
        return negate ? !hit : hit;
    };

    if (item.cond == MatchCond::And) {
        for (const auto& kw : item.keywords) {
            if (!check(kw)) return false;
        }
        return true;
    }
    for (const auto& kw : item.keywords) {
        if (check(kw)) return true;
    }
    return false;
}

Matcher::Matcher(std::vector<MatchItem> items)
    : items_(std::move(items)) {}

bool Matcher::matches(const fs::path& file) const {
    if (items_.empty()) return true;
    return matches(file.filename().string(), file.string());
}

bool Matcher::matches(const std::string& filename, const std::string& path) const {
    for (const auto& item : items_) {
        if (!item_matches(item, filename, path)) return false;
    }
    return true;
}

bool is_negative(MatchPattern p) {
    return p == MatchPattern::FileNotStartsWith ||
           p == MatchPattern::FileNotEndsWith ||
           p == MatchPattern::PathNotContains;
}

const char* match_pattern_name(MatchPattern p) {
    switch (p) {
        case MatchPattern::FileStartsWith:    return "file_starts_with";
        case MatchPattern::FileEndsWith:      return "file_ends_with";
        case MatchPattern::PathContains:      return "path_contains";
        case MatchPattern::FileNotStartsWith: return "file_not_starts_with";
        case MatchPattern::FileNotEndsWith:   return "file_not_ends_with";
        case MatchPattern::PathNotContains:   return "path_not_contains";
    }
    return "unknown";
}

const char* match_cond_name(MatchCond c) {
    return c == MatchCond::And ? "and" : "or";
}

Result<MatchPattern> parse_match_pattern(const std::string& name) {
    for (MatchPattern p : {MatchPattern::FileStartsWith, MatchPattern::FileEndsWith,
                           MatchPattern::PathContains, MatchPattern::FileNotStartsWith,
                           MatchPattern::FileNotEndsWith, MatchPattern::PathNotContains}) {
        if (name == match_pattern_name(p)) return Result<MatchPattern>::ok(p);
    }
    return ReclintError{ReclintError::Config,
        "unknown match pattern '" + name + "'",
        "expected one of file_starts_with, file_ends_with, path_contains "
        "or their file_not_/path_not_ forms"};
}

Result<MatchCond> parse_match_cond(const std::string& name) {
    if (name == "and") return Result<MatchCond>::ok(MatchCond::And);
    if (name == "or") return Result<MatchCond>::ok(MatchCond::Or);
    return ReclintError{ReclintError::Config,
        "unknown match cond '" + name + "'", "expected 'and' or 'or'"};
}

} // namespace reclint
