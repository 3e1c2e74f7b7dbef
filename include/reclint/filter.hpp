#pragma once

#include <reclint/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace reclint {

enum class ExcludeKind { FileStartsWith, FileEndsWith, PathContains };

struct ExcludeEntry {
    ExcludeKind kind = ExcludeKind::PathContains;
    std::string keyword;
};

// OR-combined exclusion list; an empty filter excludes nothing.
class ExcludeFilter {
public:
    ExcludeFilter() = default;
    explicit ExcludeFilter(std::vector<ExcludeEntry> entries)
        : entries_(std::move(entries)) {}

    bool excludes(const std::filesystem::path& file) const;

    const std::vector<ExcludeEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<ExcludeEntry> entries_;
};

// Suffix allow/deny list. Suffixes are compared against the end of the
// filename, so ".gen.rs" works as well as ".rs".
class ExtFilter {
public:
    ExtFilter() = default;
    ExtFilter(std::vector<std::string> include, std::vector<std::string> exclude)
        : include_(std::move(include)), exclude_(std::move(exclude)) {}

    // Empty include list allows everything; exclude always wins.
    bool allows(const std::filesystem::path& file) const;

    const std::vector<std::string>& include() const { return include_; }
    const std::vector<std::string>& exclude() const { return exclude_; }
    bool empty() const { return include_.empty() && exclude_.empty(); }

private:
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

const char* exclude_kind_name(ExcludeKind k);
Result<ExcludeKind> parse_exclude_kind(const std::string& name);

} // namespace reclint
