#include <reclint/filter.hpp>

namespace reclint {

namespace fs = std::filesystem;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool ExcludeFilter::excludes(const fs::path& file) const {
    if (entries_.empty()) return false;

    std::string filename = file.filename().string();
    std::string path = file.string();
    for (const auto& e : entries_) {
        switch (e.kind) {
            case ExcludeKind::FileStartsWith:
                if (filename.compare(0, e.keyword.size(), e.keyword) == 0) return true;
                break;
            case ExcludeKind::FileEndsWith:
                if (ends_with(filename, e.keyword)) return true;
                break;
            case ExcludeKind::PathContains:
                if (path.find(e.keyword) != std::string::npos) return true;
                break;
        }
    }
    return false;
}

bool ExtFilter::allows(const fs::path& file) const {
    std::string filename = file.filename().string();

    for (const auto& ext : exclude_) {
        if (ends_with(filename, ext)) return false;
    }
    if (include_.empty()) return true;
    for (const auto& ext : include_) {
        if (ends_with(filename, ext)) return true;
    }
    return false;
}

const char* exclude_kind_name(ExcludeKind k) {
    switch (k) {
        case ExcludeKind::FileStartsWith: return "file_starts_with";
        case ExcludeKind::FileEndsWith:   return "file_ends_with";
        case ExcludeKind::PathContains:   return "path_contains";
    }
    return "unknown";
}

Result<ExcludeKind> parse_exclude_kind(const std::string& name) {
    if (name == "file_starts_with") return Result<ExcludeKind>::ok(ExcludeKind::FileStartsWith);
    if (name == "file_ends_with") return Result<ExcludeKind>::ok(ExcludeKind::FileEndsWith);
    if (name == "path_contains") return Result<ExcludeKind>::ok(ExcludeKind::PathContains);
    return ReclintError{ReclintError::Config,
        "unknown exclude filter '" + name + "'",
        "expected file_starts_with, file_ends_with or path_contains"};
}

} // namespace reclint
