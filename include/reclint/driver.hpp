#pragma once

#include <reclint/hierarchy.hpp>
#include <reclint/settings.hpp>
#include <reclint/validator.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reclint {

// One reported rule failure. `file` is relative to the root directory.
struct Violation {
    std::string file;
    int line = 0;           // 0 = whole file
    int col = 0;
    std::string message;
    std::optional<std::string> found;       // validator context, printed
    std::optional<std::string> line_text;   // offending line of text/regex rules
    std::optional<std::string> detail;      // command output, printed on its own line
};

struct ValidateOptions {
    SortMode sort = SortMode::Rule;
    unsigned jobs = 0;      // 0 = hardware concurrency
};

struct ValidationReport {
    SortMode sort = SortMode::Rule;
    std::vector<std::string> errors;        // sorted, "<dir or file>: <message>"
    std::vector<Violation> violations;      // sorted by `sort`
    size_t files_checked = 0;

    // Errors first, then one line per violation (plus a detail line for
    // command output).
    std::vector<std::string> lines() const;

    bool clean() const { return errors.empty() && violations.empty(); }
};

// Violations and scoped errors of a single file.
struct FileReport {
    std::vector<Violation> violations;
    std::vector<ReclintError> errors;
};

// Apply every rule of `rules` that accepts `file`. Rule kinds without a
// registered validator are skipped here; validate_paths reports them.
FileReport validate_file(const std::filesystem::path& file,
                         const CollectedRuleSet& rules,
                         const ValidatorRegistry& registry);

// Expand input paths to the files to check. Directories are walked
// recursively without following symlinks, skipping .git, the root config's
// exclude_dirs and rule/marker files; the root config's extension filter
// applies to every file. Results are canonical and de-duplicated.
// Inputs that do not exist are recorded in `errors`.
std::vector<std::filesystem::path> expand_paths(const std::vector<std::filesystem::path>& inputs,
                                                const RootConfig& root_config,
                                                std::vector<std::string>& errors);

// Full run: expansion, per-directory resolution (memoized, single-threaded),
// parallel per-file checks, then sorting. Only Config and NotFound errors
// abort; everything else lands in the report.
Result<ValidationReport> validate_paths(const std::vector<std::filesystem::path>& paths,
                                        const ValidateOptions& opts,
                                        const ValidatorRegistry& registry);

void sort_violations(std::vector<Violation>& violations, SortMode mode);
std::string format_violation(const Violation& v, SortMode mode);

} // namespace reclint
