#pragma once

#include <reclint/result.hpp>
#include <reclint/log.hpp>
#include <string>
#include <optional>
#include <filesystem>

namespace reclint {

// Violation ordering used by the validation driver.
enum class SortMode {
    Rule,   // message, file, line, col
    File    // file, line, col, message
};

const char* sort_mode_name(SortMode m);
Result<SortMode> parse_sort_mode(const std::string& name);

// Project-level settings file, looked up in the root directory.
inline constexpr const char* PROJECT_SETTINGS_FILE = ".rec_lint.toml";

// Layered tool settings: global < project.
// Later layers override only the keys they actually set.
struct Settings {
    SortMode sort = SortMode::Rule;
    unsigned jobs = 0;   // 0 = hardware concurrency
    log::Level log_level = log::Info;
    bool log_color = true;

    bool sort_set = false;
    bool jobs_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    static Result<Settings> load(const std::string& path);
    static Result<Settings> parse(const std::string& toml_str);

    void merge(const Settings& other);

    static Settings effective(const std::optional<Settings>& global,
                              const std::optional<Settings>& project);

    // Push log level/color into reclint::log. Color is only forced off;
    // when enabled the logger keeps its TTY detection.
    void apply_logging() const;
};

// ~/.rec_lint/config.toml, or "" when no home directory is known
std::string global_settings_path();

// Load global and <root>/.rec_lint.toml (when present) and merge them.
// Missing files are not errors; malformed ones are.
Result<Settings> load_effective_settings(const std::filesystem::path& root_dir);

} // namespace reclint
