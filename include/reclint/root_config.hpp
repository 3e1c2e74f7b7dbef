#pragma once

#include <reclint/result.hpp>
#include <filesystem>
#include <set>
#include <string>

namespace reclint {

// Sentinel file marking the top of an inheritance tree.
inline constexpr const char* ROOT_MARKER_FILE = ".rec_lint_config.yaml";

// Body of the root marker. Loaded once per run and never mutated.
struct RootConfig {
    std::set<std::string> include_extensions;   // ".rs", ".kt", ...; empty = all
    std::set<std::string> exclude_dirs;         // bare directory names

    // Parse the marker body. An empty body, or one that is only comments,
    // yields the defaults.
    static Result<RootConfig> parse(const std::string& yaml_str);
    static Result<RootConfig> load(const std::filesystem::path& path);

    // Files without an extension are rejected once a filter is set.
    bool should_include_extension(const std::filesystem::path& file) const;
    bool should_exclude_dir(const std::string& dir_name) const;
};

} // namespace reclint
