#include <reclint/settings.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace reclint {

namespace fs = std::filesystem;

const char* sort_mode_name(SortMode m) {
    return m == SortMode::Rule ? "rule" : "file";
}

Result<SortMode> parse_sort_mode(const std::string& name) {
    if (name == "rule") return Result<SortMode>::ok(SortMode::Rule);
    if (name == "file") return Result<SortMode>::ok(SortMode::File);
    return ReclintError{ReclintError::Config,
        "unknown sort mode '" + name + "'", "expected 'rule' or 'file'"};
}

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ReclintError{ReclintError::Parse,
            std::string("settings TOML parse error: ") + e.what()};
    }

    Settings s;

    // [validate] section
    if (auto validate = doc["validate"].as_table()) {
        if (auto v = (*validate)["sort"].value<std::string>()) {
            auto mode = parse_sort_mode(*v);
            if (mode.is_err()) return std::move(mode).error();
            s.sort = mode.value();
            s.sort_set = true;
        }
        if (auto v = (*validate)["jobs"].value<int64_t>()) {
            if (*v < 0) {
                return ReclintError{ReclintError::Config,
                    "validate.jobs must not be negative",
                    "use 0 for one worker per hardware thread"};
            }
            s.jobs = static_cast<unsigned>(*v);
            s.jobs_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, s.log_level)) {
                return ReclintError{ReclintError::Config,
                    "unknown log level '" + *v + "'",
                    "expected trace, debug, info, warn or error"};
            }
            s.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            s.log_color = *v;
            s.log_color_set = true;
        }
    }

    return Result<Settings>::ok(std::move(s));
}

Result<Settings> Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ReclintError{ReclintError::IO,
            "cannot open settings file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto result = Settings::parse(ss.str());
    if (result.is_err()) {
        auto err = std::move(result).error();
        err.file = path;
        return err;
    }
    return result;
}

void Settings::merge(const Settings& other) {
    if (other.sort_set) {
        sort = other.sort;
        sort_set = true;
    }
    if (other.jobs_set) {
        jobs = other.jobs;
        jobs_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Settings Settings::effective(const std::optional<Settings>& global,
                             const std::optional<Settings>& project) {
    Settings result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Settings::apply_logging() const {
    log::set_level(log_level);
    if (!log_color) log::set_color_enabled(false);
}

std::string global_settings_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.rec_lint/config.toml";
}

static Result<std::optional<Settings>> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return Result<std::optional<Settings>>::ok(std::nullopt);
    }
    auto loaded = Settings::load(path);
    if (loaded.is_err()) return std::move(loaded).error();
    return Result<std::optional<Settings>>::ok(std::move(loaded).value());
}

Result<Settings> load_effective_settings(const fs::path& root_dir) {
    auto global = load_optional(global_settings_path());
    if (global.is_err()) return std::move(global).error();

    auto project = load_optional((root_dir / PROJECT_SETTINGS_FILE).string());
    if (project.is_err()) return std::move(project).error();

    return Result<Settings>::ok(Settings::effective(global.value(), project.value()));
}

} // namespace reclint
