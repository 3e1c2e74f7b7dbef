#include <reclint/root_config.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace reclint {

namespace fs = std::filesystem;

static Status read_string_set(const YAML::Node& node, const char* key,
                              std::set<std::string>& out) {
    const YAML::Node list = node[key];
    if (!list || list.IsNull()) return ok_status();
    if (!list.IsSequence()) {
        return ReclintError{ReclintError::Parse,
            std::string("'") + key + "' must be a list of strings"};
    }
    for (const auto& item : list) {
        out.insert(item.as<std::string>());
    }
    return ok_status();
}

Result<RootConfig> RootConfig::parse(const std::string& yaml_str) {
    RootConfig cfg;
    try {
        // Blank and comment-only bodies load as a null document.
        const YAML::Node doc = YAML::Load(yaml_str);
        if (!doc || doc.IsNull()) {
            return Result<RootConfig>::ok(std::move(cfg));
        }
        if (!doc.IsMap()) {
            return ReclintError{ReclintError::Parse,
                "root config must be a mapping",
                "expected include_extensions and/or exclude_dirs keys"};
        }
        RECLINT_TRY(read_string_set(doc, "include_extensions", cfg.include_extensions));
        RECLINT_TRY(read_string_set(doc, "exclude_dirs", cfg.exclude_dirs));
    } catch (const YAML::Exception& e) {
        return ReclintError{ReclintError::Parse,
            std::string("root config YAML parse error: ") + e.what()};
    }

    return Result<RootConfig>::ok(std::move(cfg));
}

Result<RootConfig> RootConfig::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ReclintError{ReclintError::IO,
            "cannot read root config: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto result = parse(ss.str());
    if (result.is_err()) {
        auto err = std::move(result).error();
        err.file = path.string();
        return err;
    }
    return result;
}

bool RootConfig::should_include_extension(const fs::path& file) const {
    if (include_extensions.empty()) return true;
    std::string ext = file.extension().string();
    if (ext.empty()) return false;
    return include_extensions.count(ext) > 0;
}

bool RootConfig::should_exclude_dir(const std::string& dir_name) const {
    return exclude_dirs.count(dir_name) > 0;
}

} // namespace reclint
