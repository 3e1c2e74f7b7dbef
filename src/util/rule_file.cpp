#include <reclint/rule_file.hpp>
#include <reclint/root_config.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace reclint {

namespace fs = std::filesystem;

static Status parse_items(const YAML::Node& doc, const char* key,
                          std::vector<std::shared_ptr<const Item>>& out) {
    const YAML::Node list = doc[key];
    if (!list || list.IsNull()) return ok_status();
    if (!list.IsSequence()) {
        return ReclintError{ReclintError::Config, std::string("'") + key + "' must be a list"};
    }
    for (const auto& entry : list) {
        auto item = Item::from_yaml(entry);
        if (item.is_err()) return std::move(item).error();
        out.push_back(std::make_shared<const Item>(std::move(item).value()));
    }
    return ok_status();
}

static Result<RuleFile> from_document(const YAML::Node& doc) {
    RuleFile rf;
    if (!doc || doc.IsNull()) return Result<RuleFile>::ok(std::move(rf));
    if (!doc.IsMap()) {
        return ReclintError{ReclintError::Parse, "rule file must be a mapping",
            "expected top-level 'rule', 'review' and/or 'guideline' lists"};
    }

    const YAML::Node rules = doc["rule"];
    if (rules && !rules.IsNull()) {
        if (!rules.IsSequence()) {
            return ReclintError{ReclintError::Config, "'rule' must be a list"};
        }
        for (const auto& entry : rules) {
            auto rule = Rule::from_yaml(entry);
            if (rule.is_err()) return std::move(rule).error();
            rf.rules.push_back(std::make_shared<const Rule>(std::move(rule).value()));
        }
    }

    RECLINT_TRY(parse_items(doc, "review", rf.review));
    RECLINT_TRY(parse_items(doc, "guideline", rf.guideline));

    return Result<RuleFile>::ok(std::move(rf));
}

Result<RuleFile> RuleFile::parse(const std::string& yaml_str) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_str);
    } catch (const YAML::Exception& e) {
        return ReclintError{ReclintError::Parse,
            std::string("rule file YAML parse error: ") + e.what()};
    }
    return from_document(doc);
}

Result<RuleFile> RuleFile::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ReclintError{ReclintError::IO, "cannot read rule file: " + path.string()};
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

std::optional<fs::path> RuleFile::locate(const fs::path& dir) {
    std::error_code ec;
    for (const char* name : {RULE_FILE, RULE_FILE_ALT}) {
        fs::path candidate = dir / name;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

bool is_reclint_config_file(const fs::path& file) {
    std::string name = file.filename().string();
    return name == RULE_FILE || name == RULE_FILE_ALT || name == ROOT_MARKER_FILE;
}

} // namespace reclint
