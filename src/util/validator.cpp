#include <reclint/validator.hpp>
#include <reclint/lang/comment.hpp>

namespace reclint {

namespace fs = std::filesystem;

ValidatorRegistry ValidatorRegistry::with_builtins() {
    ValidatorRegistry reg;
    auto comment = std::make_shared<const CommentLanguageValidator>();
    reg.add("require_japanese_comment", comment);
    reg.add("require_english_comment", comment);
    return reg;
}

void ValidatorRegistry::add(const std::string& type, std::shared_ptr<const Validator> validator) {
    validators_[type] = std::move(validator);
}

const Validator* ValidatorRegistry::find(const std::string& type) const {
    auto it = validators_.find(type);
    return it == validators_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ValidatorRegistry::types() const {
    std::vector<std::string> out;
    for (const auto& [type, v] : validators_) out.push_back(type);
    return out;
}

// ---------------------------------------------------------------------------
// Comment language
// ---------------------------------------------------------------------------

std::string truncate_comment(const std::string& text) {
    const size_t limit = 40;
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (chars == limit) return text.substr(0, i) + "...";
        auto c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        i += len;
        ++chars;
    }
    return text;
}

Result<std::vector<Finding>> CommentLanguageValidator::validate(const fs::path& file,
                                                               const std::string& content,
                                                               const Rule& rule,
                                                               const fs::path& root_dir) const {
    (void)file;
    (void)root_dir;

    const CommentRule* cfg = rule.as<CommentRule>();
    if (!cfg) {
        return ReclintError{ReclintError::InvalidArg,
            "comment language validator used with rule type '" + rule.type_name() + "'"};
    }

    std::vector<Finding> findings;
    CommentScanner scanner(content, cfg->syntax);
    Comment c;
    while (scanner.next(c)) {
        if (c.text == "*") continue;
        bool japanese = contains_japanese(c.text);
        bool wrong = (cfg->required == CommentLanguage::Japanese) ? !japanese : japanese;
        if (wrong) {
            findings.push_back(Finding{c.line, 1, truncate_comment(c.text)});
        }
    }
    return Result<std::vector<Finding>>::ok(std::move(findings));
}

} // namespace reclint
