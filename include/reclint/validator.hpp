#pragma once

#include <reclint/rule.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace reclint {

// One validator-reported problem, before it is bound to a file and message.
// line 0 means the whole file.
struct Finding {
    int line = 0;
    int col = 0;
    std::string found;
};

// Kind-specific check for doc, comment-language, test-name and
// test-existence rules. Implementations must depend only on their inputs;
// test-existence checks may additionally look up a bounded number of
// candidate test files below `root_dir`.
class Validator {
public:
    virtual ~Validator() = default;

    virtual Result<std::vector<Finding>> validate(const std::filesystem::path& file,
                                                  const std::string& content,
                                                  const Rule& rule,
                                                  const std::filesystem::path& root_dir) const = 0;
};

// Validators keyed by rule type name. Shared read-only by every worker
// during validation, so implementations must be thread-safe for const use.
class ValidatorRegistry {
public:
    // Registry holding the built-in comment-language validators.
    static ValidatorRegistry with_builtins();

    void add(const std::string& type, std::shared_ptr<const Validator> validator);
    const Validator* find(const std::string& type) const;

    std::vector<std::string> types() const;

private:
    std::map<std::string, std::shared_ptr<const Validator>> validators_;
};

// require_japanese_comment / require_english_comment: flags every comment
// written in the wrong language. Comments that are only "*" are ignored.
class CommentLanguageValidator : public Validator {
public:
    Result<std::vector<Finding>> validate(const std::filesystem::path& file,
                                          const std::string& content,
                                          const Rule& rule,
                                          const std::filesystem::path& root_dir) const override;
};

// Comment text as shown in a finding: at most 40 characters, then "...".
std::string truncate_comment(const std::string& text);

} // namespace reclint
