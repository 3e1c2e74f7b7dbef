#pragma once

#include <reclint/rule.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reclint {

// One offending line of a text or regex rule.
struct LineHit {
    int line;               // 1-based
    int col;                // 1-based byte offset
    std::string line_text;
};

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(const std::string& content);

// Split on '\n', dropping one trailing '\r' per line. A trailing newline
// does not start an extra empty line.
std::vector<std::string> split_lines(const std::string& content);

// At most one hit per line: the first keyword in declared order that occurs
// in the line wins, even when a later keyword occurs further left.
std::vector<LineHit> check_text(const std::string& content, const TextRule& rule);

// Same contract as check_text, with each pattern searched anywhere in the line.
std::vector<LineHit> check_regex(const std::string& content, const RegexRule& rule);

// Run the rule's command against `file`. Returns nullopt when the command
// exits 0 or expands to nothing, otherwise stdout followed by stderr,
// trimmed. A command that cannot be started is an error.
Result<std::optional<std::string>> check_command(const std::filesystem::path& file,
                                                 const CommandRule& rule);

} // namespace reclint
