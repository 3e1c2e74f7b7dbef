#pragma once

#include <reclint/result.hpp>
#include <deque>
#include <string>
#include <vector>

namespace reclint {

// One extracted comment span. Block comments spanning several lines
// produce one Comment per physical line.
struct Comment {
    int line = 0;       // 1-based
    std::string text;   // trimmed, never empty

    bool operator==(const Comment& o) const {
        return line == o.line && text == o.text;
    }
};

struct BlockSyntax {
    std::string start;
    std::string end;
};

// Comment syntax descriptor. Markers are tried in declaration order,
// line markers before block markers, when two start at the same column.
struct CommentSyntax {
    std::vector<std::string> lines;
    std::vector<BlockSyntax> blocks;
    // Comments whose text starts with one of these are dropped
    // (Rust uses this to skip `///` and `//!` doc comments).
    std::vector<std::string> skip_prefixes;
};

// Built-in syntax for "java", "kotlin", "rust" or "php".
Result<CommentSyntax> builtin_comment_syntax(const std::string& lang);
const std::vector<std::string>& builtin_comment_langs();

// Lazy line-by-line comment scanner. Purely lexical: comment markers inside
// string literals are reported like any other, and a two-character line
// marker directly after ':' is ignored so "http://x" is not a comment.
//
// The scanner keeps a pointer to `content`; the string must outlive it.
class CommentScanner {
public:
    CommentScanner(const std::string& content, CommentSyntax syntax);
    CommentScanner(std::string&&, CommentSyntax) = delete;

    // Fetch the next comment. Returns false once the input is exhausted.
    bool next(Comment& out);

    // Rewind to the start of the content.
    void reset();

private:
    bool read_line(std::string& line);
    void scan_line(const std::string& line, int line_no);
    size_t find_line_marker(const std::string& line, const std::string& marker,
                            size_t from) const;
    void emit(int line_no, const std::string& raw);

    const std::string* content_;
    CommentSyntax syntax_;

    size_t pos_ = 0;
    int line_no_ = 0;
    bool in_block_ = false;
    std::string block_end_;
    std::deque<Comment> pending_;
};

std::vector<Comment> extract_comments(const std::string& content,
                                      const CommentSyntax& syntax);

// True when `text` contains Hiragana, Katakana (including halfwidth and
// phonetic extensions) or CJK unified ideographs. Invalid UTF-8 sequences
// are skipped.
bool contains_japanese(const std::string& text);

} // namespace reclint
