#include <reclint/lang/comment.hpp>
#include <cstdint>

namespace reclint {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\f\v");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\f\v");
    return s.substr(b, e - b + 1);
}

// ---------------------------------------------------------------------------
// Built-in syntaxes
// ---------------------------------------------------------------------------

Result<CommentSyntax> builtin_comment_syntax(const std::string& lang) {
    CommentSyntax syn;
    if (lang == "java" || lang == "kotlin") {
        syn.lines = {"//"};
        syn.blocks = {{"/*", "*/"}};
    } else if (lang == "rust") {
        syn.lines = {"//"};
        syn.blocks = {{"/*", "*/"}};
        syn.skip_prefixes = {"/", "!"};
    } else if (lang == "php") {
        syn.lines = {"//", "#"};
        syn.blocks = {{"/*", "*/"}};
    } else {
        return ReclintError{ReclintError::Config,
            "unknown comment language '" + lang + "'",
            "expected java, kotlin, rust or php, or use a custom syntax"};
    }
    return Result<CommentSyntax>::ok(std::move(syn));
}

const std::vector<std::string>& builtin_comment_langs() {
    static const std::vector<std::string> langs = {"java", "kotlin", "rust", "php"};
    return langs;
}

// ---------------------------------------------------------------------------
// CommentScanner
// ---------------------------------------------------------------------------

CommentScanner::CommentScanner(const std::string& content, CommentSyntax syntax)
    : content_(&content), syntax_(std::move(syntax)) {}

void CommentScanner::reset() {
    pos_ = 0;
    line_no_ = 0;
    in_block_ = false;
    block_end_.clear();
    pending_.clear();
}

bool CommentScanner::next(Comment& out) {
    std::string line;
    while (pending_.empty()) {
        if (!read_line(line)) return false;
        scan_line(line, line_no_);
    }
    out = std::move(pending_.front());
    pending_.pop_front();
    return true;
}

bool CommentScanner::read_line(std::string& line) {
    const std::string& src = *content_;
    if (pos_ >= src.size()) return false;

    size_t eol = src.find('\n', pos_);
    if (eol == std::string::npos) {
        line = src.substr(pos_);
        pos_ = src.size();
    } else {
        line = src.substr(pos_, eol - pos_);
        pos_ = eol + 1;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    ++line_no_;
    return true;
}

size_t CommentScanner::find_line_marker(const std::string& line,
                                        const std::string& marker,
                                        size_t from) const {
    if (marker.empty()) return std::string::npos;
    while (true) {
        size_t pos = line.find(marker, from);
        if (pos == std::string::npos) return pos;
        if (marker.size() == 2 && pos > 0 && line[pos - 1] == ':') {
            from = pos + 1;
            continue;
        }
        return pos;
    }
}

void CommentScanner::emit(int line_no, const std::string& raw) {
    std::string text = trim(raw);
    if (text.empty()) return;
    for (const auto& prefix : syntax_.skip_prefixes) {
        if (text.compare(0, prefix.size(), prefix) == 0) return;
    }
    pending_.push_back(Comment{line_no, std::move(text)});
}

void CommentScanner::scan_line(const std::string& line, int line_no) {
    size_t cursor = 0;

    if (in_block_) {
        size_t end = line.find(block_end_);
        if (end == std::string::npos) {
            emit(line_no, line);
            return;
        }
        emit(line_no, line.substr(0, end));
        cursor = end + block_end_.size();
        in_block_ = false;
        block_end_.clear();
    }

    while (cursor < line.size()) {
        size_t best = std::string::npos;
        const std::string* line_marker = nullptr;
        const BlockSyntax* block = nullptr;

        for (const auto& m : syntax_.lines) {
            size_t pos = find_line_marker(line, m, cursor);
            if (pos < best) {
                best = pos;
                line_marker = &m;
                block = nullptr;
            }
        }
        for (const auto& b : syntax_.blocks) {
            if (b.start.empty()) continue;
            size_t pos = line.find(b.start, cursor);
            if (pos < best) {
                best = pos;
                block = &b;
                line_marker = nullptr;
            }
        }

        if (best == std::string::npos) return;

        if (line_marker) {
            emit(line_no, line.substr(best + line_marker->size()));
            return;
        }

        size_t body = best + block->start.size();
        size_t end = line.find(block->end, body);
        if (end == std::string::npos) {
            emit(line_no, line.substr(body));
            in_block_ = true;
            block_end_ = block->end;
            return;
        }
        emit(line_no, line.substr(body, end - body));
        cursor = end + block->end.size();
    }
}

std::vector<Comment> extract_comments(const std::string& content,
                                      const CommentSyntax& syntax) {
    std::vector<Comment> out;
    CommentScanner scanner(content, syntax);
    Comment c;
    while (scanner.next(c)) {
        out.push_back(std::move(c));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Japanese detection
// ---------------------------------------------------------------------------

static bool is_japanese_code_point(uint32_t cp) {
    return (cp >= 0x3040 && cp <= 0x309F)     // Hiragana
        || (cp >= 0x30A0 && cp <= 0x30FF)     // Katakana
        || (cp >= 0x4E00 && cp <= 0x9FFF)     // CJK unified ideographs
        || (cp >= 0x31F0 && cp <= 0x31FF)     // Katakana phonetic extensions
        || (cp >= 0xFF65 && cp <= 0xFF9F);    // Halfwidth katakana
}

bool contains_japanese(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0;
        size_t len = 0;
        if (c < 0x80) { cp = c; len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else { ++i; continue; }

        if (i + len > text.size()) break;
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) { ++i; continue; }
        if (is_japanese_code_point(cp)) return true;
        i += len;
    }
    return false;
}

} // namespace reclint
