#include <reclint/check.hpp>
#include <reclint/process.hpp>
#include <re2/re2.h>
#include <cstdint>

namespace reclint {

namespace fs = std::filesystem;

bool is_valid_utf8(const std::string& content) {
    size_t i = 0;
    const size_t n = content.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(content[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(content[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        std::string line;
        if (eol == std::string::npos) {
            line = content.substr(pos);
            pos = content.size();
        } else {
            line = content.substr(pos, eol - pos);
            pos = eol + 1;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<LineHit> check_text(const std::string& content, const TextRule& rule) {
    std::vector<LineHit> hits;
    auto lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        for (const auto& kw : rule.keywords) {
            size_t pos = lines[i].find(kw);
            if (pos != std::string::npos) {
                hits.push_back(LineHit{static_cast<int>(i + 1),
                                       static_cast<int>(pos + 1), lines[i]});
                break;
            }
        }
    }
    return hits;
}

std::vector<LineHit> check_regex(const std::string& content, const RegexRule& rule) {
    std::vector<LineHit> hits;
    auto lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        re2::StringPiece text(lines[i]);
        for (const auto& re : rule.patterns) {
            re2::StringPiece m;
            if (re->Match(text, 0, text.size(), re2::RE2::UNANCHORED, &m, 1)) {
                hits.push_back(LineHit{static_cast<int>(i + 1),
                                       static_cast<int>(m.data() - text.data() + 1), lines[i]});
                break;
            }
        }
    }
    return hits;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

Result<std::optional<std::string>> check_command(const fs::path& file, const CommandRule& rule) {
    auto args = expand_command(rule.exec, file.string());
    if (args.empty()) return Result<std::optional<std::string>>::ok(std::nullopt);

    auto run = run_command(args);
    if (run.is_err()) return std::move(run).error();

    const CommandResult& res = run.value();
    if (res.success()) return Result<std::optional<std::string>>::ok(std::nullopt);
    return Result<std::optional<std::string>>::ok(trim(res.stdout_str + res.stderr_str));
}

} // namespace reclint
