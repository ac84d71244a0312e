#include "codebox/extract.h"

#include <cctype>
#include <cstring>

namespace codebox {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool starts_with_word(const std::string& s, const char* w) {
    size_t n = std::strlen(w);
    if (s.compare(0, n, w) != 0) return false;
    if (s.size() == n) return true;
    char c = s[n];
    return !(std::isalnum((unsigned char)c) || c == '_' || c == '$');
}

// Bracket depth tracking that skips string literals and comments. Template
// literal interpolation is treated as part of the string.
struct DepthScanner {
    int depth{0};
    bool unbalanced{false};
    char quote{0};
    bool block_comment{false};

    void feed_line(const std::string& line) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (block_comment) {
                if (c == '*' && i + 1 < line.size() && line[i + 1] == '/') { block_comment = false; ++i; }
                continue;
            }
            if (quote) {
                if (c == '\\') { ++i; continue; }
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') break;
            if (c == '/' && i + 1 < line.size() && line[i + 1] == '*') { block_comment = true; ++i; continue; }
            if (c == '"' || c == '\'' || c == '`') { quote = c; continue; }
            if (c == '(' || c == '[' || c == '{') ++depth;
            else if (c == ')' || c == ']' || c == '}') {
                if (--depth < 0) { unbalanced = true; depth = 0; }
            }
        }
        // single/double quoted strings do not span lines
        if (quote == '"' || quote == '\'') quote = 0;
    }

    bool top_level() const { return depth == 0 && !quote && !block_comment; }
};

const char* const kStatementKeywords[] = {
    "const", "let", "var", "function", "class", "if", "else", "for", "while",
    "do", "switch", "case", "default", "try", "catch", "finally", "return",
    "throw", "break", "continue", "import", "export", "async", "yield",
};

bool is_operator_tail(char c) {
    return std::strchr("+-*/%=&|<>?:,.!^~({[", c) != nullptr;
}

// ASCII-case-insensitive match of `tag` at `pos`.
bool tag_at(const std::string& s, size_t pos, const char* tag) {
    size_t n = std::strlen(tag);
    if (pos > s.size() || s.size() - pos < n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower((unsigned char)s[pos + i]) != tag[i]) return false;
    }
    return true;
}

bool utf8_continuation(char c) { return ((unsigned char)c & 0xC0) == 0x80; }

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!utf8_continuation(c)) ++n;
    }
    return n;
}

// Byte length of the first `chars` code points of `s`; never splits a sequence.
size_t utf8_prefix_bytes(const std::string& s, size_t chars) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (utf8_continuation(s[i])) continue;
        if (seen == chars) return i;
        ++seen;
    }
    return s.size();
}

} // namespace

std::optional<std::string> extract_code(const std::string& model_output) {
    static const char* const kTags[] = {"js\n", "javascript\n"};

    size_t pos = 0;
    while ((pos = model_output.find("```", pos)) != std::string::npos) {
        size_t after = pos + 3;
        for (const char* tag : kTags) {
            size_t n = std::strlen(tag);
            if (!tag_at(model_output, after, tag)) continue;
            size_t body = after + n;
            // body is at least one character, closed by "\n```"
            size_t close = model_output.find("\n```", body + 1);
            if (close == std::string::npos) return std::nullopt;
            std::string code = trim(model_output.substr(body, close - body));
            if (code.empty()) return std::nullopt;
            return code;
        }
        pos = after;
    }
    return std::nullopt;
}

std::string apply_lazy_return(const std::string& code) {
    if (code.find("finalAnswer(") != std::string::npos) return code;

    std::vector<std::string> lines;
    {
        size_t start = 0;
        while (start <= code.size()) {
            size_t nl = code.find('\n', start);
            if (nl == std::string::npos) { lines.push_back(code.substr(start)); break; }
            lines.push_back(code.substr(start, nl - start));
            start = nl + 1;
        }
    }

    int last = -1;
    for (int i = (int)lines.size() - 1; i >= 0; --i) {
        if (!trim(lines[(size_t)i]).empty()) { last = i; break; }
    }
    if (last < 0) return code;

    DepthScanner scan;
    int prev = -1;
    for (int i = 0; i < last; ++i) {
        std::string t = trim(lines[(size_t)i]);
        if (scan.top_level() && starts_with_word(t, "return")) return code;
        scan.feed_line(lines[(size_t)i]);
        if (!t.empty()) prev = i;
    }
    if (!scan.top_level() || scan.unbalanced) return code;

    if (prev >= 0) {
        std::string p = trim(lines[(size_t)prev]);
        // a comment line cannot continue an expression
        if (p.compare(0, 2, "//") != 0 && is_operator_tail(p.back())) return code;
    }

    std::string expr = trim(lines[(size_t)last]);
    while (!expr.empty() && (expr.back() == ';' || std::isspace((unsigned char)expr.back()))) expr.pop_back();
    if (expr.empty()) return code;
    if (expr.compare(0, 2, "//") == 0 || expr.compare(0, 2, "/*") == 0) return code;
    if (expr.find("//") != std::string::npos || expr.find(';') != std::string::npos) return code;
    if (is_operator_tail(expr.front()) && expr.front() != '(' && expr.front() != '[' && expr.front() != '!') return code;
    if (expr.front() == '{' || expr.front() == '}') return code;
    for (const char* kw : kStatementKeywords) {
        if (starts_with_word(expr, kw)) return code;
    }
    char tail = expr.back();
    if (tail == '{' || tail == '}' || (is_operator_tail(tail) && tail != ')' && tail != ']')) return code;

    DepthScanner line_scan;
    line_scan.feed_line(expr);
    if (!line_scan.top_level() || line_scan.unbalanced) return code;

    size_t indent = lines[(size_t)last].find_first_not_of(" \t");
    lines[(size_t)last] = lines[(size_t)last].substr(0, indent) + "return (" + expr + ");";

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

bool truncate_output(std::string& s, size_t max_chars) {
    size_t cut = utf8_prefix_bytes(s, max_chars);
    if (cut >= s.size()) return false;
    s.resize(cut);
    return true;
}

std::string join_lines(const std::vector<std::string>& lines, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += sep;
        out += lines[i];
    }
    return out;
}

void CappedLines::push(const std::string& line) {
    if (truncated_) return;
    size_t sep = lines_.empty() ? 0 : 1;
    size_t len = utf8_length(line);
    if (used_ + sep + len <= cap_) {
        lines_.push_back(line);
        used_ += sep + len;
        return;
    }
    truncated_ = true;
    if (used_ + sep >= cap_) {
        // No room for even one character of this line. A lone separator
        // would still count, so pad with an empty line only when it fits exactly.
        if (used_ + sep == cap_ && sep) {
            lines_.emplace_back();
            used_ = cap_;
        }
        return;
    }
    size_t room = cap_ - used_ - sep;
    lines_.push_back(line.substr(0, utf8_prefix_bytes(line, room)));
    used_ = cap_;
}

} // namespace codebox
