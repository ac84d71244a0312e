#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codebox {

// First ```js / ```javascript fenced block in `model_output` (tag matched
// without regard to case), trimmed.
// Returns nullopt when there is no such block or its body is blank.
std::optional<std::string> extract_code(const std::string& model_output);

// Narrow implicit-return rewrite: when `code` never calls finalAnswer( and
// has no top-level return, and its last non-empty line is a single-line
// expression statement at top level, that line becomes `return (<expr>);`.
// Anything else is returned unchanged.
std::string apply_lazy_return(const std::string& code);

// Cut `s` to at most `max_chars` UTF-8 characters, never inside a multi-byte
// sequence. Returns true when something was cut.
bool truncate_output(std::string& s, size_t max_chars);

std::string join_lines(const std::vector<std::string>& lines, const std::string& sep = "\n");

// Accumulates output lines so that their joined text never exceeds `cap`
// UTF-8 characters. The line that crosses the cap is cut so the joined text is
// exactly `cap` characters; later lines are dropped.
class CappedLines {
public:
    explicit CappedLines(size_t cap) : cap_(cap) {}

    void push(const std::string& line);

    std::vector<std::string> take() { return std::move(lines_); }
    bool truncated() const { return truncated_; }

private:
    size_t cap_;
    size_t used_{0};
    bool truncated_{false};
    std::vector<std::string> lines_;
};

} // namespace codebox
