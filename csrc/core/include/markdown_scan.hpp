#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace mdchunk {

constexpr std::string_view kFenceToken = "```";
constexpr size_t kMaxHeaderDepth = 3;

// Number of leading '#' characters; 0 for a non-header line.
inline size_t header_level(std::string_view line) {
    size_t level = 0;
    while (level < line.size() && line[level] == '#') ++level;
    return level;
}

inline bool is_header_line(std::string_view line) {
    return !line.empty() && line.front() == '#';
}

inline bool is_fence_line(std::string_view line) {
    return StartsWith(TrimView(line), kFenceToken);
}

// "- item", "* item", "+ item", "1. item", "2) item".
inline bool is_list_item(std::string_view line) {
    const std::string_view trimmed = TrimView(line);
    if (trimmed.empty()) return false;

    auto marker_ends_at = [&trimmed](size_t pos) {
        return pos == trimmed.size() || trimmed[pos] == ' ' || trimmed[pos] == '\t';
    };

    const char first = trimmed.front();
    if (first == '-' || first == '*' || first == '+') return marker_ends_at(1);

    size_t digits = 0;
    while (digits < trimmed.size() && trimmed[digits] >= '0' && trimmed[digits] <= '9') ++digits;
    if (digits == 0 || digits >= trimmed.size()) return false;
    if (trimmed[digits] != '.' && trimmed[digits] != ')') return false;
    return marker_ends_at(digits + 1);
}

// Blank line, or a line followed by a header. With `end_is_break` the last
// line of the sequence is a break as well.
inline bool is_natural_break(
    const std::vector<std::string_view>& lines, size_t i, bool end_is_break = false)
{
    if (IsBlank(lines[i])) return true;
    if (i + 1 < lines.size()) return is_header_line(lines[i + 1]);
    return end_is_break;
}

// Section context: H1/H2 replace the whole stack, deeper headers append while
// fewer than kMaxHeaderDepth entries are held.
class HeaderStack {
public:
    void update(std::string_view line) {
        const size_t level = header_level(line);
        if (level == 0) return;
        if (level <= 2) {
            _headers.assign(1, std::string(line));
        } else if (_headers.size() < kMaxHeaderDepth) {
            _headers.emplace_back(line);
        }
    }

    const std::vector<std::string>& headers() const { return _headers; }
    bool empty() const { return _headers.empty(); }

private:
    std::vector<std::string> _headers;
};

class FenceTracker {
public:
    // Returns true when `line` is a fence line. Must be fed every line in order.
    bool observe(std::string_view line, size_t line_index) {
        if (!is_fence_line(line)) return false;
        _in_code_block = !_in_code_block;
        _last_fence_line = line_index;
        return true;
    }

    bool in_code_block() const { return _in_code_block; }
    const std::optional<size_t>& last_fence_line() const { return _last_fence_line; }

private:
    bool _in_code_block = false;
    std::optional<size_t> _last_fence_line;
};

} // namespace mdchunk
