#pragma once

#include <cctype>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace mdchunk {

inline std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
    if (parts.empty()) return {};
    size_t total_len = separator.size() * (parts.size() - 1);
    for (const auto& part : parts) total_len += part.size();

    std::string out;
    out.reserve(total_len);
    out += parts.front();
    for (size_t i = 1; i < parts.size(); ++i) {
        out += separator;
        out += parts[i];
    }
    return out;
}

inline std::string JoinLines(const std::vector<std::string>& lines) {
    return Join(lines, "\n");
}

inline std::string_view TrimView(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

inline std::string Trim(std::string_view value) {
    return std::string(TrimView(value));
}

inline bool IsBlank(std::string_view value) {
    return TrimView(value).empty();
}

inline bool StartsWith(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

// Lines of `text` split on '\n'. A trailing '\r' is dropped from each line and
// a terminating newline does not produce an extra empty line.
inline std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        const size_t next = (end == std::string_view::npos) ? text.size() : end + 1;
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = next;
    }
    return lines;
}

inline std::string GenerateUUID() {
    static const char HEX_CHAR[] = "0123456789abcdef";
    static const int SEGS[] = {8, 4, 4, 4, 12};

    // Single static generator per thread.
    static thread_local std::mt19937 GEN(std::random_device{}());
    static thread_local std::uniform_int_distribution<int> DIST(0, 15);

    std::string out;
    out.reserve(36);
    for (int seg = 0; seg < 5; ++seg) {
        for (int i = 0; i < SEGS[seg]; ++i) {
            // Version nibble and RFC 4122 variant bits.
            if (seg == 2 && i == 0) out.push_back('4');
            else if (seg == 3 && i == 0) out.push_back(HEX_CHAR[8 + (DIST(GEN) & 0x3)]);
            else out.push_back(HEX_CHAR[DIST(GEN)]);
        }
        if (seg < 4)
            out.push_back('-');
    }
    return out;
}

} // namespace mdchunk
