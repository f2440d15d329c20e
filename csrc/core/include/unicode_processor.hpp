#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utf8proc.h>

namespace mdchunk {

// Character-level view over UTF-8 text. A "character" is one code point; a
// byte that does not start a valid sequence counts as one character so that
// every offset handed out is a boundary the caller can slice at.
class UnicodeProcessor {
public:
    UnicodeProcessor(const std::string_view& text) : _text(text), _text_len(text.size()) {}

    size_t char_count() const;

    // False when any byte does not belong to a well-formed UTF-8 sequence.
    bool is_valid_utf8() const;

    // Longest prefix holding at most `max_chars` characters.
    std::string_view truncate(size_t max_chars) const;

    // Longest suffix holding at most `max_bytes` bytes that starts on a
    // character boundary.
    std::string_view tail_bytes(size_t max_bytes) const;

    // Smallest character boundary >= byte_pos (clamped to the text length).
    size_t ceil_char_boundary(size_t byte_pos) const;

private:
    using Utf8Visitor = std::function<bool(size_t offset, size_t byte_len, utf8proc_int32_t codepoint)>;

    // Stops early when the visitor returns false.
    void for_each_utf8_unit(const Utf8Visitor& visitor) const;

    std::string_view _text;
    size_t _text_len = 0;
};

inline std::string safe_truncate(std::string_view text, size_t max_chars) {
    return std::string(UnicodeProcessor(text).truncate(max_chars));
}

} // namespace mdchunk
