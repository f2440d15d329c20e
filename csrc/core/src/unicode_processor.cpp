#include "unicode_processor.hpp"

namespace mdchunk {

void UnicodeProcessor::for_each_utf8_unit(const Utf8Visitor& visitor) const {
    size_t i = 0;
    while (i < _text_len) {
        utf8proc_int32_t codepoint = -1;
        const utf8proc_ssize_t n = utf8proc_iterate(
            reinterpret_cast<const utf8proc_uint8_t*>(_text.data() + i),
            static_cast<utf8proc_ssize_t>(_text_len - i),
            &codepoint);

        // Malformed byte: report it as a one byte unit and resync.
        const size_t byte_len = n <= 0 ? 1 : static_cast<size_t>(n);
        if (!visitor(i, byte_len, n <= 0 ? -1 : codepoint)) return;
        i += byte_len;
    }
}

size_t UnicodeProcessor::char_count() const {
    size_t count = 0;
    for_each_utf8_unit([&](size_t, size_t, utf8proc_int32_t) {
        ++count;
        return true;
    });
    return count;
}

bool UnicodeProcessor::is_valid_utf8() const {
    bool valid = true;
    for_each_utf8_unit([&](size_t, size_t, utf8proc_int32_t codepoint) {
        valid = codepoint >= 0;
        return valid;
    });
    return valid;
}

std::string_view UnicodeProcessor::truncate(size_t max_chars) const {
    if (max_chars >= _text_len) return _text; // never more characters than bytes

    size_t seen = 0;
    size_t cut = _text_len;
    for_each_utf8_unit([&](size_t offset, size_t, utf8proc_int32_t) {
        if (seen == max_chars) {
            cut = offset;
            return false;
        }
        ++seen;
        return true;
    });
    return _text.substr(0, cut);
}

size_t UnicodeProcessor::ceil_char_boundary(size_t byte_pos) const {
    if (byte_pos == 0) return 0;
    if (byte_pos >= _text_len) return _text_len;

    size_t boundary = _text_len;
    for_each_utf8_unit([&](size_t offset, size_t, utf8proc_int32_t) {
        if (offset >= byte_pos) {
            boundary = offset;
            return false;
        }
        return true;
    });
    return boundary;
}

std::string_view UnicodeProcessor::tail_bytes(size_t max_bytes) const {
    if (max_bytes >= _text_len) return _text;
    return _text.substr(ceil_char_boundary(_text_len - max_bytes));
}

} // namespace mdchunk
