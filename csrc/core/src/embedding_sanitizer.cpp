#include "embedding_sanitizer.hpp"

#include <unordered_map>

#include <utf8proc.h>

namespace mdchunk {

namespace {

const std::unordered_map<char32_t, char>& replacement_table() {
    static const std::unordered_map<char32_t, char> table = {
        // Horizontal box drawing
        {U'─', '-'}, {U'━', '-'}, {U'┄', '-'}, {U'┅', '-'},
        {U'┈', '-'}, {U'┉', '-'}, {U'╌', '-'}, {U'╍', '-'},
        {U'═', '-'},
        // Vertical box drawing
        {U'│', '|'}, {U'┃', '|'}, {U'┆', '|'}, {U'┇', '|'},
        {U'┊', '|'}, {U'┋', '|'}, {U'╎', '|'}, {U'╏', '|'},
        {U'║', '|'},
        // Block elements
        {U'▀', '*'}, {U'▄', '*'}, {U'█', '*'}, {U'▌', '*'},
        {U'▐', '*'}, {U'░', '*'}, {U'▒', '*'}, {U'▓', '*'},
        // Arrows
        {U'→', '>'}, {U'⇒', '>'}, {U'➔', '>'}, {U'➜', '>'},
        {U'➞', '>'}, {U'➡', '>'},
        {U'←', '<'}, {U'⇐', '<'},
        {U'↑', '^'}, {U'⇑', '^'},
        {U'↓', 'v'}, {U'⇓', 'v'},
        // Check marks, crosses, stars
        {U'✓', 'Y'}, {U'✔', 'Y'}, {U'☑', 'Y'},
        {U'✗', 'X'}, {U'✘', 'X'}, {U'☒', 'X'},
        {U'★', '*'}, {U'☆', '*'}, {U'⭐', '*'},
        // Bullets
        {U'•', '-'}, {U'◦', '-'}, {U'‣', '-'}, {U'⁃', '-'},
        // Smart quotes
        {U'‘', '\''}, {U'’', '\''}, {U'‚', '\''}, {U'‛', '\''},
        {U'“', '"'}, {U'”', '"'}, {U'„', '"'}, {U'‟', '"'},
        // Dashes and ellipsis
        {U'–', '-'}, {U'—', '-'}, {U'―', '-'},
        {U'…', '.'},
        // Status emoji
        {U'\U0001F50D', ' '}, {U'\U0001F4E6', ' '}, {U'\U0001F3AF', ' '}, {U'✅', ' '},
        {U'❌', ' '}, {U'⚠', ' '}, {U'\U0001F4AD', ' '}, {U'\U0001F4C4', ' '},
        {U'\U0001F4CA', ' '}, {U'\U0001F4DA', ' '}, {U'\U0001F680', ' '}, {U'\U0001F4A1', ' '},
        {U'⏳', ' '}, {U'✨', ' '}, {U'\U0001F5A5', ' '}, {U'\U0001F528', ' '},
        {U'\U0001F527', ' '}, {U'\U0001F3F7', ' '}, {U'\U0001F504', ' '}, {U'▶', ' '},
        {U'\U0001F50E', ' '}, {U'\U0001F5D1', ' '}, {U'\U0001F4DC', ' '}, {U'⚙', ' '},
        {U'\U0001F3A5', ' '}, {U'\U0001F9EE', ' '}, {U'\U0001F4E4', ' '}, {U'\U0001F6D1', ' '},
    };
    return table;
}

// Corners, tees and crosses of both the light/heavy and the double box sets,
// plus the rounded corners.
bool is_box_junction(char32_t codepoint) {
    return (codepoint >= U'┌' && codepoint <= U'╋') ||
           (codepoint >= U'╒' && codepoint <= U'╰');
}

} // namespace

std::optional<char> ascii_replacement(char32_t codepoint) {
    const auto& table = replacement_table();
    auto it = table.find(codepoint);
    if (it != table.end()) return it->second;
    if (is_box_junction(codepoint)) return '+';
    return std::nullopt;
}

std::string sanitize_for_embedding(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    auto push = [&out](char c) {
        if (c == ' ' && !out.empty() && out.back() == ' ') return;
        out.push_back(c);
    };

    size_t i = 0;
    while (i < text.size()) {
        utf8proc_int32_t codepoint = -1;
        const utf8proc_ssize_t n = utf8proc_iterate(
            reinterpret_cast<const utf8proc_uint8_t*>(text.data() + i),
            static_cast<utf8proc_ssize_t>(text.size() - i),
            &codepoint);

        if (n <= 0) {
            // Not valid UTF-8: copy the byte through untouched.
            out.push_back(text[i]);
            i += 1;
            continue;
        }

        const size_t len = static_cast<size_t>(n);
        if (auto replacement = ascii_replacement(static_cast<char32_t>(codepoint))) {
            push(*replacement);
        } else if (len == 1) {
            push(text[i]);
        } else {
            out.append(text.data() + i, len);
        }
        i += len;
    }
    return out;
}

} // namespace mdchunk
