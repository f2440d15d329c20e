#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mdchunk {

// ASCII stand-in for a decorative code point, std::nullopt when the code point
// passes through unchanged. Status emoji map to ' '.
std::optional<char> ascii_replacement(char32_t codepoint);

// Rewrites box drawing, block shading, arrows, check marks, bullets, smart
// quotes, dashes, the ellipsis glyph and status emoji to ASCII, then collapses
// runs of spaces to a single space. Total over any input.
std::string sanitize_for_embedding(std::string_view text);

} // namespace mdchunk
