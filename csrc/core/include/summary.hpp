#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mdchunk {

constexpr std::string_view kHeaderSeparator = " > ";
constexpr std::string_view kExcerptSeparator = " | ";
constexpr size_t kMinExcerptLineChars = 50;
constexpr size_t kMaxExcerptChars = 200;

// "H1 > H2 | first substantial line...". The excerpt is the first non-header,
// non-blank line longer than kMinExcerptLineChars characters, cut at
// kMaxExcerptChars characters with "..." appended when cut. Without such a
// line the summary is the joined headers alone.
std::string make_summary(std::string_view content, const std::vector<std::string>& headers);

} // namespace mdchunk
