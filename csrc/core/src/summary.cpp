#include "summary.hpp"

#include "markdown_scan.hpp"
#include "unicode_processor.hpp"
#include "utils.hpp"

namespace mdchunk {

std::string make_summary(std::string_view content, const std::vector<std::string>& headers) {
    std::string summary = Join(headers, kHeaderSeparator);

    for (const auto& line : SplitLines(content)) {
        if (is_header_line(line) || IsBlank(line)) continue;

        UnicodeProcessor processor(line);
        const size_t chars = processor.char_count();
        if (chars <= kMinExcerptLineChars) continue;

        summary += kExcerptSeparator;
        summary += processor.truncate(kMaxExcerptChars);
        if (chars > kMaxExcerptChars) summary += "...";
        break;
    }
    return summary;
}

} // namespace mdchunk
