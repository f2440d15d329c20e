#include "multi_scale_splitter.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

#include "logging.hpp"
#include "markdown_scan.hpp"
#include "unicode_processor.hpp"
#include "utils.hpp"

namespace mdchunk {

MapParams MultiScaleSplitter::_default_params("MDCHUNK_");

void TierConfig::validate() const {
    if (target_size == 0)
        throw std::invalid_argument("Tier " + to_string(chunk_size) + ": target size should be > 0.");
    if (overlap >= target_size) {
        throw std::invalid_argument(
            "Tier " + to_string(chunk_size) + ": got a larger chunk overlap (" + std::to_string(overlap) +
            ") than target size (" + std::to_string(target_size) + "), should be smaller.");
    }
}

std::vector<TierConfig> MultiScaleSplitter::default_tiers() {
    auto tier = [](ChunkSize size, size_t target, size_t overlap) {
        const std::string name = to_string(size);
        return TierConfig{
            size,
            _default_params.get_param_value(name + "_target_size", std::nullopt, target),
            _default_params.get_param_value(name + "_overlap", std::nullopt, overlap)};
    };
    return {
        tier(ChunkSize::Small, 1000, 200),
        tier(ChunkSize::Medium, 3000, 500),
        tier(ChunkSize::Large, 6000, 1000),
    };
}

MultiScaleSplitter::MultiScaleSplitter(std::vector<TierConfig> tiers) : _tiers(std::move(tiers)) {
    if (_tiers.empty()) throw std::invalid_argument("MultiScaleSplitter needs at least one tier.");
    for (const auto& tier : _tiers) tier.validate();
}

std::vector<Chunk> MultiScaleSplitter::split(std::string_view document) const {
    std::vector<Chunk> chunks;
    for (const auto& tier : _tiers) {
        auto tier_chunks = split_tier(document, tier);
        chunks.insert(chunks.end(),
            std::make_move_iterator(tier_chunks.begin()), std::make_move_iterator(tier_chunks.end()));
    }
    return chunks;
}

std::vector<Chunk> MultiScaleSplitter::split_tier(std::string_view document, const TierConfig& tier) const {
    std::vector<Chunk> chunks;
    const auto lines = SplitLines(document);

    std::string buffer;
    size_t start_line = 0;
    bool has_code = false;
    // Whether non-blank text arrived since the last close; a trailing overlap
    // seed alone is not worth another chunk.
    bool has_fresh_text = false;
    HeaderStack headers;
    FenceTracker fence;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        const bool was_in_code = fence.in_code_block();
        const bool is_fence = fence.observe(line, i);

        if (!was_in_code && !is_fence) headers.update(line);
        if (is_fence && fence.in_code_block()) has_code = true;

        buffer.append(line);
        buffer.push_back('\n');
        if (!IsBlank(line)) has_fresh_text = true;

        if (buffer.size() < tier.target_size || fence.in_code_block() ||
            !is_natural_break(lines, i, true)) {
            continue;
        }

        Chunk chunk;
        chunk.content = buffer;
        chunk.start_line = start_line;
        chunk.end_line = i;
        chunk.chunk_size = tier.chunk_size;
        chunk.has_code = has_code;
        chunk.headers = headers.headers();
        chunks.push_back(std::move(chunk));

        // Seed the next chunk with the tail of this one, starting on a
        // character boundary. The seed always ends with the newline of line i,
        // so its line count tells where the next chunk starts.
        const std::string seed(UnicodeProcessor(buffer).tail_bytes(tier.overlap));
        const size_t seed_lines = static_cast<size_t>(std::count(seed.begin(), seed.end(), '\n'));
        start_line = i + 1 - seed_lines;
        buffer = seed;
        has_code = fence.in_code_block();
        has_fresh_text = false;
    }

    if (has_fresh_text && !IsBlank(buffer)) {
        Chunk chunk;
        chunk.content = std::move(buffer);
        chunk.start_line = start_line;
        chunk.end_line = lines.size() - 1;
        chunk.chunk_size = tier.chunk_size;
        chunk.has_code = has_code;
        chunk.headers = headers.headers();
        chunks.push_back(std::move(chunk));
    }

    logger()->debug("multi-scale split ({} target {} overlap {}): {} chunks",
        to_string(tier.chunk_size), tier.target_size, tier.overlap, chunks.size());
    return chunks;
}

} // namespace mdchunk
