#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "chunk.hpp"
#include "map_params.hpp"

namespace mdchunk {

struct TierConfig {
    ChunkSize chunk_size = ChunkSize::Medium;
    size_t target_size = 3000;
    size_t overlap = 500;

    void validate() const;
};

// Three independent overlapping passes over the same document. Adjacent chunks
// of one tier share up to `overlap` trailing bytes of the earlier chunk.
class MultiScaleSplitter {
public:
    static MapParams _default_params;

    // Small 1000/200, Medium 3000/500, Large 6000/1000, each overridable
    // through "<tier>_target_size" / "<tier>_overlap" defaults.
    static std::vector<TierConfig> default_tiers();

    MultiScaleSplitter() : MultiScaleSplitter(default_tiers()) {}
    explicit MultiScaleSplitter(std::vector<TierConfig> tiers);

    // All tiers, in configuration order.
    std::vector<Chunk> split(std::string_view document) const;

    std::vector<Chunk> split_tier(std::string_view document, const TierConfig& tier) const;

    const std::vector<TierConfig>& tiers() const { return _tiers; }

private:
    std::vector<TierConfig> _tiers;
};

} // namespace mdchunk
