#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "chunk.hpp"
#include "map_params.hpp"

namespace mdchunk {

struct SemanticConfig {
    size_t target_size = 3000;
    size_t section_flush_min_size = 500;
    size_t code_flush_min_size = 300;

    void validate() const;
};

// Single-scale, non-overlapping section-aware chunking. Fenced code is held
// aside and joins the chunk only once its fence closes.
class SemanticSplitter {
public:
    static MapParams _default_params;

    explicit SemanticSplitter(std::optional<size_t> target_size = std::nullopt);
    explicit SemanticSplitter(const SemanticConfig& config);

    std::vector<Chunk> split(std::string_view document) const;

    const SemanticConfig& config() const { return _config; }

private:
    SemanticConfig _config;
};

} // namespace mdchunk
