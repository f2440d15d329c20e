#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "child_splitter.hpp"
#include "chunk.hpp"
#include "map_params.hpp"

namespace mdchunk {

// Sizes are bytes of accumulated text.
struct HierarchicalConfig {
    size_t parent_target_size = 1800;
    size_t min_parent_size = 900;
    size_t child_target_size = 1200;
    size_t code_flush_min_size = 300;
    size_t break_lookback_lines = 5;

    void validate() const;
};

class HierarchicalSplitter {
public:
    static MapParams _default_params;

    explicit HierarchicalSplitter(
        std::optional<size_t> parent_target_size = std::nullopt,
        std::optional<size_t> min_parent_size = std::nullopt,
        std::optional<size_t> child_target_size = std::nullopt);

    explicit HierarchicalSplitter(const HierarchicalConfig& config);

    HierarchicalChunks split(std::string_view document) const;

    const HierarchicalConfig& config() const { return _config; }
    const ChildSplitter& child_splitter() const { return _child_splitter; }

private:
    HierarchicalConfig _config;
    ChildSplitter _child_splitter;
};

} // namespace mdchunk
