#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chunk.hpp"

namespace mdchunk {

// Splits one parent's content into typed children. A fenced code block is
// never torn across two children: flushing only happens outside a fence.
class ChildSplitter {
public:
    ChildSplitter(size_t child_target_size, size_t code_flush_min_size)
        : _child_target_size(child_target_size), _code_flush_min_size(code_flush_min_size) {}

    // `parent_start_line` is added to every local line number so that the
    // children index the whole document.
    std::vector<ChildChunk> split(
        std::string_view parent_content,
        const std::string& parent_id,
        size_t parent_start_line) const;

    size_t child_target_size() const { return _child_target_size; }
    size_t code_flush_min_size() const { return _code_flush_min_size; }

private:
    size_t _child_target_size;
    size_t _code_flush_min_size;
};

} // namespace mdchunk
