#include "child_splitter.hpp"

#include "markdown_scan.hpp"
#include "utils.hpp"

namespace mdchunk {

namespace {

// Running state of one pass. The scan is either accumulating prose or
// accumulating code (fence.in_code_block()); emit() is the only way out of a
// pending buffer and is never called while inside a fence.
struct ChildScanState {
    std::string buffer;
    size_t chunk_start = 0;
    ChunkType chunk_type = ChunkType::Text;
    bool has_code = false;
    FenceTracker fence;

    ChunkType flushed_type() const { return has_code ? ChunkType::Mixed : chunk_type; }

    void classify(std::string_view line) {
        if (is_header_line(line)) {
            chunk_type = ChunkType::Header;
        } else if (is_list_item(line)) {
            chunk_type = ChunkType::List;
        } else if (chunk_type == ChunkType::Code) {
            chunk_type = ChunkType::Text;
        }
    }
};

} // namespace

std::vector<ChildChunk> ChildSplitter::split(
    std::string_view parent_content,
    const std::string& parent_id,
    size_t parent_start_line) const
{
    std::vector<ChildChunk> children;
    const auto lines = SplitLines(parent_content);
    ChildScanState state;

    auto emit = [&](size_t end_line, ChunkType type) {
        ChildChunk child;
        child.id = GenerateUUID();
        child.parent_id = parent_id;
        child.content = std::move(state.buffer);
        child.start_line = parent_start_line + state.chunk_start;
        child.end_line = parent_start_line + end_line;
        child.chunk_type = type;
        child.index_in_parent = children.size();
        children.push_back(std::move(child));
        state.buffer.clear();
        state.has_code = false;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];

        const bool was_in_code = state.fence.in_code_block();
        if (state.fence.observe(line, i)) {
            if (!was_in_code) {
                // Opening fence: flush substantial prose so the code starts a
                // fresh child.
                if (state.buffer.size() > _code_flush_min_size) {
                    emit(i - 1, state.flushed_type());
                    state.chunk_start = i;
                }
                state.chunk_type = ChunkType::Code;
            } else {
                state.has_code = true;
            }
        }

        if (!state.fence.in_code_block()) state.classify(line);

        state.buffer.append(line);
        state.buffer.push_back('\n');

        if (!state.fence.in_code_block() && state.buffer.size() >= _child_target_size &&
            is_natural_break(lines, i)) {
            emit(i, state.flushed_type());
            state.chunk_start = i + 1;
            state.chunk_type = ChunkType::Text;
        }
    }

    if (!IsBlank(state.buffer)) emit(lines.size() - 1, state.flushed_type());

    return children;
}

} // namespace mdchunk
