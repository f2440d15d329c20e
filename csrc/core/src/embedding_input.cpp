#include "embedding_input.hpp"

#include "summary.hpp"
#include "utils.hpp"

namespace mdchunk {

std::string parent_embedding_text(const ParentChunk& parent) {
    return parent.summary + "\n\n" + parent.content;
}

std::string child_embedding_text(const ChildChunk& child, const ParentChunk* parent) {
    if (parent == nullptr) return child.content;
    return Join(parent->headers, kHeaderSeparator) + "\n\n" + child.content;
}

std::string chunk_embedding_text(const Chunk& chunk) {
    if (!chunk.has_code || chunk.headers.empty()) return chunk.content;
    return JoinLines(chunk.headers) + "\n\n" + chunk.content;
}

} // namespace mdchunk
