#include "index_point.hpp"

namespace mdchunk {

using json = nlohmann::json;

json IndexPoint::to_json() const {
    return json{{"id", id}, {"vector", vector}, {"payload", payload}};
}

json parent_payload(const ParentChunk& parent, const std::string& source) {
    return json{
        {"text", parent.content},
        {"source", source},
        {"chunk_type", "parent"},
        {"summary", parent.summary},
        {"headers", parent.headers},
        {"child_ids", parent.child_ids},
        {"start_line", parent.start_line},
        {"end_line", parent.end_line},
        {"char_count", parent.content.size()},
        {"content_hash", text_hash_hex(parent.content)},
    };
}

json child_payload(const ChildChunk& child, const ParentChunk* parent, const std::string& source) {
    return json{
        {"text", child.content},
        {"source", source},
        {"chunk_type", "child_" + to_string(child.chunk_type)},
        {"parent_id", child.parent_id},
        {"parent_summary", parent != nullptr ? json(parent->summary) : json(nullptr)},
        {"index_in_parent", child.index_in_parent},
        {"start_line", child.start_line},
        {"end_line", child.end_line},
        {"char_count", child.content.size()},
        {"content_hash", text_hash_hex(child.content)},
    };
}

json chunk_payload(const Chunk& chunk, const std::string& source, size_t chunk_index, size_t total_chunks) {
    return json{
        {"text", chunk.content},
        {"source", source},
        {"chunk_index", chunk_index},
        {"total_chunks", total_chunks},
        {"chunk_size", to_string(chunk.chunk_size)},
        {"has_code", chunk.has_code},
        {"headers", chunk.headers},
        {"start_line", chunk.start_line},
        {"end_line", chunk.end_line},
        {"char_count", chunk.content.size()},
        {"content_hash", text_hash_hex(chunk.content)},
    };
}

std::string tier_collection(const std::string& base, ChunkSize size) {
    return base + "_" + to_string(size);
}

} // namespace mdchunk
