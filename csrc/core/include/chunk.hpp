#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <xxhash.h>

namespace mdchunk {

enum class ChunkType { Code, Text, Header, List, Mixed };
enum class ChunkSize { Small, Medium, Large };

std::string to_string(ChunkType type);
std::string to_string(ChunkSize size);

inline uint64_t text_hash(std::string_view text) {
    return static_cast<uint64_t>(XXH64(text.data(), text.size(), 0));
}

// 16 lowercase hex digits.
std::string text_hash_hex(std::string_view text);

// Section-scoped span that gives retrieval context to its children.
struct ParentChunk {
    std::string id;
    std::string content;
    size_t start_line = 0;
    size_t end_line = 0;
    std::vector<std::string> headers;
    std::vector<std::string> child_ids;
    std::string summary;

    uint64_t content_hash() const { return text_hash(content); }
};

// Precisely scoped span inside a parent. Line numbers index the whole document.
struct ChildChunk {
    std::string id;
    std::string parent_id;
    std::string content;
    size_t start_line = 0;
    size_t end_line = 0;
    ChunkType chunk_type = ChunkType::Text;
    size_t index_in_parent = 0;

    uint64_t content_hash() const { return text_hash(content); }
};

// Output of the multi-scale and semantic segmenters. No parent/child linkage.
struct Chunk {
    std::string content;
    size_t start_line = 0;
    size_t end_line = 0;
    ChunkSize chunk_size = ChunkSize::Medium;
    bool has_code = false;
    std::vector<std::string> headers;

    uint64_t content_hash() const { return text_hash(content); }
};

struct HierarchicalChunks {
    std::vector<ParentChunk> parents;
    std::vector<ChildChunk> children;
};

// Id lookup over a segmentation result. Holds references into `chunks`, which
// must outlive the index.
class ChunkIndex {
public:
    explicit ChunkIndex(const HierarchicalChunks& chunks);

    const ParentChunk* find_parent(const std::string& id) const;
    const ChildChunk* find_child(const std::string& id) const;
    const ParentChunk* parent_of(const ChildChunk& child) const;
    std::vector<const ChildChunk*> children_of(const ParentChunk& parent) const;

    // Throws std::logic_error when ids collide, a child names a missing parent,
    // a parent lists a missing or foreign child, a child is listed by no parent
    // or sibling indices are not 0..N-1 in order.
    void verify() const;

private:
    const HierarchicalChunks& _chunks;
    std::unordered_map<std::string, size_t> _parent_pos;
    std::unordered_map<std::string, size_t> _child_pos;
};

} // namespace mdchunk
