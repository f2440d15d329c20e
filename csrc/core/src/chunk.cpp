#include "chunk.hpp"

#include <cstdio>
#include <stdexcept>
#include <unordered_set>

namespace mdchunk {

std::string to_string(ChunkType type) {
    switch (type) {
        case ChunkType::Code: return "code";
        case ChunkType::Text: return "text";
        case ChunkType::Header: return "header";
        case ChunkType::List: return "list";
        case ChunkType::Mixed: return "mixed";
    }
    return "text";
}

std::string to_string(ChunkSize size) {
    switch (size) {
        case ChunkSize::Small: return "small";
        case ChunkSize::Medium: return "medium";
        case ChunkSize::Large: return "large";
    }
    return "medium";
}

std::string text_hash_hex(std::string_view text) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(text_hash(text)));
    return std::string(buf);
}

ChunkIndex::ChunkIndex(const HierarchicalChunks& chunks) : _chunks(chunks) {
    _parent_pos.reserve(chunks.parents.size());
    for (size_t i = 0; i < chunks.parents.size(); ++i)
        _parent_pos.emplace(chunks.parents[i].id, i);

    _child_pos.reserve(chunks.children.size());
    for (size_t i = 0; i < chunks.children.size(); ++i)
        _child_pos.emplace(chunks.children[i].id, i);
}

const ParentChunk* ChunkIndex::find_parent(const std::string& id) const {
    auto it = _parent_pos.find(id);
    return it == _parent_pos.end() ? nullptr : &_chunks.parents[it->second];
}

const ChildChunk* ChunkIndex::find_child(const std::string& id) const {
    auto it = _child_pos.find(id);
    return it == _child_pos.end() ? nullptr : &_chunks.children[it->second];
}

const ParentChunk* ChunkIndex::parent_of(const ChildChunk& child) const {
    return find_parent(child.parent_id);
}

std::vector<const ChildChunk*> ChunkIndex::children_of(const ParentChunk& parent) const {
    std::vector<const ChildChunk*> out;
    out.reserve(parent.child_ids.size());
    for (const auto& id : parent.child_ids) {
        if (const auto* child = find_child(id)) out.push_back(child);
    }
    return out;
}

void ChunkIndex::verify() const {
    if (_parent_pos.size() != _chunks.parents.size())
        throw std::logic_error("Duplicate parent chunk id.");
    if (_child_pos.size() != _chunks.children.size())
        throw std::logic_error("Duplicate child chunk id.");

    std::unordered_set<std::string> listed;
    listed.reserve(_chunks.children.size());
    for (const auto& parent : _chunks.parents) {
        for (size_t i = 0; i < parent.child_ids.size(); ++i) {
            const auto* child = find_child(parent.child_ids[i]);
            if (child == nullptr)
                throw std::logic_error("Parent " + parent.id + " lists unknown child " + parent.child_ids[i]);
            if (child->parent_id != parent.id)
                throw std::logic_error("Child " + child->id + " does not point back to parent " + parent.id);
            if (child->index_in_parent != i)
                throw std::logic_error("Child " + child->id + " has index " +
                    std::to_string(child->index_in_parent) + ", expected " + std::to_string(i));
            if (!listed.insert(child->id).second)
                throw std::logic_error("Child " + child->id + " is listed twice.");
        }
    }

    for (const auto& child : _chunks.children) {
        if (parent_of(child) == nullptr)
            throw std::logic_error("Child " + child.id + " names unknown parent " + child.parent_id);
        if (listed.find(child.id) == listed.end())
            throw std::logic_error("Child " + child.id + " is not listed by its parent.");
    }
}

} // namespace mdchunk
