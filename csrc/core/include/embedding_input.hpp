#pragma once

#include <string>

#include "chunk.hpp"

namespace mdchunk {

// Raw text handed to the embedder for each record kind, before sanitizing and
// truncation.

// "<summary>\n\n<content>"
std::string parent_embedding_text(const ParentChunk& parent);

// "<parent headers joined by ' > '>\n\n<content>", or the bare content when the
// parent is unknown.
std::string child_embedding_text(const ChildChunk& child, const ParentChunk* parent);

// Code-bearing chunks are prefixed with their header lines.
std::string chunk_embedding_text(const Chunk& chunk);

} // namespace mdchunk
