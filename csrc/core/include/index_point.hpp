#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunk.hpp"

namespace mdchunk {

// One vector-store record: id, embedding and JSON payload.
struct IndexPoint {
    std::string id;
    std::vector<float> vector;
    nlohmann::json payload;

    nlohmann::json to_json() const;
};

// Vector-store writer. The concrete client lives outside this library.
class PointSink {
public:
    virtual ~PointSink() = default;
    virtual void upsert(const std::string& collection, const std::vector<IndexPoint>& points) = 0;
};

nlohmann::json parent_payload(const ParentChunk& parent, const std::string& source);

// `parent` may be null, in which case parent_summary is null.
nlohmann::json child_payload(const ChildChunk& child, const ParentChunk* parent, const std::string& source);

nlohmann::json chunk_payload(
    const Chunk& chunk, const std::string& source, size_t chunk_index, size_t total_chunks);

// "<base>_small", "<base>_medium", "<base>_large".
std::string tier_collection(const std::string& base, ChunkSize size);

} // namespace mdchunk
