#include "ingest_pipeline.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "embedding_input.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace mdchunk {

IngestPipeline::IngestPipeline(
    std::shared_ptr<EmbeddingClient> client,
    std::shared_ptr<PointSink> sink,
    IngestOptions options)
    : _client(std::move(client)), _sink(std::move(sink)), _options(std::move(options))
{
    if (!_client) throw std::invalid_argument("IngestPipeline needs an embedding client.");
    if (!_sink) throw std::invalid_argument("IngestPipeline needs a point sink.");
    if (_options.batch_size == 0) throw std::invalid_argument("batch_size should be > 0.");
}

IngestReport IngestPipeline::ingest(std::string_view document, const std::string& source, IngestMode mode) const {
    switch (mode) {
        case IngestMode::Hierarchical:
            return ingest_hierarchical(document, source);
        case IngestMode::MultiScale:
            return ingest_chunks(_multi_scale.split(document), source, true);
        case IngestMode::Semantic:
            return ingest_chunks(_semantic.split(document), source, false);
    }
    throw std::invalid_argument("Unknown ingest mode.");
}

IngestReport IngestPipeline::ingest_hierarchical(std::string_view document, const std::string& source) const {
    IngestReport report;
    const HierarchicalChunks chunks = _hierarchical.split(document);
    const ChunkIndex index(chunks);
    index.verify();

    report.parents = chunks.parents.size();
    report.children = chunks.children.size();
    for (const auto& child : chunks.children) {
        if (child.chunk_type == ChunkType::Code) ++report.code_children;
        else if (child.chunk_type == ChunkType::Mixed) ++report.mixed_children;
    }
    logger()->info("{}: {} parent chunks, {} child chunks ({} code, {} mixed)",
        source, report.parents, report.children, report.code_children, report.mixed_children);

    std::vector<IndexPoint> points;
    points.reserve(chunks.parents.size() + chunks.children.size());

    for (size_t i = 0; i < chunks.parents.size(); ++i) {
        const auto& parent = chunks.parents[i];
        logger()->debug("embedding parent {}/{}", i + 1, chunks.parents.size());
        points.push_back(IndexPoint{
            parent.id,
            _client->embed(parent_embedding_text(parent)),
            parent_payload(parent, source)});
    }

    for (size_t i = 0; i < chunks.children.size(); ++i) {
        const auto& child = chunks.children[i];
        const ParentChunk* parent = index.parent_of(child);
        logger()->debug("embedding child {}/{}", i + 1, chunks.children.size());
        points.push_back(IndexPoint{
            child.id,
            _client->embed(child_embedding_text(child, parent)),
            child_payload(child, parent, source)});
    }

    upload(_options.collection, points, report);
    return report;
}

IngestReport IngestPipeline::ingest_chunks(
    const std::vector<Chunk>& chunks, const std::string& source, bool per_tier) const
{
    IngestReport report;
    report.chunks = chunks.size();
    for (const auto& chunk : chunks) {
        if (chunk.has_code) ++report.chunks_with_code;
        switch (chunk.chunk_size) {
            case ChunkSize::Small: ++report.small_chunks; break;
            case ChunkSize::Medium: ++report.medium_chunks; break;
            case ChunkSize::Large: ++report.large_chunks; break;
        }
    }
    logger()->info("{}: {} chunks ({} small, {} medium, {} large, {} with code)",
        source, report.chunks, report.small_chunks, report.medium_chunks,
        report.large_chunks, report.chunks_with_code);

    // Collections in first-seen order so tiers upload small to large.
    std::vector<std::pair<std::string, std::vector<IndexPoint>>> groups;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        const std::string collection =
            per_tier ? tier_collection(_options.collection, chunk.chunk_size) : _options.collection;

        auto it = std::find_if(groups.begin(), groups.end(),
            [&collection](const auto& group) { return group.first == collection; });
        if (it == groups.end()) {
            groups.emplace_back(collection, std::vector<IndexPoint>{});
            it = std::prev(groups.end());
        }

        logger()->debug("embedding chunk {}/{}", i + 1, chunks.size());
        it->second.push_back(IndexPoint{
            GenerateUUID(),
            _client->embed(chunk_embedding_text(chunk)),
            chunk_payload(chunk, source, i, chunks.size())});
    }

    for (const auto& [collection, points] : groups) upload(collection, points, report);
    return report;
}

void IngestPipeline::upload(
    const std::string& collection, const std::vector<IndexPoint>& points, IngestReport& report) const
{
    const size_t total_batches = (points.size() + _options.batch_size - 1) / _options.batch_size;
    for (size_t start = 0, batch = 0; start < points.size(); start += _options.batch_size, ++batch) {
        const size_t end = std::min(start + _options.batch_size, points.size());
        std::vector<IndexPoint> slice(points.begin() + static_cast<std::ptrdiff_t>(start),
                                      points.begin() + static_cast<std::ptrdiff_t>(end));
        logger()->info("uploading batch {}/{} ({} points) to {}", batch + 1, total_batches, slice.size(), collection);
        _sink->upsert(collection, slice);
        ++report.batches;
        report.points += slice.size();
    }
}

} // namespace mdchunk
