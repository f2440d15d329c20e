#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "embedding.hpp"
#include "hierarchical_splitter.hpp"
#include "index_point.hpp"
#include "multi_scale_splitter.hpp"
#include "semantic_splitter.hpp"

namespace mdchunk {

enum class IngestMode { Hierarchical, MultiScale, Semantic };

struct IngestOptions {
    std::string collection = "documents";
    size_t batch_size = 100;
};

struct IngestReport {
    size_t parents = 0;
    size_t children = 0;
    size_t code_children = 0;
    size_t mixed_children = 0;
    size_t chunks = 0;
    size_t small_chunks = 0;
    size_t medium_chunks = 0;
    size_t large_chunks = 0;
    size_t chunks_with_code = 0;
    size_t points = 0;
    size_t batches = 0;
};

// Segments one document, embeds every chunk and hands the resulting points to
// a sink in batches. Any embedding or sink failure aborts the run.
class IngestPipeline {
public:
    IngestPipeline(
        std::shared_ptr<EmbeddingClient> client,
        std::shared_ptr<PointSink> sink,
        IngestOptions options = {});

    IngestReport ingest(std::string_view document, const std::string& source, IngestMode mode) const;

    IngestPipeline& set_hierarchical_splitter(const HierarchicalSplitter& splitter) {
        _hierarchical = splitter;
        return *this;
    }
    IngestPipeline& set_multi_scale_splitter(const MultiScaleSplitter& splitter) {
        _multi_scale = splitter;
        return *this;
    }
    IngestPipeline& set_semantic_splitter(const SemanticSplitter& splitter) {
        _semantic = splitter;
        return *this;
    }

private:
    IngestReport ingest_hierarchical(std::string_view document, const std::string& source) const;
    IngestReport ingest_chunks(
        const std::vector<Chunk>& chunks, const std::string& source, bool per_tier) const;
    void upload(const std::string& collection, const std::vector<IndexPoint>& points, IngestReport& report) const;

    std::shared_ptr<EmbeddingClient> _client;
    std::shared_ptr<PointSink> _sink;
    IngestOptions _options;
    HierarchicalSplitter _hierarchical;
    MultiScaleSplitter _multi_scale;
    SemanticSplitter _semantic;
};

} // namespace mdchunk
