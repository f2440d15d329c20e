#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ingest_pipeline.hpp"

using namespace mdchunk;

namespace {

class ConstantEmbedder : public Embedder {
public:
    std::vector<float> embed(const std::string& text) override {
        ++calls;
        if (always_fail) throw EmbeddingError(EmbeddingError::Kind::Transient, "offline");
        return {static_cast<float>(text.size()), 1.0f};
    }

    size_t calls = 0;
    bool always_fail = false;
};

class RecordingSink : public PointSink {
public:
    void upsert(const std::string& collection, const std::vector<IndexPoint>& points) override {
        batches.emplace_back(collection, points);
    }

    std::vector<std::pair<std::string, std::vector<IndexPoint>>> batches;
};

struct Fixture {
    std::shared_ptr<ConstantEmbedder> embedder = std::make_shared<ConstantEmbedder>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();

    IngestPipeline pipeline(IngestOptions options = {}) {
        EmbeddingOptions embedding;
        embedding.max_attempts = 1;
        auto client = std::make_shared<EmbeddingClient>(
            embedder, embedding, [](std::chrono::milliseconds) {});
        return IngestPipeline(client, sink, std::move(options));
    }
};

std::string three_sections() {
    std::string out;
    for (const char* title : {"## One", "## Two", "## Three"}) {
        out += std::string(title) + "\n";
        for (int i = 0; i < 10; ++i) out += std::string(99, 'k') + "\n";
    }
    return out;
}

} // namespace

TEST(IngestPipeline, HierarchicalUploadsParentsThenChildren) {
    Fixture f;
    auto pipeline = f.pipeline(IngestOptions{"docs", 2});
    const auto report = pipeline.ingest(three_sections(), "guide.md", IngestMode::Hierarchical);

    EXPECT_EQ(report.parents, 3u);
    EXPECT_EQ(report.children, 3u);
    EXPECT_EQ(report.points, 6u);
    EXPECT_EQ(report.batches, 3u);
    EXPECT_EQ(f.embedder->calls, 6u);

    ASSERT_EQ(f.sink->batches.size(), 3u);
    for (const auto& [collection, points] : f.sink->batches) {
        EXPECT_EQ(collection, "docs");
        EXPECT_LE(points.size(), 2u);
    }
    const auto& first = f.sink->batches[0].second[0];
    EXPECT_EQ(first.payload["chunk_type"], "parent");
    EXPECT_EQ(first.payload["source"], "guide.md");
    EXPECT_EQ(first.vector.size(), 2u);

    const auto& last = f.sink->batches[2].second.back();
    EXPECT_EQ(last.payload["chunk_type"], "child_header");
    EXPECT_FALSE(last.payload["parent_summary"].is_null());
}

TEST(IngestPipeline, MultiScaleUsesTierCollections) {
    Fixture f;
    auto pipeline = f.pipeline(IngestOptions{"docs", 100});
    const auto report = pipeline.ingest("# Title\n\nshort body\n", "a.md", IngestMode::MultiScale);

    EXPECT_EQ(report.chunks, 3u);
    EXPECT_EQ(report.small_chunks, 1u);
    EXPECT_EQ(report.medium_chunks, 1u);
    EXPECT_EQ(report.large_chunks, 1u);
    ASSERT_EQ(f.sink->batches.size(), 3u);
    EXPECT_EQ(f.sink->batches[0].first, "docs_small");
    EXPECT_EQ(f.sink->batches[1].first, "docs_medium");
    EXPECT_EQ(f.sink->batches[2].first, "docs_large");

    const auto& medium = f.sink->batches[1].second.at(0);
    EXPECT_EQ(medium.payload["chunk_index"], 1);
    EXPECT_EQ(medium.payload["total_chunks"], 3);
    EXPECT_EQ(medium.id.size(), 36u);
}

TEST(IngestPipeline, SemanticUsesBaseCollection) {
    Fixture f;
    auto pipeline = f.pipeline();
    const auto report = pipeline.ingest("intro\n```\ncode\n```\n", "b.md", IngestMode::Semantic);
    EXPECT_EQ(report.chunks, 1u);
    EXPECT_EQ(report.chunks_with_code, 1u);
    ASSERT_EQ(f.sink->batches.size(), 1u);
    EXPECT_EQ(f.sink->batches[0].first, "documents");
}

TEST(IngestPipeline, EmptyDocumentUploadsNothing) {
    Fixture f;
    auto pipeline = f.pipeline();
    const auto report = pipeline.ingest("", "empty.md", IngestMode::Hierarchical);
    EXPECT_EQ(report.points, 0u);
    EXPECT_TRUE(f.sink->batches.empty());
}

TEST(IngestPipeline, EmbeddingFailureAbortsBeforeUpload) {
    Fixture f;
    f.embedder->always_fail = true;
    auto pipeline = f.pipeline();
    EXPECT_THROW(pipeline.ingest("# A\nbody\n", "c.md", IngestMode::Hierarchical), EmbeddingError);
    EXPECT_TRUE(f.sink->batches.empty());
}

TEST(IngestPipeline, CustomSplitter) {
    Fixture f;
    auto pipeline = f.pipeline();
    pipeline.set_semantic_splitter(SemanticSplitter(SemanticConfig{200, 500, 300}));
    std::string document;
    for (int i = 0; i < 8; ++i) document += std::string(60, 'w') + "\n\n";
    const auto report = pipeline.ingest(document, "d.md", IngestMode::Semantic);
    EXPECT_EQ(report.chunks, 2u);
}

TEST(IngestPipeline, RejectsBadOptions) {
    Fixture f;
    EXPECT_THROW(f.pipeline(IngestOptions{"docs", 0}), std::invalid_argument);
}
