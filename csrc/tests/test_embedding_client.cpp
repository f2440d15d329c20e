#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "embedding.hpp"

using mdchunk::Embedder;
using mdchunk::EmbeddingClient;
using mdchunk::EmbeddingError;
using mdchunk::EmbeddingOptions;

namespace {

enum class Outcome { Ok, Transient, Terminal, Empty, Runtime };

// Replays scripted outcomes for real prompts; probe requests always succeed
// unless `fail_probe` is set.
class ScriptedEmbedder : public Embedder {
public:
    explicit ScriptedEmbedder(std::deque<Outcome> script) : _script(std::move(script)) {}

    std::vector<float> embed(const std::string& text) override {
        if (text == "test") {
            ++probes;
            if (fail_probe) throw EmbeddingError(EmbeddingError::Kind::Transient, "probe down");
            return {0.0f};
        }
        prompts.push_back(text);
        const Outcome outcome = _script.empty() ? Outcome::Ok : _script.front();
        if (!_script.empty()) _script.pop_front();
        switch (outcome) {
            case Outcome::Ok: return {0.1f, 0.2f, 0.3f};
            case Outcome::Transient: throw EmbeddingError(EmbeddingError::Kind::Transient, "status 503");
            case Outcome::Terminal: throw EmbeddingError(EmbeddingError::Kind::Terminal, "bad response");
            case Outcome::Empty: return {};
            case Outcome::Runtime: throw std::runtime_error("connection reset");
        }
        return {};
    }

    std::vector<std::string> prompts;
    size_t probes = 0;
    bool fail_probe = false;

private:
    std::deque<Outcome> _script;
};

struct Harness {
    std::shared_ptr<ScriptedEmbedder> embedder;
    std::vector<long long> sleeps;
    std::unique_ptr<EmbeddingClient> client;

    Harness(std::deque<Outcome> script, EmbeddingOptions options = {})
        : embedder(std::make_shared<ScriptedEmbedder>(std::move(script)))
    {
        client = std::make_unique<EmbeddingClient>(embedder, options,
            [this](std::chrono::milliseconds delay) { sleeps.push_back(delay.count()); });
    }
};

EmbeddingOptions no_probe() {
    EmbeddingOptions options;
    options.wake_up_probe = false;
    return options;
}

} // namespace

TEST(EmbeddingClient, SucceedsFirstTry) {
    Harness h({Outcome::Ok});
    auto vector = h.client->embed("hello");
    EXPECT_EQ(vector, (std::vector<float>{0.1f, 0.2f, 0.3f}));
    EXPECT_TRUE(h.sleeps.empty());
    EXPECT_EQ(h.embedder->probes, 0u);
    EXPECT_EQ(h.embedder->prompts, (std::vector<std::string>{"hello"}));
}

TEST(EmbeddingClient, ExponentialBackoffThenFailure) {
    Harness h({Outcome::Transient, Outcome::Transient, Outcome::Transient, Outcome::Transient,
               Outcome::Transient}, no_probe());
    try {
        h.client->embed("text");
        FAIL() << "expected EmbeddingError";
    } catch (const EmbeddingError& e) {
        EXPECT_EQ(e.kind(), EmbeddingError::Kind::Terminal);
        EXPECT_EQ(e.attempts(), 5u);
        EXPECT_EQ(std::string(e.what()), "Failed after 5 attempts: status 503");
    }
    EXPECT_EQ(h.sleeps, (std::vector<long long>{500, 1000, 2000, 4000}));
    EXPECT_EQ(h.embedder->prompts.size(), 5u);
}

TEST(EmbeddingClient, BackoffSaturatesAtMaxDelay) {
    EmbeddingOptions options = no_probe();
    options.max_attempts = 70;
    std::deque<Outcome> script(70, Outcome::Transient);
    Harness h(script, options);
    EXPECT_THROW(h.client->embed("text"), EmbeddingError);

    ASSERT_EQ(h.sleeps.size(), 69u);
    EXPECT_EQ(h.sleeps.front(), 500);
    EXPECT_EQ(h.sleeps.back(), 60000);
    for (size_t i = 1; i < h.sleeps.size(); ++i) {
        EXPECT_GE(h.sleeps[i], h.sleeps[i - 1]);
        EXPECT_LE(h.sleeps[i], 60000);
    }
    EXPECT_EQ(h.client->backoff_delay(1000).count(), 60000);
}

TEST(EmbeddingClient, BackoffDelays) {
    EmbeddingOptions options;
    options.base_delay = std::chrono::milliseconds(300);
    options.max_delay = std::chrono::milliseconds(1000);
    Harness h({}, options);
    EXPECT_EQ(h.client->backoff_delay(1).count(), 300);
    EXPECT_EQ(h.client->backoff_delay(2).count(), 600);
    EXPECT_EQ(h.client->backoff_delay(3).count(), 1000);
    EXPECT_EQ(h.client->backoff_delay(4).count(), 1000);
}

TEST(EmbeddingClient, RecoversAfterTransientFailures) {
    Harness h({Outcome::Transient, Outcome::Runtime, Outcome::Ok}, no_probe());
    EXPECT_EQ(h.client->embed("text").size(), 3u);
    EXPECT_EQ(h.sleeps, (std::vector<long long>{500, 1000}));
}

TEST(EmbeddingClient, WakeUpProbeBeforeRetry) {
    Harness h({Outcome::Transient, Outcome::Ok});
    EXPECT_EQ(h.client->embed("text").size(), 3u);
    EXPECT_EQ(h.embedder->probes, 1u);
    EXPECT_EQ(h.sleeps, (std::vector<long long>{500, 100}));
}

TEST(EmbeddingClient, FailingProbeDoesNotAbortRetry) {
    Harness h({Outcome::Transient, Outcome::Ok});
    h.embedder->fail_probe = true;
    EXPECT_EQ(h.client->embed("text").size(), 3u);
    EXPECT_EQ(h.embedder->probes, 1u);
}

TEST(EmbeddingClient, TerminalErrorIsNotRetried) {
    Harness h({Outcome::Terminal, Outcome::Ok}, no_probe());
    try {
        h.client->embed("text");
        FAIL() << "expected EmbeddingError";
    } catch (const EmbeddingError& e) {
        EXPECT_EQ(e.kind(), EmbeddingError::Kind::Terminal);
        EXPECT_EQ(e.attempts(), 1u);
    }
    EXPECT_TRUE(h.sleeps.empty());
    EXPECT_EQ(h.embedder->prompts.size(), 1u);
}

TEST(EmbeddingClient, EmptyVectorIsTerminal) {
    Harness h({Outcome::Empty, Outcome::Ok}, no_probe());
    EXPECT_THROW(h.client->embed("text"), EmbeddingError);
    EXPECT_EQ(h.embedder->prompts.size(), 1u);
}

TEST(EmbeddingClient, PromptIsSanitizedAndTruncated) {
    EmbeddingOptions options;
    options.max_chars = 5;
    Harness h({Outcome::Ok}, options);
    h.client->embed("\xE2\x86\x92" "abcdefgh");
    EXPECT_EQ(h.embedder->prompts, (std::vector<std::string>{">abcd"}));
}

TEST(EmbeddingClient, PrepareInput) {
    EXPECT_EQ(mdchunk::prepare_embedding_input("\xE2\x9C\x93 ok", 2000), "Y ok");
    EXPECT_EQ(mdchunk::prepare_embedding_input(std::string(3000, 'a'), 2000).size(), 2000u);
}

TEST(EmbeddingClient, RejectsBadConstruction) {
    EXPECT_THROW(EmbeddingClient(nullptr), std::invalid_argument);
    EmbeddingOptions options;
    options.max_attempts = 0;
    EXPECT_THROW(EmbeddingClient(std::make_shared<ScriptedEmbedder>(std::deque<Outcome>{}), options),
                 std::invalid_argument);

    EmbeddingOptions inverted;
    inverted.max_delay = std::chrono::milliseconds(100);
    EXPECT_THROW(EmbeddingClient(std::make_shared<ScriptedEmbedder>(std::deque<Outcome>{}), inverted),
                 std::invalid_argument);
}
