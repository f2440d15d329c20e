#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mdchunk {

class EmbeddingError : public std::runtime_error {
public:
    // Transient: transport failure or non-success status, worth retrying.
    // Terminal: malformed response or retry budget exhausted.
    enum class Kind { Transient, Terminal };

    EmbeddingError(Kind kind, const std::string& message, size_t attempts = 0)
        : std::runtime_error(message), _kind(kind), _attempts(attempts) {}

    Kind kind() const { return _kind; }
    size_t attempts() const { return _attempts; }

private:
    Kind _kind;
    size_t _attempts;
};

// Remote embedding model. Implementations live with the network clients and
// report failures through EmbeddingError.
class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

struct EmbeddingOptions {
    size_t max_chars = 2000;
    size_t max_attempts = 5;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{60000};
    bool wake_up_probe = true;
    std::string probe_text = "test";
    std::chrono::milliseconds probe_settle{100};

    void validate() const;
};

// Sanitized, then cut to `max_chars` characters.
std::string prepare_embedding_input(std::string_view text, size_t max_chars);

/*
 * Embedder front end with retries.
 * Attempt k (k >= 1) is preceded by a sleep of min(base_delay * 2^(k-1),
 * max_delay) and, when
 * enabled, a throwaway probe request that nudges a cold model server awake.
 * Transient failures are retried until max_attempts is used up; the final
 * error carries the last cause. Terminal failures are not retried.
 */
class EmbeddingClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit EmbeddingClient(
        std::shared_ptr<Embedder> embedder,
        EmbeddingOptions options = {},
        Sleeper sleeper = nullptr);

    // prepare_embedding_input() followed by embed_prepared().
    std::vector<float> embed(std::string_view text) const;

    std::vector<float> embed_prepared(const std::string& prompt) const;

    const EmbeddingOptions& options() const { return _options; }

    // Sleep before attempt `attempt` (1-based retry count); doubles from
    // base_delay and saturates at max_delay.
    std::chrono::milliseconds backoff_delay(size_t attempt) const;

private:
    void probe() const;

    std::shared_ptr<Embedder> _embedder;
    EmbeddingOptions _options;
    Sleeper _sleep;
};

} // namespace mdchunk
