#include "embedding.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "embedding_sanitizer.hpp"
#include "logging.hpp"
#include "unicode_processor.hpp"

namespace mdchunk {

void EmbeddingOptions::validate() const {
    if (max_chars == 0) throw std::invalid_argument("max_chars should be > 0.");
    if (max_attempts == 0) throw std::invalid_argument("max_attempts should be > 0.");
    if (base_delay.count() < 0 || max_delay.count() < 0 || probe_settle.count() < 0)
        throw std::invalid_argument("Retry delays should be >= 0.");
    if (max_delay < base_delay) throw std::invalid_argument("max_delay should be >= base_delay.");
}

std::string prepare_embedding_input(std::string_view text, size_t max_chars) {
    return safe_truncate(sanitize_for_embedding(text), max_chars);
}

EmbeddingClient::EmbeddingClient(
    std::shared_ptr<Embedder> embedder,
    EmbeddingOptions options,
    Sleeper sleeper)
    : _embedder(std::move(embedder)), _options(std::move(options)), _sleep(std::move(sleeper))
{
    if (!_embedder) throw std::invalid_argument("EmbeddingClient needs an embedder.");
    _options.validate();
    if (!_sleep) _sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::vector<float> EmbeddingClient::embed(std::string_view text) const {
    return embed_prepared(prepare_embedding_input(text, _options.max_chars));
}

std::chrono::milliseconds EmbeddingClient::backoff_delay(size_t attempt) const {
    std::chrono::milliseconds delay = _options.base_delay;
    for (size_t k = 1; k < attempt && delay < _options.max_delay; ++k) {
        delay = delay > _options.max_delay / 2 ? _options.max_delay : delay * 2;
    }
    return std::min(delay, _options.max_delay);
}

void EmbeddingClient::probe() const {
    try {
        _embedder->embed(_options.probe_text);
    } catch (const std::exception& e) {
        logger()->debug("wake-up probe failed: {}", e.what());
    }
    _sleep(_options.probe_settle);
}

std::vector<float> EmbeddingClient::embed_prepared(const std::string& prompt) const {
    std::string last_error = "Unknown error";
    for (size_t attempt = 0; attempt < _options.max_attempts; ++attempt) {
        if (attempt > 0) {
            _sleep(backoff_delay(attempt));
            if (_options.wake_up_probe) probe();
        }

        try {
            auto vector = _embedder->embed(prompt);
            if (vector.empty())
                throw EmbeddingError(EmbeddingError::Kind::Terminal, "Embedding response contained no vector.");
            return vector;
        } catch (const EmbeddingError& e) {
            if (e.kind() == EmbeddingError::Kind::Terminal)
                throw EmbeddingError(EmbeddingError::Kind::Terminal, e.what(), attempt + 1);
            last_error = e.what();
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        logger()->warn("embedding attempt {}/{} failed: {}", attempt + 1, _options.max_attempts, last_error);
    }

    throw EmbeddingError(
        EmbeddingError::Kind::Terminal,
        "Failed after " + std::to_string(_options.max_attempts) + " attempts: " + last_error,
        _options.max_attempts);
}

} // namespace mdchunk
