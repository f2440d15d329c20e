#include "semantic_splitter.hpp"

#include <stdexcept>
#include <string>

#include "logging.hpp"
#include "markdown_scan.hpp"
#include "utils.hpp"

namespace mdchunk {

MapParams SemanticSplitter::_default_params("MDCHUNK_SEMANTIC_");

void SemanticConfig::validate() const {
    if (target_size == 0) throw std::invalid_argument("target_size should be > 0.");
}

SemanticSplitter::SemanticSplitter(std::optional<size_t> target_size)
    : SemanticSplitter([&] {
          SemanticConfig defaults;
          SemanticConfig config;
          config.target_size = _default_params.get_param_value("target_size", target_size, defaults.target_size);
          config.section_flush_min_size = _default_params.get_param_value(
              "section_flush_min_size", std::nullopt, defaults.section_flush_min_size);
          config.code_flush_min_size = _default_params.get_param_value(
              "code_flush_min_size", std::nullopt, defaults.code_flush_min_size);
          return config;
      }()) {}

SemanticSplitter::SemanticSplitter(const SemanticConfig& config) : _config(config) {
    _config.validate();
}

std::vector<Chunk> SemanticSplitter::split(std::string_view document) const {
    std::vector<Chunk> chunks;
    const auto lines = SplitLines(document);

    std::string buffer;
    std::string code_buffer;
    size_t start_line = 0;
    bool has_code = false;
    HeaderStack headers;
    FenceTracker fence;

    auto emit = [&](size_t end_line) {
        Chunk chunk;
        chunk.content = std::move(buffer);
        chunk.start_line = start_line;
        chunk.end_line = end_line;
        chunk.chunk_size = ChunkSize::Medium;
        chunk.has_code = has_code;
        chunk.headers = headers.headers();
        chunks.push_back(std::move(chunk));
        buffer.clear();
        has_code = false;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        const bool was_in_code = fence.in_code_block();

        if (!was_in_code && is_header_line(line)) {
            if (header_level(line) <= 2 && buffer.size() > _config.section_flush_min_size) {
                emit(i - 1);
                start_line = i;
            }
            headers.update(line);
        }

        if (fence.observe(line, i)) {
            if (!was_in_code) {
                if (buffer.size() > _config.code_flush_min_size) {
                    emit(i - 1);
                    start_line = i;
                }
                has_code = true;
                code_buffer.clear();
            } else {
                // Closing fence: the whole block joins the chunk at once.
                code_buffer.append(line);
                code_buffer.push_back('\n');
                buffer += code_buffer;
                code_buffer.clear();
                continue;
            }
        }

        if (fence.in_code_block()) {
            code_buffer.append(line);
            code_buffer.push_back('\n');
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (buffer.size() >= _config.target_size && is_natural_break(lines, i, true)) {
            emit(i);
            start_line = i + 1;
        }
    }

    // An unterminated fence still belongs to the last chunk.
    if (!IsBlank(buffer) || !code_buffer.empty()) {
        buffer += code_buffer;
        emit(lines.size() - 1);
    }

    logger()->debug("semantic split (target {}): {} chunks", _config.target_size, chunks.size());
    return chunks;
}

} // namespace mdchunk
