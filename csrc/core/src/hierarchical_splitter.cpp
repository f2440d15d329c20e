#include "hierarchical_splitter.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <stdexcept>
#include <string>
#include <utility>

#include "logging.hpp"
#include "markdown_scan.hpp"
#include "summary.hpp"
#include "utils.hpp"

namespace mdchunk {

MapParams HierarchicalSplitter::_default_params("MDCHUNK_");

void HierarchicalConfig::validate() const {
    if (parent_target_size == 0 || child_target_size == 0)
        throw std::invalid_argument("parent_target_size and child_target_size should be > 0.");
    if (min_parent_size > parent_target_size) {
        throw std::invalid_argument(
            "min_parent_size (" + std::to_string(min_parent_size) +
            ") is larger than parent_target_size (" + std::to_string(parent_target_size) + ").");
    }
}

HierarchicalSplitter::HierarchicalSplitter(
    std::optional<size_t> parent_target_size,
    std::optional<size_t> min_parent_size,
    std::optional<size_t> child_target_size)
    : HierarchicalSplitter([&] {
          HierarchicalConfig defaults;
          HierarchicalConfig config;
          config.parent_target_size = _default_params.get_param_value(
              "parent_target_size", parent_target_size, defaults.parent_target_size);
          config.min_parent_size = _default_params.get_param_value(
              "min_parent_size", min_parent_size, defaults.min_parent_size);
          config.child_target_size = _default_params.get_param_value(
              "child_target_size", child_target_size, defaults.child_target_size);
          config.code_flush_min_size = _default_params.get_param_value(
              "code_flush_min_size", std::nullopt, defaults.code_flush_min_size);
          config.break_lookback_lines = _default_params.get_param_value(
              "break_lookback_lines", std::nullopt, defaults.break_lookback_lines);
          return config;
      }()) {}

HierarchicalSplitter::HierarchicalSplitter(const HierarchicalConfig& config)
    : _config(config), _child_splitter(config.child_target_size, config.code_flush_min_size)
{
    _config.validate();
}

namespace {

struct ParentScanState {
    std::string buffer;
    std::vector<size_t> line_ends;  // buffer offset just past each buffered line
    size_t start_line = 0;
    HeaderStack headers;
    FenceTracker fence;
    // Header context after each of the most recent buffered lines, oldest first.
    std::deque<std::vector<std::string>> recent_headers;

    void reset(size_t next_start) {
        buffer.clear();
        line_ends.clear();
        recent_headers.clear();
        start_line = next_start;
    }
};

} // namespace

/*
 * split
 * -----
 * One pass over the document lines:
 * 1) H1 closes any pending non-blank parent, H2 closes it once it exceeds
 *    min_parent_size; both then replace the header context. H3+ only extend it.
 * 2) Once the pending text reaches parent_target_size (and no fence is open),
 *    the parent is cut at the closest blank line among the last
 *    break_lookback_lines lines, else at the current line. Lines after the cut
 *    stay pending for the next parent.
 * 3) Whatever non-blank text remains becomes the final parent.
 * Header and fence lines inside an open code fence are plain content.
 */
HierarchicalChunks HierarchicalSplitter::split(std::string_view document) const {
    HierarchicalChunks out;
    const auto lines = SplitLines(document);
    ParentScanState state;

    auto emit_parent = [&](std::string content, size_t end_line, const std::vector<std::string>& headers) {
        ParentChunk parent;
        parent.id = GenerateUUID();
        parent.summary = make_summary(content, headers);
        parent.start_line = state.start_line;
        parent.end_line = end_line;
        parent.headers = headers;

        auto children = _child_splitter.split(content, parent.id, parent.start_line);
        parent.child_ids.reserve(children.size());
        for (auto& child : children) {
            parent.child_ids.push_back(child.id);
            out.children.push_back(std::move(child));
        }
        parent.content = std::move(content);
        out.parents.push_back(std::move(parent));
    };

    auto find_break = [&](size_t i) {
        size_t lower = std::max(state.start_line,
            i >= _config.break_lookback_lines ? i - _config.break_lookback_lines : size_t{0});
        const auto& last_fence = state.fence.last_fence_line();
        if (last_fence && *last_fence >= lower) lower = *last_fence + 1;

        for (size_t j = i + 1; j-- > lower;) {
            if (IsBlank(lines[j])) return j;
        }
        return i;
    };

    // Cuts the pending text after `break_line` and keeps the rest pending.
    auto close_at = [&](size_t i, size_t break_line) {
        const size_t kept_lines = i - break_line;
        const size_t cut = state.line_ends[break_line - state.start_line];
        const auto headers = state.recent_headers[state.recent_headers.size() - 1 - kept_lines];

        std::string content = state.buffer.substr(0, cut);
        if (!IsBlank(content)) emit_parent(std::move(content), break_line, headers);

        state.buffer.erase(0, cut);
        state.line_ends.erase(state.line_ends.begin(),
            state.line_ends.end() - static_cast<std::ptrdiff_t>(kept_lines));
        for (auto& end : state.line_ends) end -= cut;
        while (state.recent_headers.size() > kept_lines) state.recent_headers.pop_front();
        state.start_line = break_line + 1;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        const bool was_in_code = state.fence.in_code_block();
        state.fence.observe(line, i);

        if (!was_in_code) {
            const size_t level = header_level(line);
            const bool closes_section =
                (level == 1 && !IsBlank(state.buffer)) ||
                (level == 2 && state.buffer.size() > _config.min_parent_size && !IsBlank(state.buffer));
            if (closes_section) {
                emit_parent(std::move(state.buffer), i - 1, state.headers.headers());
                state.reset(i);
            }
            state.headers.update(line);
        }

        state.buffer.append(line);
        state.buffer.push_back('\n');
        state.line_ends.push_back(state.buffer.size());
        state.recent_headers.push_back(state.headers.headers());
        if (state.recent_headers.size() > _config.break_lookback_lines + 1)
            state.recent_headers.pop_front();

        while (!state.fence.in_code_block() && state.buffer.size() >= _config.parent_target_size) {
            close_at(i, find_break(i));
        }
    }

    if (!IsBlank(state.buffer))
        emit_parent(std::move(state.buffer), lines.size() - 1, state.headers.headers());

    logger()->debug("hierarchical split: {} lines -> {} parents, {} children",
        lines.size(), out.parents.size(), out.children.size());
    return out;
}

} // namespace mdchunk
