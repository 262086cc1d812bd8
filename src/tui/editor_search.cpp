#include "zw/tui/editor_search.hpp"

#include <spdlog/spdlog.h>
#include "zw/tui/unicode_handler.hpp"

namespace zw::tui {

// SearchState implementation

Result<std::vector<SearchMatch>> SearchState::search(
    const EditorBuffer& buffer,
    const std::string& query,
    const SearchOptions& options) {

    if (query.empty()) {
        return makeErrorResult<std::vector<SearchMatch>>(ErrorCode::kInvalidArgument,
            "Search query cannot be empty");
    }

    clearResults();
    last_query_ = query;
    last_options_ = options;

    const std::u32string pattern = UnicodeHandler::decodeUtf8(query);
    std::vector<SearchMatch> matches;

    for (size_t line = 0; line < buffer.getLineCount(); ++line) {
        for (size_t start : buffer.line(line).findAll(std::u32string_view(pattern))) {
            if (matches.size() >= options.max_results) {
                break;
            }
            matches.push_back(SearchMatch{line, start, start + pattern.size()});
        }
        if (matches.size() >= options.max_results) {
            spdlog::debug("Search for '{}' stopped at {} results", query, options.max_results);
            break;
        }
    }

    results_ = std::move(matches);
    current_result_index_ = results_.empty() ? -1 : 0;
    return results_;
}

Result<SearchMatch> SearchState::findNext(const CursorPosition& current_pos) {
    if (results_.empty()) {
        return makeErrorResult<SearchMatch>(ErrorCode::kNotFound, "No search results available");
    }

    for (size_t i = 0; i < results_.size(); ++i) {
        const auto& match = results_[i];

        if (match.line > current_pos.line ||
            (match.line == current_pos.line && match.start_column > current_pos.column)) {
            current_result_index_ = static_cast<int>(i);
            return match;
        }
    }

    // Wrap to beginning if enabled
    if (last_options_.wrap_search) {
        current_result_index_ = 0;
        return results_.front();
    }

    return makeErrorResult<SearchMatch>(ErrorCode::kNotFound, "No more matches found");
}

Result<SearchMatch> SearchState::findPrevious(const CursorPosition& current_pos) {
    if (results_.empty()) {
        return makeErrorResult<SearchMatch>(ErrorCode::kNotFound, "No search results available");
    }

    for (int i = static_cast<int>(results_.size()) - 1; i >= 0; --i) {
        const auto& match = results_[static_cast<size_t>(i)];

        if (match.line < current_pos.line ||
            (match.line == current_pos.line && match.start_column < current_pos.column)) {
            current_result_index_ = i;
            return match;
        }
    }

    // Wrap to end if enabled
    if (last_options_.wrap_search) {
        current_result_index_ = static_cast<int>(results_.size()) - 1;
        return results_.back();
    }

    return makeErrorResult<SearchMatch>(ErrorCode::kNotFound, "No previous matches found");
}

void SearchState::clearResults() {
    results_.clear();
    current_result_index_ = -1;
    last_query_.clear();
}

// EditorSearch implementation

EditorSearch::EditorSearch(Editor& editor)
    : editor_(editor) {
    connection_ = editor_.changed().connect([this]() { refresh(); });
}

EditorSearch::~EditorSearch() {
    editor_.changed().disconnect(connection_);
}

Result<size_t> EditorSearch::startSearch(const std::string& query, const SearchOptions& options) {
    auto search_result = search_state_.search(editor_.buffer(), query, options);
    if (!search_result) {
        search_active_ = false;
        return std::unexpected(search_result.error());
    }

    search_active_ = true;
    return search_result.value().size();
}

Result<void> EditorSearch::findNext() {
    if (!search_active_) {
        return makeErrorResult<void>(ErrorCode::kInvalidState, "No active search");
    }

    auto next_result = search_state_.findNext(editor_.cursor());
    if (!next_result) {
        return std::unexpected(next_result.error());
    }

    const auto& match = next_result.value();
    editor_.moveTo(static_cast<std::ptrdiff_t>(match.line),
                   static_cast<std::ptrdiff_t>(match.start_column));
    return {};
}

Result<void> EditorSearch::findPrevious() {
    if (!search_active_) {
        return makeErrorResult<void>(ErrorCode::kInvalidState, "No active search");
    }

    auto prev_result = search_state_.findPrevious(editor_.cursor());
    if (!prev_result) {
        return std::unexpected(prev_result.error());
    }

    const auto& match = prev_result.value();
    editor_.moveTo(static_cast<std::ptrdiff_t>(match.line),
                   static_cast<std::ptrdiff_t>(match.start_column));
    return {};
}

void EditorSearch::cancelSearch() {
    search_active_ = false;
    search_state_.clearResults();
}

std::vector<SearchMatch> EditorSearch::getMatchesInRange(size_t start_line, size_t end_line) const {
    std::vector<SearchMatch> matches_in_range;

    for (const auto& match : search_state_.getResults()) {
        if (match.line >= start_line && match.line <= end_line) {
            matches_in_range.push_back(match);
        }
    }

    return matches_in_range;
}

void EditorSearch::refresh() {
    if (!search_active_) {
        return;
    }

    const std::string query = search_state_.getLastQuery();
    const SearchOptions options = search_state_.getLastOptions();
    auto result = search_state_.search(editor_.buffer(), query, options);
    if (!result) {
        spdlog::warn("Search refresh failed: {}", result.error().message());
        cancelSearch();
    }
}

} // namespace zw::tui
