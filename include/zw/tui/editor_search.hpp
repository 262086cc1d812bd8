#pragma once

#include <string>
#include <vector>
#include "zw/common.hpp"
#include "zw/tui/editor.hpp"
#include "zw/tui/editor_buffer.hpp"

namespace zw::tui {

/**
 * @brief Search result representing a match in the editor buffer
 */
struct SearchMatch {
    size_t line;                    // Line number of match
    size_t start_column;            // Start column of match
    size_t end_column;              // End column of match (exclusive)

    bool operator==(const SearchMatch&) const = default;
};

/**
 * @brief Search options and configuration
 */
struct SearchOptions {
    bool wrap_search = true;
    size_t max_results = 1000;     // Prevent memory exhaustion
};

/**
 * @brief Search state and result management
 *
 * Literal, case-sensitive matching through GapBuffer::findAll, so matches on
 * a line may overlap. Columns are code point offsets.
 */
class SearchState {
public:
    SearchState() = default;

    // Search execution
    Result<std::vector<SearchMatch>> search(
        const EditorBuffer& buffer,
        const std::string& query,
        const SearchOptions& options = {});

    // First match starting after position, kNotFound when there is none
    Result<SearchMatch> findNext(const CursorPosition& current_pos);
    // Last match starting before position, kNotFound when there is none
    Result<SearchMatch> findPrevious(const CursorPosition& current_pos);

    // Result access
    const std::vector<SearchMatch>& getResults() const { return results_; }
    size_t getResultCount() const { return results_.size(); }
    int getCurrentResultIndex() const { return current_result_index_; }

    // Query information
    const std::string& getLastQuery() const { return last_query_; }
    const SearchOptions& getLastOptions() const { return last_options_; }

    void clearResults();
    bool hasResults() const { return !results_.empty(); }

private:
    std::vector<SearchMatch> results_;
    std::string last_query_;
    SearchOptions last_options_;
    int current_result_index_ = -1;
};

/**
 * @brief Search bound to an editor
 *
 * Navigation moves the editor cursor to the start of a match. While a search
 * is active the results are refreshed whenever the editor content changes.
 */
class EditorSearch {
public:
    explicit EditorSearch(Editor& editor);
    ~EditorSearch();

    EditorSearch(const EditorSearch&) = delete;
    EditorSearch& operator=(const EditorSearch&) = delete;

    /**
     * @brief Run a search over the whole document
     *
     * The cursor does not move; use findNext() to jump to a match.
     * @return Number of matches, or kInvalidArgument for an empty query
     */
    Result<size_t> startSearch(const std::string& query, const SearchOptions& options = {});

    Result<void> findNext();
    Result<void> findPrevious();

    // Search state
    bool isSearchActive() const { return search_active_; }
    void cancelSearch();

    const SearchState& getSearchState() const { return search_state_; }

    // Highlighting support, both lines inclusive
    std::vector<SearchMatch> getMatchesInRange(size_t start_line, size_t end_line) const;

private:
    Editor& editor_;
    SearchState search_state_;
    bool search_active_ = false;
    Editor::ChangeSignal::Connection connection_ = 0;

    void refresh();
};

} // namespace zw::tui
