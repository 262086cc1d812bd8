#include <gtest/gtest.h>
#include "zw/tui/editor_search.hpp"
#include "zw/tui/editor.hpp"
#include "../../common/test_helpers.hpp"

using namespace zw::tui;
using namespace zw;

class EditorSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        editor_ = std::make_unique<Editor>();
        editor_->setContent({
            "Hello World",
            "This is a test line",
            "Another TEST with different case",
            "testing tested",
            "",
            "Final line with Hello again",
            "aaaa",
            "caf\xC3\xA9 caf\xC3\xA9"
        });

        search_ = std::make_unique<EditorSearch>(*editor_);
    }

    void TearDown() override {
        search_.reset();
        editor_.reset();
    }

    std::unique_ptr<Editor> editor_;
    std::unique_ptr<EditorSearch> search_;
};

// Basic search functionality tests

TEST_F(EditorSearchTest, BasicLiteralSearch) {
    auto result = search_->startSearch("test");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3);
    EXPECT_TRUE(search_->isSearchActive());

    const auto& results = search_->getSearchState().getResults();
    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0], (SearchMatch{1, 10, 14}));
    EXPECT_EQ(results[1], (SearchMatch{3, 0, 4}));
    EXPECT_EQ(results[2], (SearchMatch{3, 8, 12}));
    EXPECT_EQ(search_->getSearchState().getLastQuery(), "test");
}

TEST_F(EditorSearchTest, SearchIsCaseSensitive) {
    auto result = search_->startSearch("TEST");

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 1);
    EXPECT_EQ(search_->getSearchState().getResults()[0], (SearchMatch{2, 8, 12}));
}

TEST_F(EditorSearchTest, OverlappingMatches) {
    auto result = search_->startSearch("aa");

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 3);
    const auto& results = search_->getSearchState().getResults();
    EXPECT_EQ(results[0].start_column, 0);
    EXPECT_EQ(results[1].start_column, 1);
    EXPECT_EQ(results[2].start_column, 2);
}

TEST_F(EditorSearchTest, UnicodeColumnsAreCodePoints) {
    auto result = search_->startSearch("caf\xC3\xA9");

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, 2);
    const auto& results = search_->getSearchState().getResults();
    EXPECT_EQ(results[0], (SearchMatch{7, 0, 4}));
    EXPECT_EQ(results[1], (SearchMatch{7, 5, 9}));
}

TEST_F(EditorSearchTest, EmptyQuerySearch) {
    EXPECT_ERROR(search_->startSearch(""), ErrorCode::kInvalidArgument);
    EXPECT_FALSE(search_->isSearchActive());
}

TEST_F(EditorSearchTest, NonExistentTextSearch) {
    auto result = search_->startSearch("nonexistent");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0);
    EXPECT_TRUE(search_->isSearchActive());
    EXPECT_FALSE(search_->getSearchState().hasResults());
    EXPECT_ERROR(search_->findNext(), ErrorCode::kNotFound);
}

TEST_F(EditorSearchTest, StartSearchLeavesCursor) {
    editor_->moveTo(4, 0);
    ASSERT_OK(search_->startSearch("Hello"));

    EXPECT_EQ(editor_->cursor(), (CursorPosition{4, 0}));
}

// Navigation

TEST_F(EditorSearchTest, FindNext) {
    ASSERT_OK(search_->startSearch("test"));

    ASSERT_OK(search_->findNext());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{1, 10}));

    ASSERT_OK(search_->findNext());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{3, 0}));

    ASSERT_OK(search_->findNext());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{3, 8}));
    EXPECT_EQ(search_->getSearchState().getCurrentResultIndex(), 2);
}

TEST_F(EditorSearchTest, FindPrevious) {
    ASSERT_OK(search_->startSearch("test"));
    editor_->moveTo(3, 5);

    ASSERT_OK(search_->findPrevious());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{3, 0}));

    ASSERT_OK(search_->findPrevious());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{1, 10}));
}

TEST_F(EditorSearchTest, WrapSearch) {
    ASSERT_OK(search_->startSearch("test"));

    editor_->moveTo(3, 8);
    ASSERT_OK(search_->findNext());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{1, 10}));

    ASSERT_OK(search_->findPrevious());
    EXPECT_EQ(editor_->cursor(), (CursorPosition{3, 8}));
}

TEST_F(EditorSearchTest, NoWrapStopsAtEnds) {
    SearchOptions options;
    options.wrap_search = false;
    ASSERT_OK(search_->startSearch("test", options));

    editor_->moveTo(3, 8);
    EXPECT_ERROR(search_->findNext(), ErrorCode::kNotFound);
    EXPECT_EQ(editor_->cursor(), (CursorPosition{3, 8}));

    editor_->moveTo(1, 10);
    EXPECT_ERROR(search_->findPrevious(), ErrorCode::kNotFound);
    EXPECT_EQ(editor_->cursor(), (CursorPosition{1, 10}));
}

TEST_F(EditorSearchTest, MaxResultsLimit) {
    SearchOptions options;
    options.max_results = 2;

    auto result = search_->startSearch("test", options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 2);
    EXPECT_EQ(search_->getSearchState().getResults().back(), (SearchMatch{3, 0, 4}));
}

// Search state

TEST_F(EditorSearchTest, CancelSearch) {
    ASSERT_OK(search_->startSearch("test"));
    search_->cancelSearch();

    EXPECT_FALSE(search_->isSearchActive());
    EXPECT_EQ(search_->getSearchState().getResultCount(), 0);
    EXPECT_EQ(search_->getSearchState().getCurrentResultIndex(), -1);
    EXPECT_ERROR(search_->findNext(), ErrorCode::kInvalidState);
    EXPECT_ERROR(search_->findPrevious(), ErrorCode::kInvalidState);
}

TEST_F(EditorSearchTest, MultipleSearches) {
    ASSERT_OK(search_->startSearch("test"));
    ASSERT_OK(search_->startSearch("Hello"));

    const auto& state = search_->getSearchState();
    EXPECT_EQ(state.getLastQuery(), "Hello");
    ASSERT_EQ(state.getResultCount(), 2);
    EXPECT_EQ(state.getResults()[1], (SearchMatch{5, 16, 21}));
}

TEST_F(EditorSearchTest, ResultsFollowEdits) {
    ASSERT_OK(search_->startSearch("Hello"));
    ASSERT_EQ(search_->getSearchState().getResultCount(), 2);

    editor_->moveTo(4, 0);
    for (char32_t ch : std::u32string(U"Hello")) {
        editor_->insertChar(ch);
    }

    EXPECT_EQ(search_->getSearchState().getResultCount(), 3);
    EXPECT_EQ(search_->getSearchState().getResults()[1], (SearchMatch{4, 0, 5}));

    editor_->setContent({"nothing here"});
    EXPECT_TRUE(search_->isSearchActive());
    EXPECT_EQ(search_->getSearchState().getResultCount(), 0);
}

TEST_F(EditorSearchTest, CancelledSearchIgnoresEdits) {
    ASSERT_OK(search_->startSearch("Hello"));
    search_->cancelSearch();

    editor_->setContent({"Hello"});
    EXPECT_FALSE(search_->isSearchActive());
    EXPECT_EQ(search_->getSearchState().getResultCount(), 0);
}

TEST_F(EditorSearchTest, MatchesInRange) {
    ASSERT_OK(search_->startSearch("test"));

    auto matches = search_->getMatchesInRange(2, 3);
    ASSERT_EQ(matches.size(), 2);
    EXPECT_EQ(matches[0].line, 3);
    EXPECT_EQ(matches[1].line, 3);

    EXPECT_EQ(search_->getMatchesInRange(1, 1).size(), 1);
    EXPECT_TRUE(search_->getMatchesInRange(4, 6).empty());
}

TEST_F(EditorSearchTest, SearchInEmptyDocument) {
    editor_->setContent({});

    auto result = search_->startSearch("anything");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0);
}

TEST_F(EditorSearchTest, SearchStateWithoutEditor) {
    SearchState state;
    EXPECT_ERROR(state.findNext(CursorPosition{0, 0}), ErrorCode::kNotFound);

    auto results = state.search(editor_->buffer(), "line");
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 2);

    auto previous = state.findPrevious(CursorPosition{5, 7});
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, (SearchMatch{5, 6, 10}));

    // A match starting at the cursor is not "previous"
    previous = state.findPrevious(CursorPosition{5, 6});
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, (SearchMatch{1, 15, 19}));
}
