#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include "zw/common.hpp"

namespace zw::tui {

/**
 * @brief Visible region of a document
 */
struct Viewport {
    size_t offset_x = 0;        // First visible visual column
    size_t offset_y = 0;        // First visible line
    size_t width = 0;           // Available width, gutter included
    size_t height = 0;          // Available height in lines
    size_t gutter_width = 0;    // Columns reserved for line numbers (0 = hidden)

    // Columns left for text once the gutter is taken out
    size_t textWidth() const { return width > gutter_width ? width - gutter_width : 0; }
};

/**
 * @brief Cursor location relative to the top-left of the content area
 */
struct ScreenPosition {
    size_t x = 0;
    size_t y = 0;

    bool operator==(const ScreenPosition&) const = default;
};

/**
 * @brief Keeps the cursor inside the visible region
 *
 * Offsets follow the cursor with the minimum scroll needed. Horizontal
 * scrolling works on visual columns (tabs expanded to the next multiple of
 * the tab width) and is clamped to the longest line.
 */
class ViewportManager {
public:
    ViewportManager() = default;

    /**
     * @brief Set the size available to the editor
     * @param width Columns, including the gutter
     * @param height Lines
     * @return kInvalidArgument for a zero dimension
     */
    Result<void> setViewportSize(size_t width, size_t height);

    void setGutterWidth(size_t width) { viewport_.gutter_width = width; }

    /**
     * @brief Scroll so that the cursor is visible
     *
     * Does nothing until a size has been set or when the gutter leaves no
     * room for text.
     * @param cursor_line Cursor line
     * @param visual_column Cursor column with tabs expanded
     * @param longest_line Visual length of the longest line
     */
    void adjust(size_t cursor_line, size_t visual_column, size_t longest_line);

    /**
     * @brief Screen position of the cursor
     * @return Position relative to the content area (gutter included), or
     *         std::nullopt when the cursor is outside the visible region
     */
    std::optional<ScreenPosition> screenPosition(size_t cursor_line, size_t visual_column) const;

    bool isLineVisible(size_t line) const;

    /**
     * @brief Return to the top-left corner
     */
    void reset();

    const Viewport& getViewport() const { return viewport_; }
    bool hasSize() const { return viewport_.width > 0 && viewport_.height > 0; }

    /**
     * @brief Visual column of a character column
     *
     * Each tab advances to the next multiple of tab_width, any other code
     * point advances by one.
     */
    static size_t visualColumn(std::u32string_view text, size_t column, size_t tab_width);

    // Visual width of a whole line
    static size_t visualLength(std::u32string_view text, size_t tab_width) {
        return visualColumn(text, text.size(), tab_width);
    }

private:
    Viewport viewport_;
};

} // namespace zw::tui
