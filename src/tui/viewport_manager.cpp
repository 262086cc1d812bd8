#include "zw/tui/viewport_manager.hpp"
#include <algorithm>

namespace zw::tui {

Result<void> ViewportManager::setViewportSize(size_t width, size_t height) {
    if (width == 0 || height == 0) {
        return makeErrorResult<void>(ErrorCode::kInvalidArgument,
            "Viewport size must be greater than zero");
    }

    viewport_.width = width;
    viewport_.height = height;
    return {};
}

void ViewportManager::adjust(size_t cursor_line, size_t visual_column, size_t longest_line) {
    const size_t width = viewport_.textWidth();
    const size_t height = viewport_.height;
    if (width == 0 || height == 0) {
        return;
    }

    // Vertical
    if (cursor_line < viewport_.offset_y) {
        viewport_.offset_y = cursor_line;
    } else if (cursor_line >= viewport_.offset_y + height) {
        viewport_.offset_y = cursor_line - height + 1;
    }

    // Horizontal, on the visual column
    if (visual_column < viewport_.offset_x) {
        viewport_.offset_x = visual_column;
    } else if (visual_column >= viewport_.offset_x + width) {
        viewport_.offset_x = visual_column - width + 1;
    }

    size_t max_offset_x = longest_line + 1 > width ? longest_line + 1 - width : 0;
    viewport_.offset_x = std::min(viewport_.offset_x, max_offset_x);
}

std::optional<ScreenPosition> ViewportManager::screenPosition(size_t cursor_line,
                                                              size_t visual_column) const {
    const size_t width = viewport_.textWidth();
    if (width == 0 || !isLineVisible(cursor_line)) {
        return std::nullopt;
    }

    if (visual_column < viewport_.offset_x || visual_column >= viewport_.offset_x + width) {
        return std::nullopt;
    }

    return ScreenPosition{
        .x = viewport_.gutter_width + (visual_column - viewport_.offset_x),
        .y = cursor_line - viewport_.offset_y
    };
}

bool ViewportManager::isLineVisible(size_t line) const {
    return line >= viewport_.offset_y && line < viewport_.offset_y + viewport_.height;
}

void ViewportManager::reset() {
    viewport_.offset_x = 0;
    viewport_.offset_y = 0;
}

size_t ViewportManager::visualColumn(std::u32string_view text, size_t column, size_t tab_width) {
    const size_t tab = std::max<size_t>(tab_width, 1);
    const size_t limit = std::min(column, text.size());

    size_t visual = 0;
    for (size_t i = 0; i < limit; ++i) {
        if (text[i] == U'\t') {
            visual = (visual / tab + 1) * tab;
        } else {
            visual++;
        }
    }
    return visual;
}

} // namespace zw::tui
