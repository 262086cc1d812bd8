#include "zw/tui/editor.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "zw/tui/unicode_handler.hpp"

namespace zw::tui {

Editor::Editor(EditorOptions options)
    : options_(options) {
    if (options_.tab_width == 0) {
        spdlog::warn("Editor created with tab width 0, using 4");
        options_.tab_width = 4;
    }
    viewport_.setGutterWidth(options_.gutter_width);
    updateLongestLine();
}

// Content

void Editor::setContent(const std::vector<std::string>& lines) {
    buffer_.setLines(lines);
    cursor_ = CursorPosition{};
    viewport_.reset();
    updateLongestLine();
    adjustViewport();

    spdlog::debug("Editor content replaced: {} lines, {} characters",
                  buffer_.getLineCount(), buffer_.totalCharacters());
    contentChanged();
}

void Editor::load(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    setContent(lines);
}

// Configuration

void Editor::setTabWidth(int width) {
    if (width <= 0) {
        spdlog::warn("Ignoring non-positive tab width {}", width);
        return;
    }
    options_.tab_width = static_cast<size_t>(width);
    updateLongestLine();
    adjustViewport();
}

void Editor::setInsertSpacesForTab(bool insert_spaces) {
    options_.insert_spaces_for_tab = insert_spaces;
}

void Editor::setAutoIndent(bool auto_indent) {
    options_.auto_indent = auto_indent;
}

void Editor::setReadOnly(bool read_only) {
    options_.read_only = read_only;
}

void Editor::setGutterWidth(int width) {
    if (width < 0) {
        spdlog::warn("Ignoring negative gutter width {}", width);
        return;
    }
    options_.gutter_width = static_cast<size_t>(width);
    viewport_.setGutterWidth(options_.gutter_width);
    adjustViewport();
}

void Editor::showLineNumbers(bool show) {
    setGutterWidth(show ? static_cast<int>(kLineNumberGutterWidth) : 0);
}

// Geometry

Result<void> Editor::setViewportSize(size_t width, size_t height) {
    auto result = viewport_.setViewportSize(width, height);
    if (!result) {
        return result;
    }
    adjustViewport();
    return {};
}

std::optional<ScreenPosition> Editor::cursorScreenPosition() const {
    return viewport_.screenPosition(cursor_.line, visualColumn());
}

size_t Editor::visualColumn() const {
    return ViewportManager::visualColumn(buffer_.line(cursor_.line).toU32String(),
                                         cursor_.column, options_.tab_width);
}

// Cursor movement

void Editor::moveTo(std::ptrdiff_t line, std::ptrdiff_t column) {
    const auto last_line = static_cast<std::ptrdiff_t>(buffer_.getLineCount()) - 1;
    const auto target_line = static_cast<size_t>(std::clamp<std::ptrdiff_t>(line, 0, last_line));

    const auto length = static_cast<std::ptrdiff_t>(buffer_.lineLength(target_line));
    const auto target_column = static_cast<size_t>(std::clamp<std::ptrdiff_t>(column, 0, length));

    setCursor(target_line, target_column);
}

void Editor::move(Direction direction) {
    switch (direction) {
        case Direction::Left:         left(); break;
        case Direction::Right:        right(); break;
        case Direction::Up:           up(); break;
        case Direction::Down:         down(); break;
        case Direction::Home:         home(); break;
        case Direction::End:          end(); break;
        case Direction::PageUp:       pageUp(); break;
        case Direction::PageDown:     pageDown(); break;
        case Direction::DocumentHome: documentHome(); break;
        case Direction::DocumentEnd:  documentEnd(); break;
    }
}

void Editor::left() {
    if (cursor_.column > 0) {
        setCursor(cursor_.line, cursor_.column - 1);
    } else if (cursor_.line > 0) {
        setCursor(cursor_.line - 1, buffer_.lineLength(cursor_.line - 1));
    }
}

void Editor::right() {
    if (cursor_.column < currentLineLength()) {
        setCursor(cursor_.line, cursor_.column + 1);
    } else if (cursor_.line + 1 < buffer_.getLineCount()) {
        setCursor(cursor_.line + 1, 0);
    }
}

void Editor::up() {
    if (cursor_.line == 0) {
        return;
    }
    const size_t line = cursor_.line - 1;
    setCursor(line, std::min(cursor_.column, buffer_.lineLength(line)));
}

void Editor::down() {
    if (cursor_.line + 1 >= buffer_.getLineCount()) {
        return;
    }
    const size_t line = cursor_.line + 1;
    setCursor(line, std::min(cursor_.column, buffer_.lineLength(line)));
}

void Editor::home() {
    setCursor(cursor_.line, 0);
}

void Editor::end() {
    setCursor(cursor_.line, currentLineLength());
}

void Editor::pageUp() {
    const size_t page = viewport_.getViewport().height;
    const size_t line = cursor_.line > page ? cursor_.line - page : 0;
    setCursor(line, std::min(cursor_.column, buffer_.lineLength(line)));
}

void Editor::pageDown() {
    const size_t page = viewport_.getViewport().height;
    const size_t line = std::min(cursor_.line + page, buffer_.getLineCount() - 1);
    setCursor(line, std::min(cursor_.column, buffer_.lineLength(line)));
}

void Editor::documentHome() {
    setCursor(0, 0);
}

void Editor::documentEnd() {
    const size_t line = buffer_.getLineCount() - 1;
    setCursor(line, buffer_.lineLength(line));
}

// Editing

void Editor::insertChar(char32_t ch) {
    if (options_.read_only) {
        return;
    }

    auto& line = buffer_.line(cursor_.line);
    requireOk(line.moveGapTo(cursor_.column), "insertChar");

    if (ch == U'\t' && options_.insert_spaces_for_tab) {
        const size_t spaces = options_.tab_width - cursor_.column % options_.tab_width;
        line.insertString(std::u32string(spaces, U' '));
        cursor_.column += spaces;
    } else {
        line.insertChar(ch);
        cursor_.column++;
    }

    // Insertion never shortens a line
    longest_line_ = std::max(longest_line_,
        ViewportManager::visualLength(line.toU32String(), options_.tab_width));
    adjustViewport();
    contentChanged();
}

void Editor::deleteBackward() {
    if (options_.read_only) {
        return;
    }

    if (cursor_.column > 0) {
        auto& line = buffer_.line(cursor_.line);
        requireOk(line.moveGapTo(cursor_.column - 1), "deleteBackward");
        line.deleteCharAfter();
        cursor_.column--;
    } else if (cursor_.line > 0) {
        const size_t previous = cursor_.line - 1;
        const size_t previous_length = buffer_.lineLength(previous);
        requireOk(buffer_.joinWithNext(previous), "deleteBackward");
        cursor_ = CursorPosition{previous, previous_length};
        spdlog::debug("Joined line {} into line {}", previous + 1, previous);
    } else {
        return;
    }

    updateLongestLine();
    adjustViewport();
    contentChanged();
}

void Editor::deleteForward() {
    if (options_.read_only) {
        return;
    }

    if (cursor_.column < currentLineLength()) {
        auto& line = buffer_.line(cursor_.line);
        requireOk(line.moveGapTo(cursor_.column), "deleteForward");
        line.deleteCharAfter();
    } else if (cursor_.line + 1 < buffer_.getLineCount()) {
        requireOk(buffer_.joinWithNext(cursor_.line), "deleteForward");
        spdlog::debug("Joined line {} into line {}", cursor_.line + 1, cursor_.line);
    } else {
        return;
    }

    updateLongestLine();
    adjustViewport();
    contentChanged();
}

void Editor::splitLine() {
    if (options_.read_only) {
        return;
    }

    std::u32string indent;
    if (options_.auto_indent) {
        // Indent of the part left of the cursor
        indent = buffer_.leadingWhitespace(cursor_.line);
        indent.resize(std::min(indent.size(), cursor_.column));
    }

    requireOk(buffer_.splitLine(cursor_.line, cursor_.column, indent), "splitLine");
    spdlog::debug("Split line {} at column {}", cursor_.line, cursor_.column);
    cursor_ = CursorPosition{cursor_.line + 1, indent.size()};

    updateLongestLine();
    adjustViewport();
    contentChanged();
}

// Input

bool Editor::handleKey(const KeyEvent& event) {
    switch (event.key) {
        case Key::Left:      left(); return true;
        case Key::Right:     right(); return true;
        case Key::Up:        up(); return true;
        case Key::Down:      down(); return true;
        case Key::Home:      home(); return true;
        case Key::End:       end(); return true;
        case Key::PageUp:    pageUp(); return true;
        case Key::PageDown:  pageDown(); return true;
        case Key::Backspace: deleteBackward(); return true;
        case Key::Delete:    deleteForward(); return true;
        case Key::Enter:     splitLine(); return true;
        case Key::Tab:       insertChar(U'\t'); return true;

        case Key::Character:
            if (event.ctrl) {
                if (event.rune == U'a' || event.rune == U'A') {
                    documentHome();
                    return true;
                }
                if (event.rune == U'e' || event.rune == U'E') {
                    documentEnd();
                    return true;
                }
                break;
            }
            if (!event.alt && UnicodeHandler::isPrintable(event.rune)) {
                insertChar(event.rune);
                return true;
            }
            break;

        case Key::Escape:
        case Key::Insert:
        case Key::Function:
            break;
    }

    return unhandled_key_.emit(event);
}

// Helpers

void Editor::setCursor(size_t line, size_t column) {
    cursor_ = CursorPosition{line, column};
    adjustViewport();
}

void Editor::updateLongestLine() {
    longest_line_ = 0;
    for (size_t i = 0; i < buffer_.getLineCount(); ++i) {
        longest_line_ = std::max(longest_line_,
            ViewportManager::visualLength(buffer_.line(i).toU32String(), options_.tab_width));
    }
}

void Editor::adjustViewport() {
    viewport_.adjust(cursor_.line, visualColumn(), longest_line_);
}

void Editor::contentChanged() {
    changed_.emit();
}

void Editor::requireOk(const Result<void>& result, std::string_view operation) const {
    if (result) {
        return;
    }
    spdlog::critical("Internal editor fault in {} at {}:{}: {}",
                     operation, cursor_.line, cursor_.column, result.error().message());
    throw std::logic_error(std::string(operation) + ": " + result.error().message());
}

} // namespace zw::tui
