#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "zw/common.hpp"
#include "zw/tui/editor_buffer.hpp"
#include "zw/tui/signal.hpp"
#include "zw/tui/viewport_manager.hpp"

namespace zw::tui {

/**
 * @brief Keys the editor understands
 */
enum class Key {
    Character,   // A code point, see KeyEvent::rune
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    PageUp,
    PageDown,
    Backspace,
    Delete,
    Enter,
    Tab,
    Escape,
    Insert,
    Function     // F1..F24, see KeyEvent::function_number
};

/**
 * @brief One input intent delivered to the editor
 */
struct KeyEvent {
    Key key = Key::Character;
    char32_t rune = 0;
    bool ctrl = false;
    bool alt = false;
    int function_number = 0;

    static KeyEvent character(char32_t ch) { return KeyEvent{.key = Key::Character, .rune = ch}; }
    static KeyEvent control(char32_t ch) { return KeyEvent{.key = Key::Character, .rune = ch, .ctrl = true}; }
    static KeyEvent special(Key key) { return KeyEvent{.key = key}; }
    static KeyEvent function(int number) { return KeyEvent{.key = Key::Function, .function_number = number}; }
};

/**
 * @brief Editor behaviour settings
 */
struct EditorOptions {
    size_t tab_width = 4;
    bool insert_spaces_for_tab = false;
    bool auto_indent = true;
    bool read_only = false;
    size_t gutter_width = 0;    // 0 hides the line number gutter
};

/**
 * @brief Logical cursor: line index and code point column
 */
struct CursorPosition {
    size_t line = 0;
    size_t column = 0;

    bool operator==(const CursorPosition&) const = default;
};

/**
 * @brief Multi-line editing engine
 *
 * Owns the document (one GapBuffer per line), the cursor and the viewport.
 * Movement and editing intents are clamped to the document, applied to the
 * line buffers, and followed by a viewport adjustment. Every successful
 * mutation raises the change signal exactly once.
 *
 * Mutating operations are silently ignored in read-only mode, as are edits
 * with nothing to act on (backspace at the start of the document, delete at
 * its end). Neither case raises the change signal.
 *
 * Not thread-safe: confine an instance to the UI thread.
 */
class Editor {
public:
    static constexpr size_t kLineNumberGutterWidth = 4;  // three digits and a separator

    enum class Direction {
        Left,
        Right,
        Up,
        Down,
        Home,          // Beginning of line
        End,           // End of line
        PageUp,
        PageDown,
        DocumentHome,  // Beginning of document
        DocumentEnd    // End of document
    };

    using ChangeSignal = Signal<void()>;
    using KeySignal = Signal<bool(const KeyEvent&)>;

    explicit Editor(EditorOptions options = EditorOptions{});

    // ---- Content ----

    /**
     * @brief Replace the document with the given lines
     *
     * An empty list gives one empty line. Cursor and viewport return to the
     * top-left corner.
     */
    void setContent(const std::vector<std::string>& lines);

    /**
     * @brief Replace the document with text split on '\n'
     */
    void load(std::string_view text);

    std::vector<std::string> lines() const { return buffer_.toLines(); }
    std::string text() const { return buffer_.toString(); }
    size_t lineCount() const { return buffer_.getLineCount(); }
    Result<std::string> line(size_t line_index) const { return buffer_.getLine(line_index); }
    const EditorBuffer& buffer() const { return buffer_; }

    // ---- Configuration ----

    // Non-positive widths are ignored
    void setTabWidth(int width);
    void setInsertSpacesForTab(bool insert_spaces);
    void setAutoIndent(bool auto_indent);
    void setReadOnly(bool read_only);
    // Negative widths are ignored
    void setGutterWidth(int width);
    void showLineNumbers(bool show);

    const EditorOptions& options() const { return options_; }
    bool isReadOnly() const { return options_.read_only; }

    // ---- Geometry ----

    /**
     * @brief Size of the content area, gutter included
     * @return kInvalidArgument for a zero dimension
     */
    Result<void> setViewportSize(size_t width, size_t height);

    const Viewport& viewport() const { return viewport_.getViewport(); }

    /**
     * @brief Where the terminal caret goes
     * @return Position relative to the content area, std::nullopt when the
     *         cursor is scrolled out of view
     */
    std::optional<ScreenPosition> cursorScreenPosition() const;

    // Cursor column with tabs expanded
    size_t visualColumn() const;

    // Visual length of the longest line
    size_t longestLineLength() const { return longest_line_; }

    // ---- Cursor movement ----

    const CursorPosition& cursor() const { return cursor_; }

    /**
     * @brief Move the cursor, clamping line then column to the document
     */
    void moveTo(std::ptrdiff_t line, std::ptrdiff_t column);

    void move(Direction direction);

    void left();
    void right();
    void up();
    void down();
    void home();
    void end();
    void pageUp();
    void pageDown();
    void documentHome();
    void documentEnd();

    // ---- Editing ----

    /**
     * @brief Insert a character at the cursor
     *
     * A tab becomes spaces up to the next tab stop when
     * insert_spaces_for_tab is set.
     */
    void insertChar(char32_t ch);

    // Backspace; joins with the previous line at column 0
    void deleteBackward();

    // Delete; joins the next line at end of line
    void deleteForward();

    /**
     * @brief Break the line at the cursor (Enter)
     *
     * With auto-indent the new line starts with the leading whitespace of the
     * line being split, copied verbatim.
     */
    void splitLine();

    // ---- Input ----

    /**
     * @brief Translate a key into an editor operation
     * @return true when the key was consumed, either by the editor or by an
     *         unhandled-key subscriber
     */
    bool handleKey(const KeyEvent& event);

    ChangeSignal& changed() { return changed_; }
    KeySignal& unhandledKey() { return unhandled_key_; }

private:
    EditorOptions options_;
    EditorBuffer buffer_;
    CursorPosition cursor_;
    ViewportManager viewport_;
    size_t longest_line_ = 0;

    ChangeSignal changed_;
    KeySignal unhandled_key_;

    void setCursor(size_t line, size_t column);
    size_t currentLineLength() const { return buffer_.line(cursor_.line).size(); }
    void updateLongestLine();
    void adjustViewport();
    void contentChanged();
    void requireOk(const Result<void>& result, std::string_view operation) const;
};

} // namespace zw::tui
