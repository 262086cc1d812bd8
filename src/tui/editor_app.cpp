#include "zw/tui/editor_app.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>
#include "zw/tui/unicode_handler.hpp"
#include "zw/tui/viewport_manager.hpp"

using namespace ftxui;

namespace zw::tui {

EditorApp::EditorApp(Editor& editor, std::optional<std::filesystem::path> file)
    : editor_(editor),
      file_(std::move(file)),
      screen_(ScreenInteractive::Fullscreen()) {
    key_connection_ = editor_.unhandledKey().connect([this](const KeyEvent& event) {
        return onUnhandledKey(event);
    });
    change_connection_ = editor_.changed().connect([this]() {
        modified_ = true;
    });
}

EditorApp::~EditorApp() {
    editor_.unhandledKey().disconnect(key_connection_);
    editor_.changed().disconnect(change_connection_);
}

Result<void> EditorApp::load() {
    if (!file_) {
        editor_.load("Welcome to zw-edit.\n\n"
                     "\tCtrl+S saves, Escape or Ctrl+Q quits.\n"
                     "\tCtrl+A and Ctrl+E jump to the start and end of the document.");
        modified_ = false;
        return {};
    }

    if (!std::filesystem::exists(*file_)) {
        editor_.setContent({});
        modified_ = false;
        status_message_ = "New file";
        return {};
    }

    std::ifstream in(*file_, std::ios::binary);
    if (!in) {
        return makeErrorResult<void>(ErrorCode::kFileReadError,
            "Cannot open " + file_->string());
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        return makeErrorResult<void>(ErrorCode::kFileReadError,
            "Failed to read " + file_->string());
    }

    editor_.load(content.str());
    modified_ = false;
    spdlog::info("Opened {} ({} lines)", file_->string(), editor_.lineCount());
    return {};
}

Result<void> EditorApp::save() {
    if (!file_) {
        return makeErrorResult<void>(ErrorCode::kInvalidState, "No file name given");
    }

    std::ofstream out(*file_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeErrorResult<void>(ErrorCode::kFileWriteError,
            "Cannot open " + file_->string() + " for writing");
    }

    out << editor_.text();
    out.close();
    if (out.fail()) {
        return makeErrorResult<void>(ErrorCode::kFileWriteError,
            "Failed to write " + file_->string());
    }

    modified_ = false;
    spdlog::info("Saved {}", file_->string());
    return {};
}

int EditorApp::run() {
    auto main_component = createMainComponent();
    screen_.Loop(main_component);
    return 0;
}

std::optional<KeyEvent> EditorApp::translateEvent(const Event& event) {
    if (event == Event::ArrowLeft) return KeyEvent::special(Key::Left);
    if (event == Event::ArrowRight) return KeyEvent::special(Key::Right);
    if (event == Event::ArrowUp) return KeyEvent::special(Key::Up);
    if (event == Event::ArrowDown) return KeyEvent::special(Key::Down);
    if (event == Event::Home) return KeyEvent::special(Key::Home);
    if (event == Event::End) return KeyEvent::special(Key::End);
    if (event == Event::PageUp) return KeyEvent::special(Key::PageUp);
    if (event == Event::PageDown) return KeyEvent::special(Key::PageDown);
    if (event == Event::Backspace) return KeyEvent::special(Key::Backspace);
    if (event == Event::Delete) return KeyEvent::special(Key::Delete);
    if (event == Event::Return) return KeyEvent::special(Key::Enter);
    if (event == Event::Tab) return KeyEvent::special(Key::Tab);
    if (event == Event::Escape) return KeyEvent::special(Key::Escape);
    if (event == Event::Insert) return KeyEvent::special(Key::Insert);

    const Event function_keys[] = {
        Event::F1, Event::F2, Event::F3, Event::F4, Event::F5, Event::F6,
        Event::F7, Event::F8, Event::F9, Event::F10, Event::F11, Event::F12
    };
    for (int i = 0; i < 12; ++i) {
        if (event == function_keys[i]) {
            return KeyEvent::function(i + 1);
        }
    }

    // Ctrl+letter arrives as a single control byte
    const std::string& input = event.input();
    if (input.size() == 1 && input[0] >= 1 && input[0] <= 26) {
        return KeyEvent::control(static_cast<char32_t>(U'a' + (input[0] - 1)));
    }

    if (event.is_character()) {
        auto code_points = UnicodeHandler::decodeUtf8(event.character());
        if (code_points.size() == 1) {
            return KeyEvent::character(code_points.front());
        }
    }

    return std::nullopt;
}

Component EditorApp::createMainComponent() {
    return Renderer([this] {
        return vbox({
            renderText() | flex,
            renderStatusLine()
        });
    }) | CatchEvent([this](Event event) {
        auto key = translateEvent(event);
        if (!key) {
            return false;
        }
        status_message_.clear();
        return editor_.handleKey(*key);
    });
}

Element EditorApp::renderText() {
    const int width = screen_.dimx();
    const int height = screen_.dimy() - 1;  // Status line
    if (width <= 0 || height <= 0) {
        return text("");
    }

    auto size_result = editor_.setViewportSize(static_cast<size_t>(width),
                                               static_cast<size_t>(height));
    if (!size_result) {
        return text(size_result.error().message());
    }

    const auto& viewport = editor_.viewport();
    Elements rows;
    for (size_t row = 0; row < viewport.height; ++row) {
        const size_t line_index = viewport.offset_y + row;
        if (line_index >= editor_.lineCount()) {
            rows.push_back(text("~") | dim);
            continue;
        }

        Elements cells;
        if (viewport.gutter_width > 0) {
            std::string number = std::to_string(line_index + 1);
            if (number.size() + 1 < viewport.gutter_width) {
                number.insert(0, viewport.gutter_width - 1 - number.size(), ' ');
            }
            cells.push_back(text(number + " ") | color(Color::GrayDark));
        }
        cells.push_back(renderLine(line_index, viewport.textWidth()));
        rows.push_back(hbox(std::move(cells)));
    }
    return vbox(std::move(rows));
}

Element EditorApp::renderLine(size_t line_index, size_t text_width) {
    const auto& viewport = editor_.viewport();
    const auto& line = editor_.buffer().line(line_index);
    const size_t tab_width = editor_.options().tab_width;

    // Expand tabs to the next tab stop
    std::u32string display;
    for (char32_t ch : line) {
        if (ch == U'\t') {
            display.append(tab_width - display.size() % tab_width, U' ');
        } else {
            display.push_back(ch);
        }
    }

    std::u32string visible;
    if (viewport.offset_x < display.size()) {
        visible = display.substr(viewport.offset_x, text_width);
    }

    auto cursor = editor_.cursorScreenPosition();
    if (!cursor || editor_.cursor().line != line_index) {
        return text(UnicodeHandler::encodeUtf8(visible));
    }

    const size_t column = cursor->x - viewport.gutter_width;
    std::u32string before = visible.substr(0, std::min(column, visible.size()));
    std::u32string under = column < visible.size() ? visible.substr(column, 1) : U" ";
    std::u32string after = column + 1 < visible.size() ? visible.substr(column + 1) : U"";

    return hbox({
        text(UnicodeHandler::encodeUtf8(before)),
        text(UnicodeHandler::encodeUtf8(under)) | inverted,
        text(UnicodeHandler::encodeUtf8(after))
    });
}

Element EditorApp::renderStatusLine() {
    std::string name = file_ ? file_->filename().string() : "[scratch]";
    if (modified_) {
        name += " [+]";
    }
    if (editor_.isReadOnly()) {
        name += " [RO]";
    }

    const auto& cursor = editor_.cursor();
    std::string position = std::to_string(cursor.line + 1) + ":" + std::to_string(cursor.column + 1);

    return hbox({
        text(" " + name + " ") | bold,
        text(status_message_) | flex,
        text(" " + position + " ")
    }) | inverted;
}

bool EditorApp::onUnhandledKey(const KeyEvent& event) {
    if (event.key == Key::Escape || (event.ctrl && event.rune == U'q')) {
        screen_.ExitLoopClosure()();
        return true;
    }

    if (event.ctrl && event.rune == U's') {
        auto result = save();
        if (result) {
            status_message_ = "Saved";
        } else {
            status_message_ = result.error().message();
            spdlog::error("Save failed: {}", result.error().message());
        }
        return true;
    }

    return false;
}

} // namespace zw::tui
