#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include "zw/common.hpp"
#include "zw/tui/editor.hpp"

namespace zw::tui {

/**
 * @brief Full-screen FTXUI host for a single Editor
 *
 * Feeds terminal events to Editor::handleKey and renders the visible region.
 * Ctrl+S saves, Escape and Ctrl+Q quit; both arrive through the editor's
 * unhandled-key signal.
 */
class EditorApp {
public:
    EditorApp(Editor& editor, std::optional<std::filesystem::path> file);
    ~EditorApp();

    EditorApp(const EditorApp&) = delete;
    EditorApp& operator=(const EditorApp&) = delete;

    /**
     * @brief Load the file (a missing file starts an empty document)
     */
    Result<void> load();

    Result<void> save();

    /**
     * @brief Run the event loop until the user quits
     * @return Process exit code
     */
    int run();

    bool isModified() const { return modified_; }

    /**
     * @brief Map a terminal event to an editor key
     * @return std::nullopt for events with no key meaning (mouse, resize)
     */
    static std::optional<KeyEvent> translateEvent(const ftxui::Event& event);

private:
    Editor& editor_;
    std::optional<std::filesystem::path> file_;
    ftxui::ScreenInteractive screen_;
    std::string status_message_;
    bool modified_ = false;
    Editor::KeySignal::Connection key_connection_ = 0;
    Editor::ChangeSignal::Connection change_connection_ = 0;

    ftxui::Component createMainComponent();
    ftxui::Element renderText();
    ftxui::Element renderLine(size_t line_index, size_t text_width);
    ftxui::Element renderStatusLine();
    bool onUnhandledKey(const KeyEvent& event);
};

} // namespace zw::tui
