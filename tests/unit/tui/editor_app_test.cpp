#include <gtest/gtest.h>
#include "zw/tui/editor_app.hpp"
#include "../../common/test_helpers.hpp"

using namespace zw::tui;
using namespace zw;

class EditorAppTest : public zw::test::TempDirTest {
protected:
    Editor editor_;
};

TEST_F(EditorAppTest, DestructionDisconnectsFromEditor) {
    {
        EditorApp app(editor_, std::nullopt);
        EXPECT_EQ(editor_.changed().size(), 1);
        EXPECT_EQ(editor_.unhandledKey().size(), 1);
    }

    EXPECT_TRUE(editor_.changed().empty());
    EXPECT_TRUE(editor_.unhandledKey().empty());

    // Signals raised after the app is gone reach nobody
    editor_.insertChar(U'x');
    EXPECT_FALSE(editor_.handleKey(KeyEvent::special(Key::Escape)));
}

TEST_F(EditorAppTest, EditsMarkModified) {
    EditorApp app(editor_, std::nullopt);
    ASSERT_OK(app.load());
    EXPECT_FALSE(app.isModified());

    editor_.insertChar(U'x');
    EXPECT_TRUE(app.isModified());
}

TEST_F(EditorAppTest, SaveWritesText) {
    auto file = zw::test::writeFile(temp_dir_, "note.txt", "one\ntwo");
    EditorApp app(editor_, file);
    ASSERT_OK(app.load());
    EXPECT_EQ(editor_.lines(), (std::vector<std::string>{"one", "two"}));

    editor_.insertChar(U'>');
    ASSERT_OK(app.save());

    EXPECT_FALSE(app.isModified());
    EXPECT_EQ(zw::test::readFile(file), ">one\ntwo");
}

TEST_F(EditorAppTest, SaveWithoutFileFails) {
    EditorApp app(editor_, std::nullopt);
    EXPECT_ERROR(app.save(), ErrorCode::kInvalidState);
}

TEST_F(EditorAppTest, TranslateEvent) {
    auto left = EditorApp::translateEvent(ftxui::Event::ArrowLeft);
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(left->key, Key::Left);

    auto character = EditorApp::translateEvent(ftxui::Event::Character("x"));
    ASSERT_TRUE(character.has_value());
    EXPECT_EQ(character->key, Key::Character);
    EXPECT_EQ(character->rune, U'x');
    EXPECT_FALSE(character->ctrl);

    auto function = EditorApp::translateEvent(ftxui::Event::F5);
    ASSERT_TRUE(function.has_value());
    EXPECT_EQ(function->key, Key::Function);
    EXPECT_EQ(function->function_number, 5);
}
