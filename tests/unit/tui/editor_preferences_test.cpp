#include <gtest/gtest.h>
#include "zw/tui/editor_preferences.hpp"
#include "../../common/test_helpers.hpp"
#include <filesystem>

using namespace zw::tui;
using namespace zw;

class EditorPreferencesTest : public zw::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_file_ = temp_dir_ / "editor.toml";
    }

    std::filesystem::path config_file_;
};

TEST_F(EditorPreferencesTest, DefaultConfigCreation) {
    EditorPreferences prefs(temp_dir_);
    const auto& config = prefs.getConfig();

    EXPECT_EQ(config.behavior.tab_width, 4);
    EXPECT_FALSE(config.behavior.use_spaces_for_tabs);
    EXPECT_TRUE(config.behavior.auto_indent);
    EXPECT_FALSE(config.behavior.read_only);
    EXPECT_FALSE(config.behavior.show_line_numbers);
    EXPECT_EQ(config.behavior.gutter_width, Editor::kLineNumberGutterWidth);

    EXPECT_TRUE(config.search.wrap_search);
    EXPECT_EQ(config.search.max_search_results, 1000);

    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.file.empty());
    EXPECT_EQ(config.config_version, "1.0");

    // Nothing is written until asked
    EXPECT_EQ(prefs.getConfigFile(), config_file_);
    EXPECT_FALSE(std::filesystem::exists(config_file_));
}

TEST_F(EditorPreferencesTest, SaveAndLoadConfig) {
    EditorPreferences prefs(temp_dir_);

    EditorConfig config = prefs.getConfig();
    config.behavior.tab_width = 8;
    config.behavior.use_spaces_for_tabs = true;
    config.behavior.auto_indent = false;
    config.behavior.show_line_numbers = true;
    config.behavior.gutter_width = 6;
    config.search.wrap_search = false;
    config.search.max_search_results = 250;
    config.logging.level = "debug";
    config.logging.file = temp_dir_ / "editor.log";

    ASSERT_OK(prefs.saveConfig(config));
    EXPECT_TRUE(std::filesystem::exists(config_file_));
    EXPECT_FALSE(std::filesystem::exists(config_file_.string() + ".tmp"));

    EditorPreferences reloaded(temp_dir_);
    const auto& loaded = reloaded.getConfig();
    EXPECT_EQ(loaded.behavior.tab_width, 8);
    EXPECT_TRUE(loaded.behavior.use_spaces_for_tabs);
    EXPECT_FALSE(loaded.behavior.auto_indent);
    EXPECT_FALSE(loaded.behavior.read_only);
    EXPECT_TRUE(loaded.behavior.show_line_numbers);
    EXPECT_EQ(loaded.behavior.gutter_width, 6);
    EXPECT_FALSE(loaded.search.wrap_search);
    EXPECT_EQ(loaded.search.max_search_results, 250);
    EXPECT_EQ(loaded.logging.level, "debug");
    EXPECT_EQ(loaded.logging.file, temp_dir_ / "editor.log");
}

TEST_F(EditorPreferencesTest, SaveCreatesConfigDirectory) {
    auto nested = temp_dir_ / "nested" / "dir";
    EditorPreferences prefs(nested);

    ASSERT_OK(prefs.resetToDefaults());
    EXPECT_TRUE(std::filesystem::exists(nested / "editor.toml"));
}

TEST_F(EditorPreferencesTest, PartialFileKeepsDefaults) {
    zw::test::writeFile(temp_dir_, "editor.toml",
        "[behavior]\n"
        "tab_width = 2\n");

    EditorPreferences prefs(temp_dir_);
    const auto& config = prefs.getConfig();
    EXPECT_EQ(config.behavior.tab_width, 2);
    EXPECT_TRUE(config.behavior.auto_indent);
    EXPECT_EQ(config.search.max_search_results, 1000);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(EditorPreferencesTest, InvalidTomlFile) {
    zw::test::writeFile(temp_dir_, "editor.toml", "[behavior\ntab_width = = 3\n");

    EditorPreferences prefs(temp_dir_);
    EXPECT_ERROR(prefs.loadConfig(), ErrorCode::kConfigError);

    // Constructor falls back to defaults
    EXPECT_EQ(prefs.getConfig().behavior.tab_width, 4);
}

TEST_F(EditorPreferencesTest, OutOfRangeValuesInFile) {
    zw::test::writeFile(temp_dir_, "editor.toml",
        "[behavior]\n"
        "tab_width = -3\n");

    EditorPreferences prefs(temp_dir_);
    EXPECT_ERROR(prefs.loadConfig(), ErrorCode::kValidationError);
    EXPECT_EQ(prefs.getConfig().behavior.tab_width, 4);
}

TEST_F(EditorPreferencesTest, ConfigValidation) {
    auto config = EditorPreferences::getDefaultConfig();
    EXPECT_OK(EditorPreferences::validateConfig(config));

    config.behavior.tab_width = 0;
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.behavior.tab_width = 17;
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.behavior.tab_width = 16;
    EXPECT_OK(EditorPreferences::validateConfig(config));

    config.behavior.gutter_width = 17;
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.behavior.gutter_width = 0;
    EXPECT_OK(EditorPreferences::validateConfig(config));

    config.search.max_search_results = 0;
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.search.max_search_results = 100001;
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.search.max_search_results = 100000;
    EXPECT_OK(EditorPreferences::validateConfig(config));

    config.logging.level = "verbose";
    EXPECT_ERROR(EditorPreferences::validateConfig(config), ErrorCode::kValidationError);
    config.logging.level = "off";
    EXPECT_OK(EditorPreferences::validateConfig(config));
}

TEST_F(EditorPreferencesTest, InvalidConfigIsNotSaved) {
    EditorPreferences prefs(temp_dir_);

    auto config = prefs.getConfig();
    config.behavior.tab_width = 0;

    EXPECT_ERROR(prefs.updateConfig(config), ErrorCode::kValidationError);
    EXPECT_EQ(prefs.getConfig().behavior.tab_width, 4);
    EXPECT_FALSE(std::filesystem::exists(config_file_));
}

TEST_F(EditorPreferencesTest, UpdateConfig) {
    EditorPreferences prefs(temp_dir_);

    auto config = prefs.getConfig();
    config.behavior.read_only = true;
    ASSERT_OK(prefs.updateConfig(config));

    EXPECT_TRUE(prefs.getConfig().behavior.read_only);
    EXPECT_NE(zw::test::readFile(config_file_).find("read_only = true"), std::string::npos);
}

TEST_F(EditorPreferencesTest, ResetToDefaults) {
    EditorPreferences prefs(temp_dir_);

    auto config = prefs.getConfig();
    config.behavior.tab_width = 2;
    ASSERT_OK(prefs.updateConfig(config));

    ASSERT_OK(prefs.resetToDefaults());
    EXPECT_EQ(prefs.getConfig().behavior.tab_width, 4);

    EditorPreferences reloaded(temp_dir_);
    EXPECT_EQ(reloaded.getConfig().behavior.tab_width, 4);
}

TEST_F(EditorPreferencesTest, ApplyToEditor) {
    EditorPreferences prefs(temp_dir_);

    auto config = prefs.getConfig();
    config.behavior.tab_width = 2;
    config.behavior.use_spaces_for_tabs = true;
    config.behavior.auto_indent = false;
    config.behavior.read_only = true;
    config.behavior.show_line_numbers = true;
    config.behavior.gutter_width = 5;
    ASSERT_OK(prefs.updateConfig(config));

    Editor editor;
    prefs.applyTo(editor);

    const auto& options = editor.options();
    EXPECT_EQ(options.tab_width, 2);
    EXPECT_TRUE(options.insert_spaces_for_tab);
    EXPECT_FALSE(options.auto_indent);
    EXPECT_TRUE(editor.isReadOnly());
    EXPECT_EQ(options.gutter_width, 5);
}

TEST_F(EditorPreferencesTest, ApplyToEditorHidesGutter) {
    EditorPreferences prefs(temp_dir_);

    Editor editor;
    editor.showLineNumbers(true);
    prefs.applyTo(editor);

    EXPECT_EQ(editor.options().gutter_width, 0);
}

TEST_F(EditorPreferencesTest, SearchOptionsFromConfig) {
    EditorPreferences prefs(temp_dir_);

    auto config = prefs.getConfig();
    config.search.wrap_search = false;
    config.search.max_search_results = 10;
    ASSERT_OK(prefs.updateConfig(config));

    auto options = prefs.searchOptions();
    EXPECT_FALSE(options.wrap_search);
    EXPECT_EQ(options.max_results, 10);
}
