#pragma once

#include <string>
#include <filesystem>
#include <toml++/toml.h>
#include "zw/common.hpp"
#include "zw/tui/editor.hpp"
#include "zw/tui/editor_search.hpp"
#include "zw/util/logging.hpp"

namespace zw::tui {

/**
 * @brief Editor behavior configuration
 */
struct EditorBehaviorConfig {
    size_t tab_width = 4;
    bool use_spaces_for_tabs = false;
    bool auto_indent = true;
    bool read_only = false;
    bool show_line_numbers = false;
    size_t gutter_width = Editor::kLineNumberGutterWidth;  // Used when line numbers are shown
};

/**
 * @brief Search configuration
 */
struct EditorSearchConfig {
    bool wrap_search = true;
    size_t max_search_results = 1000;
};

/**
 * @brief Complete editor configuration
 */
struct EditorConfig {
    EditorBehaviorConfig behavior;
    EditorSearchConfig search;
    util::LoggingConfig logging;

    std::string config_version = "1.0";
};

/**
 * @brief Editor preferences manager with TOML persistence
 *
 * Manages editor configuration with:
 * - TOML file persistence using toml++
 * - Configuration validation
 * - Default value fallbacks
 * - XDG-compliant configuration directory
 */
class EditorPreferences {
public:
    static constexpr const char* kConfigFileName = "editor.toml";

    /**
     * @param config_dir Directory holding editor.toml; empty selects
     *        $XDG_CONFIG_HOME/zeichenwerk
     */
    explicit EditorPreferences(const std::filesystem::path& config_dir = {});

    /**
     * @brief Load configuration from TOML file
     * @return Configuration (defaults when the file does not exist),
     *         kConfigError for unreadable TOML, kValidationError for values
     *         out of range
     */
    Result<EditorConfig> loadConfig();

    /**
     * @brief Save configuration to TOML file
     *
     * Writes to a temporary file and renames it over the target.
     */
    Result<void> saveConfig(const EditorConfig& config);

    const EditorConfig& getConfig() const { return config_; }
    const std::filesystem::path& getConfigFile() const { return config_file_; }

    /**
     * @brief Update configuration and save to file
     */
    Result<void> updateConfig(const EditorConfig& config);

    /**
     * @brief Reset to default configuration and save it
     */
    Result<void> resetToDefaults();

    /**
     * @brief Push behavior settings into an editor
     */
    void applyTo(Editor& editor) const;

    SearchOptions searchOptions() const;

    static Result<void> validateConfig(const EditorConfig& config);

    static EditorConfig getDefaultConfig();

private:
    std::filesystem::path config_file_;
    EditorConfig config_;

    std::filesystem::path getConfigDirectory() const;
    Result<EditorConfig> parseTomlConfig(const toml::table& toml_data) const;
    toml::table configToToml(const EditorConfig& config) const;
    Result<void> ensureConfigDirectory() const;
};

} // namespace zw::tui
