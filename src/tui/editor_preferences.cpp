#include "zw/tui/editor_preferences.hpp"
#include "zw/util/xdg.hpp"
#include <toml++/toml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <filesystem>

namespace zw::tui {

EditorPreferences::EditorPreferences(const std::filesystem::path& config_dir) {
    if (config_dir.empty()) {
        config_file_ = getConfigDirectory() / kConfigFileName;
    } else {
        config_file_ = config_dir / kConfigFileName;
    }

    // Load existing configuration or use defaults
    auto load_result = loadConfig();
    if (!load_result) {
        spdlog::warn("Using default editor configuration: {}", load_result.error().message());
        config_ = getDefaultConfig();
    } else {
        config_ = load_result.value();
    }
}

Result<EditorConfig> EditorPreferences::loadConfig() {
    if (!std::filesystem::exists(config_file_)) {
        // Return default config if file doesn't exist
        return getDefaultConfig();
    }

    Result<EditorConfig> config = makeErrorResult<EditorConfig>(ErrorCode::kConfigError, "Not loaded");
    try {
        auto toml_data = toml::parse_file(config_file_.string());
        config = parseTomlConfig(toml_data);
    } catch (const toml::parse_error& e) {
        return makeErrorResult<EditorConfig>(ErrorCode::kConfigError,
            "Failed to parse TOML configuration: " + std::string(e.what()));
    } catch (const std::exception& e) {
        return makeErrorResult<EditorConfig>(ErrorCode::kConfigError,
            "Failed to load configuration: " + std::string(e.what()));
    }

    if (!config) {
        return config;
    }

    auto validation = validateConfig(config.value());
    if (!validation) {
        return std::unexpected(validation.error());
    }

    spdlog::debug("Loaded editor configuration from {}", config_file_.string());
    return config;
}

Result<void> EditorPreferences::saveConfig(const EditorConfig& config) {
    // Validate configuration before saving
    auto validation = validateConfig(config);
    if (!validation) {
        return validation;
    }

    // Ensure config directory exists
    auto dir_result = ensureConfigDirectory();
    if (!dir_result) {
        return dir_result;
    }

    try {
        auto toml_data = configToToml(config);

        // Write to temporary file first for atomic update
        auto temp_file = config_file_.string() + ".tmp";
        std::ofstream file(temp_file);
        if (!file) {
            return makeErrorResult<void>(ErrorCode::kFileError,
                "Failed to open configuration file for writing");
        }

        file << toml_data;
        file.close();

        if (file.fail()) {
            std::filesystem::remove(temp_file);
            return makeErrorResult<void>(ErrorCode::kFileError,
                "Failed to write configuration data");
        }

        // Atomic rename
        std::filesystem::rename(temp_file, config_file_);
        return {};

    } catch (const std::exception& e) {
        return makeErrorResult<void>(ErrorCode::kConfigError,
            "Failed to save configuration: " + std::string(e.what()));
    }
}

Result<void> EditorPreferences::updateConfig(const EditorConfig& config) {
    auto validation = validateConfig(config);
    if (!validation) {
        return validation;
    }
    config_ = config;
    return saveConfig(config_);
}

Result<void> EditorPreferences::resetToDefaults() {
    config_ = getDefaultConfig();
    return saveConfig(config_);
}

void EditorPreferences::applyTo(Editor& editor) const {
    const auto& behavior = config_.behavior;
    editor.setTabWidth(static_cast<int>(behavior.tab_width));
    editor.setInsertSpacesForTab(behavior.use_spaces_for_tabs);
    editor.setAutoIndent(behavior.auto_indent);
    editor.setReadOnly(behavior.read_only);
    editor.setGutterWidth(behavior.show_line_numbers ? static_cast<int>(behavior.gutter_width) : 0);
}

SearchOptions EditorPreferences::searchOptions() const {
    SearchOptions options;
    options.wrap_search = config_.search.wrap_search;
    options.max_results = config_.search.max_search_results;
    return options;
}

Result<void> EditorPreferences::validateConfig(const EditorConfig& config) {
    // Validate behavior config
    if (config.behavior.tab_width == 0 || config.behavior.tab_width > 16) {
        return makeErrorResult<void>(ErrorCode::kValidationError,
            "tab_width must be between 1 and 16");
    }

    if (config.behavior.gutter_width > 16) {
        return makeErrorResult<void>(ErrorCode::kValidationError,
            "gutter_width must be between 0 and 16");
    }

    // Validate search config
    if (config.search.max_search_results == 0 || config.search.max_search_results > 100000) {
        return makeErrorResult<void>(ErrorCode::kValidationError,
            "max_search_results must be between 1 and 100000");
    }

    // Validate logging config
    static constexpr std::array<std::string_view, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    if (std::find(kLevels.begin(), kLevels.end(), config.logging.level) == kLevels.end()) {
        return makeErrorResult<void>(ErrorCode::kValidationError,
            "logging level must be one of trace, debug, info, warn, error, critical or off");
    }

    return {};
}

EditorConfig EditorPreferences::getDefaultConfig() {
    return EditorConfig{}; // Uses default values from struct initialization
}

std::filesystem::path EditorPreferences::getConfigDirectory() const {
    return zw::util::Xdg::configHome();
}

Result<EditorConfig> EditorPreferences::parseTomlConfig(const toml::table& toml_data) const {
    EditorConfig config = getDefaultConfig();

    // Negative integers would wrap around; report them as out of range
    auto to_size = [](int64_t value) -> size_t {
        return value < 0 ? static_cast<size_t>(-1) : static_cast<size_t>(value);
    };

    if (auto behavior = toml_data["behavior"].as_table()) {
        auto& b = *behavior;
        if (auto val = b["use_spaces_for_tabs"].value<bool>()) config.behavior.use_spaces_for_tabs = *val;
        if (auto val = b["auto_indent"].value<bool>()) config.behavior.auto_indent = *val;
        if (auto val = b["read_only"].value<bool>()) config.behavior.read_only = *val;
        if (auto val = b["show_line_numbers"].value<bool>()) config.behavior.show_line_numbers = *val;

        if (auto val = b["tab_width"].value<int64_t>()) {
            config.behavior.tab_width = to_size(*val);
        }
        if (auto val = b["gutter_width"].value<int64_t>()) {
            config.behavior.gutter_width = to_size(*val);
        }
    }

    if (auto search = toml_data["search"].as_table()) {
        auto& s = *search;
        if (auto val = s["wrap_search"].value<bool>()) config.search.wrap_search = *val;
        if (auto val = s["max_search_results"].value<int64_t>()) {
            config.search.max_search_results = to_size(*val);
        }
    }

    if (auto logging = toml_data["logging"].as_table()) {
        auto& l = *logging;
        if (auto val = l["level"].value<std::string>()) config.logging.level = *val;
        if (auto val = l["file"].value<std::string>()) config.logging.file = *val;
    }

    if (auto val = toml_data["config_version"].value<std::string>()) {
        config.config_version = *val;
    }

    return config;
}

toml::table EditorPreferences::configToToml(const EditorConfig& config) const {
    toml::table root;

    root.insert("config_version", config.config_version);

    toml::table behavior;
    behavior.insert("tab_width", static_cast<int64_t>(config.behavior.tab_width));
    behavior.insert("use_spaces_for_tabs", config.behavior.use_spaces_for_tabs);
    behavior.insert("auto_indent", config.behavior.auto_indent);
    behavior.insert("read_only", config.behavior.read_only);
    behavior.insert("show_line_numbers", config.behavior.show_line_numbers);
    behavior.insert("gutter_width", static_cast<int64_t>(config.behavior.gutter_width));
    root.insert("behavior", std::move(behavior));

    toml::table search;
    search.insert("wrap_search", config.search.wrap_search);
    search.insert("max_search_results", static_cast<int64_t>(config.search.max_search_results));
    root.insert("search", std::move(search));

    toml::table logging;
    logging.insert("level", config.logging.level);
    logging.insert("file", config.logging.file.string());
    root.insert("logging", std::move(logging));

    return root;
}

Result<void> EditorPreferences::ensureConfigDirectory() const {
    try {
        auto config_dir = config_file_.parent_path();
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
        return {};
    } catch (const std::exception& e) {
        return makeErrorResult<void>(ErrorCode::kFileError,
            "Failed to create configuration directory: " + std::string(e.what()));
    }
}

} // namespace zw::tui
