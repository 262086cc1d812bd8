#include <iostream>
#include <cstdlib>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "zw/common.hpp"
#include "zw/tui/editor.hpp"
#include "zw/tui/editor_app.hpp"
#include "zw/tui/editor_preferences.hpp"
#include "zw/util/logging.hpp"

namespace {

struct CommandLine {
  std::string file;
  int tab_width = 0;
  bool spaces = false;
  bool line_numbers = false;
  bool no_auto_indent = false;
  bool read_only = false;
  std::string config_dir;
  std::string log_level;
};

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"zw-edit - terminal text editor", "zw-edit"};
  app.set_version_flag("--version", zw::getVersion().toString());

  CommandLine options;
  app.add_option("file", options.file, "File to edit");
  app.add_option("--tab-width", options.tab_width, "Tab width")->check(CLI::Range(1, 16));
  app.add_flag("--spaces", options.spaces, "Insert spaces for tab");
  app.add_flag("--line-numbers", options.line_numbers, "Show line numbers");
  app.add_flag("--no-auto-indent", options.no_auto_indent, "Disable auto-indent on Enter");
  app.add_flag("--read-only", options.read_only, "Open read-only");
  app.add_option("--config", options.config_dir, "Configuration directory");
  app.add_option("--log-level", options.log_level, "Log level")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  try {
    zw::tui::EditorPreferences preferences(options.config_dir);

    auto logging = preferences.getConfig().logging;
    if (!options.log_level.empty()) {
      logging.level = options.log_level;
    }
    auto logging_result = zw::util::setupLogging(logging);
    if (!logging_result) {
      std::cerr << "Error: " << logging_result.error().describe() << std::endl;
      return 1;
    }

    zw::tui::Editor editor;
    preferences.applyTo(editor);

    // Command line overrides the configuration file
    if (options.tab_width > 0) editor.setTabWidth(options.tab_width);
    if (options.spaces) editor.setInsertSpacesForTab(true);
    if (options.line_numbers) editor.showLineNumbers(true);
    if (options.no_auto_indent) editor.setAutoIndent(false);
    if (options.read_only) editor.setReadOnly(true);

    std::optional<std::filesystem::path> file;
    if (!options.file.empty()) {
      file = options.file;
    }

    zw::tui::EditorApp editor_app(editor, file);
    auto load_result = editor_app.load();
    if (!load_result) {
      std::cerr << "Error: " << load_result.error().describe() << std::endl;
      return 1;
    }

    // The terminal belongs to the UI from here on
    zw::util::muteConsoleLogging();
    return editor_app.run();
  } catch (const std::exception& e) {
    spdlog::critical("Fatal error: {}", e.what());
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
