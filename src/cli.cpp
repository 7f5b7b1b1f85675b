#include "cli.h"

#include "generator.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace packup {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "packup - package Conan dependencies into deployable artifacts" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  cmd_package::cfg package_cfg{};
  app.add_option("-g,--generator", package_cfg.generators, "Output format (repeatable)")
      ->check(CLI::IsMember(generator::names()));
  app.add_option("-c,--config", package_cfg.config_path, "Path to the INI config file")
      ->capture_default_str();
  app.add_option("-o,--output-dir",
                 package_cfg.output_dir,
                 "Artifact directory (defaults to the current directory)");

  std::optional<std::filesystem::path> cache_root;
  app.add_option("--cache-root", cache_root, "Cache root directory");

  cli_args args{};

  bool parsed{ false };
  try {
    app.parse(argc, argv);
    parsed = true;
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    args.help_requested = true;
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }
  args.cache_root = cache_root;

  if (!parsed) { return args; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (package_cfg.generators.empty()) {
    args.cli_output = "At least one -g/--generator is required\n\n" + app.help();
    return args;
  }

  args.cmd_cfg = package_cfg;
  return args;
}

}  // namespace packup
