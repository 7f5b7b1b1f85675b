#include "cli.h"
#include "libcurl_util.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  packup::tui::init();

  auto args{ packup::cli_parse(argc, argv) };
  packup::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (args.help_requested) {
      packup::tui::print_stdout("%s", args.cli_output.c_str());
      return EXIT_SUCCESS;
    }
    packup::tui::error("%s", args.cli_output.c_str());
    return EXIT_FAILURE;
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    packup::libcurl_ensure_initialized();
    auto cmd{ std::visit(
        [&args](auto const &cfg) { return packup::cmd::create(cfg, args.cache_root); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    packup::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
