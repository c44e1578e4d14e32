#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  depconf::tui::init();

  auto args{ depconf::cli_parse(argc, argv) };
  depconf::tui::configure_trace_outputs(args.trace_outputs);
  depconf::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      depconf::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    depconf::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return depconf::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    depconf::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
