#include "cli.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

depconf::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return depconf::cli_parse(static_cast<int>(args.size()), argv.data());
}

struct temp_script {
  temp_script() : path{ std::filesystem::temp_directory_path() / "depconf_cli_test.lua" } {
    std::ofstream{ path } << "CONFIGURATIONS = {}\n";
  }
  ~temp_script() { std::filesystem::remove(path); }

  std::filesystem::path path;
};

}  // namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "depconf" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "depconf", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<depconf::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "depconf", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<depconf::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("subcommand") {
    auto const parsed{ parse({ "depconf", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<depconf::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_validate") {
  temp_script const script;
  auto const parsed{ parse({ "depconf", "validate", script.path.string() }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<depconf::cmd_validate::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK(cfg->script_path == script.path);
}

TEST_CASE("cli_parse: cmd_validate requires an existing script") {
  auto const parsed{ parse({ "depconf", "validate", "/definitely/not/here.lua" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_variants") {
  temp_script const script;

  SUBCASE("defaults") {
    auto const parsed{ parse({ "depconf", "variants", script.path.string() }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<depconf::cmd_variants::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK_FALSE(cfg->configuration.has_value());
    CHECK_FALSE(cfg->all);
  }

  SUBCASE("configuration and all") {
    auto const parsed{ parse({ "depconf",
                               "variants",
                               script.path.string(),
                               "--configuration",
                               "apiElements",
                               "--all" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<depconf::cmd_variants::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->configuration == "apiElements");
    CHECK(cfg->all);
  }
}

TEST_CASE("cli_parse: cmd_dependencies") {
  temp_script const script;
  auto const parsed{ parse(
      { "depconf", "dependencies", script.path.string(), "--configuration", "api" }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<depconf::cmd_dependencies::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK(cfg->configuration == "api");
}

TEST_CASE("cli_parse: logging options") {
  SUBCASE("default is info, undecorated") {
    auto const parsed{ parse({ "depconf", "version" }) };
    CHECK(parsed.verbosity == depconf::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
    CHECK(parsed.trace_outputs.empty());
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "depconf", "--verbose", "version" }) };
    CHECK(parsed.verbosity == depconf::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }

  SUBCASE("--trace defaults to stderr") {
    auto const parsed{ parse({ "depconf", "--trace" }) };
    CHECK(parsed.verbosity == depconf::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == depconf::tui::trace_output_type::std_err);
  }

  SUBCASE("--trace with stderr and file") {
    auto const parsed{ parse({ "depconf", "--trace=stderr,file:/tmp/t.jsonl", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == depconf::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == depconf::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/t.jsonl" });
  }

  SUBCASE("invalid trace spec") {
    auto const parsed{ parse({ "depconf", "--trace=bogus", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: bogus");
  }
}
