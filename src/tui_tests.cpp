#include "tui.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(depconf::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(depconf::tui::set_output_handler(handler));
  CHECK_NOTHROW(depconf::tui::run(depconf::tui::level::TUI_INFO));
  CHECK_NOTHROW(depconf::tui::shutdown());

  CHECK_NOTHROW(depconf::tui::run(std::nullopt));
  CHECK_THROWS_AS(depconf::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(depconf::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(depconf::tui::shutdown());
  CHECK_THROWS_AS(depconf::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(depconf::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    depconf::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      depconf::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

void expect_json_tokens(depconf::trace_event_t const &event,
                        std::vector<std::string> tokens) {
  auto const json{ depconf::trace_event_to_json(event) };
  CHECK_MESSAGE(json.find("\"ts\"") != std::string::npos, "missing timestamp in json");
  tokens.emplace_back(std::string{ "\"event\":\"" } +
                      std::string(depconf::trace_event_name(event)) + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos,
                  "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(depconf::tui::run(std::nullopt));

  depconf::tui::debug("hello %s", "world");
  depconf::tui::info("value %d", 42);
  depconf::tui::warn("three %d", 3);
  depconf::tui::error("boom");

  CHECK_NOTHROW(depconf::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(depconf::tui::run(depconf::tui::level::TUI_DEBUG, true));
  depconf::tui::info("structured %d", 7);
  CHECK_NOTHROW(depconf::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") ==
        line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(depconf::tui::run(depconf::tui::level::TUI_WARN, true));
  depconf::tui::debug("debug");
  depconf::tui::info("info");
  depconf::tui::warn("warn");
  depconf::tui::error("error");
  CHECK_NOTHROW(depconf::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  depconf::tui::configure_trace_outputs(
      { { depconf::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(depconf::tui::run(depconf::tui::level::TUI_TRACE, false));

  depconf::tui::trace(depconf::trace_events::configuration_locked{
      .configuration = ":app:runtimeClasspath",
      .failure_count = 0,
  });

  CHECK_NOTHROW(depconf::tui::shutdown());
  REQUIRE_FALSE(messages.empty());
  CHECK(messages[0].find("configuration_locked") != std::string::npos);
  CHECK(messages[0].find("configuration=:app:runtimeClasspath") != std::string::npos);

  depconf::tui::configure_trace_outputs({});
}

TEST_CASE("trace_event_to_json serializes all event types") {
  expect_json_tokens(
      depconf::trace_events::identifier_interned{ .group = "org.slf4j",
                                                  .name = "slf4j-api" },
      { "\"group\":\"org.slf4j\"", "\"name\":\"slf4j-api\"" });

  expect_json_tokens(
      depconf::trace_events::state_observed{
          .configuration = ":compileClasspath",
          .old_state = depconf::internal_state::unresolved,
          .new_state = depconf::internal_state::graph_resolved,
      },
      { "\"configuration\":\":compileClasspath\"",
        "\"old_state\":\"unresolved\"",
        "\"old_state_num\":0",
        "\"new_state\":\"graph_resolved\"",
        "\"new_state_num\":2" });

  expect_json_tokens(
      depconf::trace_events::dependency_actions_run{ .configuration = ":implementation",
                                                     .action_count = 3 },
      { "\"configuration\":\":implementation\"", "\"action_count\":3" });

  expect_json_tokens(
      depconf::trace_events::configuration_locked{ .configuration = ":apiElements",
                                                   .failure_count = 2 },
      { "\"configuration\":\":apiElements\"", "\"failure_count\":2" });

  expect_json_tokens(
      depconf::trace_events::mutation_rejected{ .configuration = ":api",
                                                .mutation = "dependencies",
                                                .reason = "locked" },
      { "\"configuration\":\":api\"", "\"mutation\":\"dependencies\"",
        "\"reason\":\"locked\"" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto const json{ depconf::trace_event_to_json(depconf::trace_events::mutation_rejected{
      .configuration = ":a",
      .mutation = "usage",
      .reason = "line1\nline2 \"quoted\"",
  }) };
  CHECK(json.find("line1\\nline2 \\\"quoted\\\"") != std::string::npos);
}

TEST_CASE("trace_event_to_string formats human-readable output") {
  auto const output{ depconf::trace_event_to_string(depconf::trace_events::state_observed{
      .configuration = ":runtimeClasspath",
      .old_state = depconf::internal_state::graph_resolved,
      .new_state = depconf::internal_state::artifacts_resolved,
  }) };
  CHECK(output.find("state_observed") != std::string::npos);
  CHECK(output.find("configuration=:runtimeClasspath") != std::string::npos);
  CHECK(output.find("old_state=graph_resolved") != std::string::npos);
  CHECK(output.find("new_state=artifacts_resolved") != std::string::npos);
}

TEST_CASE("g_trace_enabled controls trace event processing") {
  CHECK_FALSE(depconf::tui::g_trace_enabled);

  depconf::tui::configure_trace_outputs(
      { { depconf::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(depconf::tui::g_trace_enabled);

  depconf::tui::configure_trace_outputs({});
  CHECK_FALSE(depconf::tui::g_trace_enabled);
}

TEST_CASE("trace file output writes JSONL format") {
  auto const trace_path{ std::filesystem::temp_directory_path() /
                         "depconf_test_trace.jsonl" };
  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  depconf::tui::configure_trace_outputs(
      { { depconf::tui::trace_output_type::file, trace_path } });
  CHECK(depconf::tui::g_trace_enabled);

  CHECK_NOTHROW(depconf::tui::run(depconf::tui::level::TUI_TRACE, false));
  DEPCONF_TRACE_IDENTIFIER_INTERNED("com.acme", "core");
  DEPCONF_TRACE_DEPENDENCY_ACTIONS_RUN(":implementation", 2);
  CHECK_NOTHROW(depconf::tui::shutdown());

  std::ifstream file{ trace_path };
  REQUIRE(file.is_open());

  std::vector<std::string> lines;
  for (std::string line; std::getline(file, line);) {
    if (!line.empty()) { lines.push_back(line); }
  }
  file.close();

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].find("\"event\":\"identifier_interned\"") != std::string::npos);
  CHECK(lines[1].find("\"event\":\"dependency_actions_run\"") != std::string::npos);
  for (auto const &json_line : lines) {
    CHECK(json_line.front() == '{');
    CHECK(json_line.back() == '}');
  }

  depconf::tui::configure_trace_outputs({});
  std::filesystem::remove(trace_path, ec);
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  auto const dir{ std::filesystem::temp_directory_path() };
  CHECK_THROWS_AS(depconf::tui::configure_trace_outputs(
                      { { depconf::tui::trace_output_type::file, dir / "a.jsonl" },
                        { depconf::tui::trace_output_type::file, dir / "b.jsonl" } }),
                  std::logic_error);
  depconf::tui::configure_trace_outputs({});
}
