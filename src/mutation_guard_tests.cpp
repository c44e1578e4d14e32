#include "mutation_guard.h"
#include "resolve_error.h"

#include "doctest.h"

namespace depconf {

TEST_CASE("mutation_type_name: human readable names") {
  CHECK(mutation_type_name(mutation_type::dependencies) == "dependencies");
  CHECK(mutation_type_name(mutation_type::strategy) == "resolution strategy");
  CHECK(mutation_type_name(mutation_type::usage) == "usage");
  CHECK(mutation_type_name(static_cast<mutation_type>(99)) == "unknown");
}

TEST_CASE("make_mutation_validator: forwards to the function") {
  auto const validator{ make_mutation_validator([](mutation_type type) {
    return type == mutation_type::artifacts ? std::optional<std::string>{ "because no" }
                                            : std::nullopt;
  }) };

  CHECK(validator->validate(mutation_type::artifacts) == "because no");
  CHECK_FALSE(validator->validate(mutation_type::dependencies).has_value());
}

TEST_CASE("illegal_mutation_error: message and type") {
  illegal_mutation_error const err{ "configuration ':api'",
                                    mutation_type::dependencies,
                                    "after it has been resolved" };
  CHECK(std::string{ err.what() } ==
        "Cannot change dependencies of configuration ':api' after it has been resolved");
  CHECK(err.type() == mutation_type::dependencies);
}

TEST_CASE("validation_error: aggregates every failure") {
  validation_error const err{ {
      { validation_problem::no_allowed_usage, ":a", "first" },
      { validation_problem::dangling_consistent_resolution_source, ":a", "second" },
  } };

  CHECK(err.failures().size() == 2);
  std::string const what{ err.what() };
  CHECK(what.find("2 problems") != std::string::npos);
  CHECK(what.find("  - first") != std::string::npos);
  CHECK(what.find("  - second") != std::string::npos);
  CHECK(validation_problem_name(err.failures()[1].problem) ==
        "dangling_consistent_resolution_source");
}

TEST_CASE("resolve_error: with_context appends hints and keeps the cause") {
  resolve_error const base{ ":runtimeClasspath", "Could not find com.acme:core:1.0" };
  CHECK(base.hints().empty());

  auto const decorated{ base.with_context({ "first hint" }).with_context({ "second hint" }) };
  CHECK(decorated.cause() == base.cause());
  CHECK(decorated.configuration() == ":runtimeClasspath");
  REQUIRE(decorated.hints().size() == 2);
  CHECK(decorated.hints()[0] == "first hint");
  CHECK(decorated.hints()[1] == "second hint");

  std::string const what{ decorated.what() };
  CHECK(what.find("Could not find com.acme:core:1.0") != std::string::npos);
  CHECK(what.find("hint: second hint") != std::string::npos);
}

}  // namespace depconf
