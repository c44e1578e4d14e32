#include "dependency.h"

#include "doctest.h"

#include <set>

namespace depconf {

TEST_CASE("parse_coordinate_notation: accepts group:name[:version]") {
  auto const full{ parse_coordinate_notation("org.slf4j:slf4j-api:2.0.9") };
  CHECK(full.group == "org.slf4j");
  CHECK(full.name == "slf4j-api");
  CHECK(full.version == "2.0.9");

  auto const bare{ parse_coordinate_notation("com.acme:core") };
  CHECK(bare.group == "com.acme");
  CHECK(bare.name == "core");
  CHECK(bare.version.empty());
}

TEST_CASE("parse_coordinate_notation: rejects malformed notation") {
  SUBCASE("single field") {
    CHECK_THROWS_WITH(parse_coordinate_notation("core"),
                      doctest::Contains("Invalid dependency notation 'core'"));
  }
  SUBCASE("too many fields") {
    CHECK_THROWS_AS(parse_coordinate_notation("a:b:c:d"), std::runtime_error);
  }
  SUBCASE("empty group") { CHECK_THROWS_AS(parse_coordinate_notation(":b:1"), std::runtime_error); }
  SUBCASE("empty name") { CHECK_THROWS_AS(parse_coordinate_notation("a::1"), std::runtime_error); }
}

TEST_CASE("dependency: formatting") {
  module_identifier_registry registry;
  dependency const versioned{ &registry.intern("com.acme", "core"), "1.0" };
  dependency const unversioned{ &registry.intern("com.acme", "core"), "" };

  CHECK(versioned.to_string() == "com.acme:core:1.0");
  CHECK(unversioned.to_string() == "com.acme:core");
  CHECK_FALSE(versioned == unversioned);
  CHECK(versioned == dependency{ &registry.intern("com.acme", "core"), "1.0" });
}

TEST_CASE("dependency_constraint: formatting includes reason") {
  module_identifier_registry registry;
  dependency_constraint const c{ &registry.intern("com.acme", "core"), "1.2", "pinned" };
  CHECK(c.to_string() == "com.acme:core:1.2 (pinned)");
}

TEST_CASE("exclude_rule: value equality and wildcards") {
  exclude_rule const group_only{ .group = "commons-logging", .module = std::nullopt };
  exclude_rule const both{ .group = "org.slf4j", .module = "slf4j-simple" };

  CHECK(group_only.to_string() == "commons-logging:*");
  CHECK(both.to_string() == "org.slf4j:slf4j-simple");

  std::set<exclude_rule> rules{ group_only, both, group_only };
  CHECK(rules.size() == 2);
}

TEST_CASE("publish_artifact and capability: formatting") {
  publish_artifact const sources{ .name = "core",
                                  .type = "jar",
                                  .extension = "jar",
                                  .classifier = "sources",
                                  .file = "build/libs/core-sources.jar" };
  CHECK(sources.to_string() == "core-sources.jar (jar)");

  capability const cap{ .group = "com.acme", .name = "core-test-fixtures", .version = "1.0" };
  CHECK(cap.to_string() == "com.acme:core-test-fixtures:1.0");
}

}  // namespace depconf
