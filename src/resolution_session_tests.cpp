#include "resolution_session.h"

#include "doctest.h"

#include <stdexcept>
#include <thread>
#include <vector>

namespace depconf {

TEST_CASE("configuration_container: create and lookup") {
  configuration_container c{ ":app" };
  auto &api{ c.create("api") };
  auto &impl{ c.create("implementation", configuration_roles::dependency_scope) };

  CHECK(c.size() == 2);
  CHECK(c.find("api") == &api);
  CHECK(&c.get("implementation") == &impl);
  CHECK(c.find("missing") == nullptr);
  CHECK_THROWS_WITH(c.get("missing"), doctest::Contains("not found in project ':app'"));

  auto const all{ c.all() };
  REQUIRE(all.size() == 2);
  CHECK(all[0] == &api);
  CHECK(all[1] == &impl);
}

TEST_CASE("configuration_container: rejects invalid and duplicate names") {
  configuration_container c{ ":" };
  c.create("api");

  CHECK_THROWS_WITH(c.create("api"), doctest::Contains("already exists"));
  CHECK_THROWS_AS(c.create(""), std::runtime_error);
  CHECK_THROWS_AS(c.create("a:b"), std::runtime_error);
  CHECK_THROWS_AS(configuration_container{ "app" }, std::runtime_error);
}

TEST_CASE("configuration_container: addresses stay stable while growing") {
  configuration_container c{ ":" };
  auto *first{ &c.create("c0") };
  for (int i{ 1 }; i < 200; ++i) { c.create("c" + std::to_string(i)); }
  CHECK(c.find("c0") == first);
}

TEST_CASE("configuration_container: lock_all_lenient keeps declaration order") {
  resolution_session session;
  auto &c{ session.project(":") };
  auto &first{ c.create("first", configuration_roles::consumable) };
  c.create("fine");
  auto &second{ c.create("second", configuration_roles::consumable) };
  first.add_dependency(session.make_dependency("com.acme:a:1"));
  second.add_dependency(session.make_dependency("com.acme:b:1"));

  auto const failures{ c.lock_all_lenient() };
  REQUIRE(failures.size() == 2);
  CHECK(failures[0].configuration == ":first");
  CHECK(failures[1].configuration == ":second");
  for (auto const *cfg : c.all()) { CHECK_FALSE(cfg->can_be_mutated()); }
}

TEST_CASE("resolution_session: project is get-or-create") {
  resolution_session session;
  auto &app{ session.project(":app") };
  CHECK(&session.project(":app") == &app);
  CHECK(session.find_project(":app") == &app);
  CHECK(session.find_project(":lib") == nullptr);

  session.project(":lib");
  auto const projects{ session.projects() };
  REQUIRE(projects.size() == 2);
  CHECK(projects[0]->project_path() == ":app");
  CHECK(projects[1]->project_path() == ":lib");
}

TEST_CASE("resolution_session: concurrent project creation yields one container") {
  resolution_session session;
  std::vector<configuration_container *> seen(8, nullptr);
  std::vector<std::thread> threads;
  for (std::size_t i{ 0 }; i < seen.size(); ++i) {
    threads.emplace_back([&, i] { seen[i] = &session.project(":shared"); });
  }
  for (auto &t : threads) { t.join(); }

  for (auto *p : seen) { CHECK(p == seen[0]); }
  CHECK(session.projects().size() == 1);
}

TEST_CASE("resolution_session: make_dependency interns the module") {
  resolution_session session;
  auto const a{ session.make_dependency("com.acme:core:1.0") };
  auto const b{ session.make_dependency("com.acme:core:2.0") };

  CHECK(a.module == b.module);
  CHECK(a.version == "1.0");
  CHECK(session.identifiers().size() == 1);
  CHECK_THROWS_AS(session.make_dependency("nonsense"), std::runtime_error);
}

TEST_CASE("resolution_session: lock_all_lenient spans projects") {
  resolution_session session;
  auto &lib{ session.project(":lib") };
  auto &app{ session.project(":app") };
  lib.create("broken", configuration_roles::dependency_scope).set_can_be_declared_against(false);
  app.create("alsoBroken", configuration_roles::dependency_scope)
      .set_can_be_declared_against(false);
  app.create("ok");

  auto const failures{ session.lock_all_lenient() };
  REQUIRE(failures.size() == 2);
  CHECK(failures[0].configuration == ":app:alsoBroken");
  CHECK(failures[1].configuration == ":lib:broken");
  CHECK(failures[0].problem == validation_problem::no_allowed_usage);
}

TEST_CASE("resolution_session: custom incubation classifier") {
  struct everything_incubates : incubation_classifier {
    bool is_incubating(attribute_key const &, attribute_value const *) const override {
      return true;
    }
  };

  resolution_session session{ std::make_unique<everything_incubates const>() };
  CHECK(session.classifier().is_incubating(standard_attributes::usage.erased(), nullptr));
}

}  // namespace depconf
