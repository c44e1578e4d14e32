#include "attributes.h"

#include "doctest.h"

#include <cstdint>
#include <string>

namespace depconf {

TEST_CASE("attribute_value: equality compares type and value") {
  auto const api{ attribute_value::of(std::string{ "java-api" }) };
  auto const api_again{ attribute_value::of(std::string{ "java-api" }) };
  auto const runtime{ attribute_value::of(std::string{ "java-runtime" }) };
  auto const eleven{ attribute_value::of(std::int64_t{ 11 }) };

  CHECK(api == api_again);
  CHECK_FALSE(api == runtime);
  CHECK_FALSE(api == eleven);
}

TEST_CASE("attribute_value: get_if only yields the stored type") {
  auto const value{ attribute_value::of(std::int64_t{ 17 }) };

  REQUIRE(value.get_if<std::int64_t>() != nullptr);
  CHECK(*value.get_if<std::int64_t>() == 17);
  CHECK(value.get_if<std::string>() == nullptr);
  CHECK(value.get_if<bool>() == nullptr);
}

TEST_CASE("attribute_value: to_string formats booleans as words") {
  CHECK(attribute_value::of(true).to_string() == "true");
  CHECK(attribute_value::of(std::int64_t{ 8 }).to_string() == "8");
  CHECK(attribute_value::of(std::string{ "jar" }).to_string() == "jar");
}

TEST_CASE("attribute_key: same name with different types are distinct keys") {
  attribute<std::string> const as_string{ "org.gradle.jvm.version" };
  attribute<std::int64_t> const as_int{ "org.gradle.jvm.version" };

  CHECK_FALSE(as_string.erased() == as_int.erased());
  CHECK(as_string.erased() == attribute<std::string>{ "org.gradle.jvm.version" }.erased());
}

TEST_CASE("mutable_attributes: typed put and get") {
  mutable_attributes attrs;
  attribute_put(attrs, standard_attributes::usage, std::string{ "java-api" });
  attribute_put(attrs, standard_attributes::target_jvm_version, std::int64_t{ 17 });

  CHECK(attribute_get(attrs, standard_attributes::usage) == "java-api");
  CHECK(attribute_get(attrs, standard_attributes::target_jvm_version) == 17);
  CHECK_FALSE(attribute_get(attrs, standard_attributes::category).has_value());
}

TEST_CASE("mutable_attributes: put replaces the existing value") {
  mutable_attributes attrs;
  attribute_put(attrs, standard_attributes::usage, std::string{ "java-api" });
  attribute_put(attrs, standard_attributes::usage, std::string{ "java-runtime" });

  CHECK(attrs.keys().size() == 1);
  CHECK(attribute_get(attrs, standard_attributes::usage) == "java-runtime");
}

TEST_CASE("mutable_attributes: put rejects a value of the wrong type") {
  mutable_attributes attrs;
  CHECK_THROWS_WITH_AS(
      attrs.put(standard_attributes::usage.erased(), attribute_value::of(std::int64_t{ 3 })),
      doctest::Contains("Unexpected type for attribute 'org.gradle.usage'"),
      std::runtime_error);
  CHECK(attrs.empty());
}

TEST_CASE("mutable_attributes: remove") {
  mutable_attributes attrs;
  attribute_put(attrs, standard_attributes::category, std::string{ "library" });

  CHECK(attrs.remove(standard_attributes::category.erased()));
  CHECK_FALSE(attrs.remove(standard_attributes::category.erased()));
  CHECK(attrs.empty());
}

TEST_CASE("immutable_attributes: snapshot does not follow later writes") {
  mutable_attributes attrs;
  attribute_put(attrs, standard_attributes::usage, std::string{ "java-api" });

  immutable_attributes const snapshot{ attrs.as_immutable() };
  attribute_put(attrs, standard_attributes::usage, std::string{ "java-runtime" });
  attribute_put(attrs, standard_attributes::category, std::string{ "library" });

  CHECK(snapshot.size() == 1);
  CHECK(attribute_get(snapshot, standard_attributes::usage) == "java-api");
}

TEST_CASE("immutable_attributes: equality and to_string") {
  mutable_attributes a;
  attribute_put(a, standard_attributes::usage, std::string{ "java-api" });
  attribute_put(a, standard_attributes::category, std::string{ "library" });

  mutable_attributes b;
  attribute_put(b, standard_attributes::category, std::string{ "library" });
  attribute_put(b, standard_attributes::usage, std::string{ "java-api" });

  CHECK(a.as_immutable() == b.as_immutable());
  CHECK(a.to_string() == "{org.gradle.category=library, org.gradle.usage=java-api}");
  CHECK(immutable_attributes{}.to_string() == "{}");

  attribute_put(b, standard_attributes::usage, std::string{ "java-runtime" });
  CHECK_FALSE(a.as_immutable() == b.as_immutable());
}

}  // namespace depconf
