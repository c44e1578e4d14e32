#include "configuration_role.h"

#include "doctest.h"

namespace depconf {

TEST_CASE("configuration_role: parse known roles") {
  auto const role{ configuration_role_parse("resolvable_dependency_scope") };
  REQUIRE(role.has_value());
  CHECK(*role == configuration_roles::resolvable_dependency_scope);
  CHECK_FALSE(role->consumable);
  CHECK(role->resolvable);
  CHECK(role->declarable);
}

TEST_CASE("configuration_role: parse unknown role") {
  CHECK_FALSE(configuration_role_parse("bucket").has_value());
  CHECK_FALSE(configuration_role_parse("").has_value());
}

TEST_CASE("configuration_role: only legacy allows every usage") {
  CHECK(configuration_roles::legacy.is_legacy());
  CHECK_FALSE(configuration_roles::consumable.is_legacy());
  CHECK_FALSE(configuration_roles::resolvable.is_legacy());
  CHECK_FALSE(configuration_roles::dependency_scope.is_legacy());
}

}  // namespace depconf
