#include "configuration_role.h"

#include <algorithm>
#include <array>

namespace depconf {

namespace {

constinit std::array<configuration_role, 6> const role_table{ {
    configuration_roles::legacy,
    configuration_roles::consumable,
    configuration_roles::resolvable,
    configuration_roles::resolvable_dependency_scope,
    configuration_roles::consumable_dependency_scope,
    configuration_roles::dependency_scope,
} };

}  // namespace

std::optional<configuration_role> configuration_role_parse(std::string_view name) {
  if (auto it{ std::ranges::find(role_table, name, &configuration_role::name) };
      it != role_table.end()) {
    return *it;
  }
  return std::nullopt;
}

}  // namespace depconf
