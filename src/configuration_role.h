#pragma once

#include <optional>
#include <string_view>

namespace depconf {

// Usage a configuration is created with. Immutable once assigned.
struct configuration_role {
  std::string_view name;
  bool consumable;
  bool resolvable;
  bool declarable;

  bool is_legacy() const { return consumable && resolvable && declarable; }
  bool operator==(configuration_role const &other) const { return name == other.name; }
};

namespace configuration_roles {
inline constexpr configuration_role legacy{ "legacy", true, true, true };
inline constexpr configuration_role consumable{ "consumable", true, false, false };
inline constexpr configuration_role resolvable{ "resolvable", false, true, false };
inline constexpr configuration_role resolvable_dependency_scope{
  "resolvable_dependency_scope", false, true, true
};
inline constexpr configuration_role consumable_dependency_scope{
  "consumable_dependency_scope", true, false, true
};
inline constexpr configuration_role dependency_scope{ "dependency_scope", false, false, true };
}  // namespace configuration_roles

std::optional<configuration_role> configuration_role_parse(std::string_view name);

}  // namespace depconf
