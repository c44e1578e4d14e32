#include "module_identifier.h"

#include "trace.h"

#include <utility>

namespace depconf {

module_identifier::module_identifier(std::string group, std::string name)
    : group_{ std::move(group) }, name_{ std::move(name) } {}

std::string module_identifier::to_string() const { return group_ + ":" + name_; }

module_identifier_registry::by_name_t &module_identifier_registry::names_for(
    std::string_view group) {
  std::string key{ group };
  {
    by_group_t::const_accessor existing;
    if (by_group_.find(existing, key)) { return *existing->second; }
  }

  // insert() holds the bucket's write lock until `acc` is released, so only the
  // winning caller allocates the inner map.
  by_group_t::accessor acc;
  if (by_group_.insert(acc, std::move(key))) { acc->second = std::make_unique<by_name_t>(); }
  return *acc->second;
}

module_identifier const &module_identifier_registry::intern(std::string_view group,
                                                            std::string_view name) {
  by_name_t &names{ names_for(group) };
  std::string key{ name };
  {
    by_name_t::const_accessor existing;
    if (names.find(existing, key)) { return *existing->second; }
  }

  by_name_t::accessor acc;
  if (names.insert(acc, key)) {
    acc->second = std::make_unique<module_identifier const>(std::string{ group },
                                                            std::move(key));
    count_.fetch_add(1, std::memory_order_relaxed);
    DEPCONF_TRACE_IDENTIFIER_INTERNED(acc->second->group(), acc->second->name());
  }
  return *acc->second;
}

}  // namespace depconf
