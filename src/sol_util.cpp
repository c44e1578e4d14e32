#include "sol_util.h"

namespace depconf {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

namespace {

template <typename T>
std::vector<T> get_array(sol::table const &table,
                         std::string_view key,
                         std::string_view context) {
  std::vector<T> out;
  auto const arr{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!arr) { return out; }

  for (std::size_t i{ 1 }, n{ arr->size() }; i <= n; ++i) {
    sol::object const element{ (*arr)[i] };
    if (!element.is<T>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a " +
                               std::string(detail::type_name_for_error<T>()));
    }
    out.push_back(element.as<T>());
  }
  return out;
}

}  // namespace

std::vector<std::string> sol_util_get_string_array(sol::table const &table,
                                                   std::string_view key,
                                                   std::string_view context) {
  return get_array<std::string>(table, key, context);
}

std::vector<sol::table> sol_util_get_table_array(sol::table const &table,
                                                 std::string_view key,
                                                 std::string_view context) {
  return get_array<sol::table>(table, key, context);
}

}  // namespace depconf
