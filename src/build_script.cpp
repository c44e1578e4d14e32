#include "build_script.h"

#include "tui.h"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace depconf {

namespace {

constexpr double kMaxExactDoubleInteger{ 9007199254740992.0 };  // 2^53

std::string context_for(std::string const &name) { return "configuration '" + name + "'"; }

attribute_value attribute_value_from_lua(sol::object const &value,
                                         std::string const &key,
                                         std::string const &context) {
  switch (value.get_type()) {
    case sol::type::string: return attribute_value::of(value.as<std::string>());
    case sol::type::boolean: return attribute_value::of(value.as<bool>());
    case sol::type::number: {
      lua_State *L{ value.lua_state() };
      int const stack_before{ lua_gettop(L) };
      value.push();
      bool const is_int{ lua_isinteger(L, -1) != 0 };
      lua_settop(L, stack_before);

      if (is_int) {
        return attribute_value::of(static_cast<std::int64_t>(value.as<lua_Integer>()));
      }

      // Floats are accepted only when they hold an exactly representable integer.
      double const number{ value.as<lua_Number>() };
      if (std::trunc(number) != number) {
        throw std::runtime_error(context + ": attribute '" + key + "' must be an integer");
      }
      if (std::fabs(number) > kMaxExactDoubleInteger) {
        throw std::runtime_error(context + ": attribute '" + key + "' is out of range");
      }
      return attribute_value::of(static_cast<std::int64_t>(number));
    }
    default:
      throw std::runtime_error(context + ": attribute '" + key +
                               "' must be a string, boolean or integer");
  }
}

template <typename Apply>
void for_each_attribute(sol::table const &table, std::string const &context, Apply &&apply) {
  auto const attrs{ sol_util_get_optional<sol::table>(table, "attributes", context) };
  if (!attrs) { return; }

  for (auto const &[k, v] : *attrs) {
    if (!k.is<std::string>()) {
      throw std::runtime_error(context + ": attribute names must be strings");
    }
    auto const key{ k.as<std::string>() };
    auto value{ attribute_value_from_lua(v, key, context) };
    attribute_key attr_key{ key, value.type() };
    apply(std::move(attr_key), std::move(value));
  }
}

publish_artifact artifact_from_lua(sol::table const &t, std::string const &context) {
  auto name{ sol_util_get_required<std::string>(t, "name", context + " artifact") };
  auto type{ sol_util_get_or_default<std::string>(t, "type", "jar", context) };
  auto extension{ sol_util_get_or_default<std::string>(t, "extension", type, context) };
  return { .name = std::move(name),
           .type = std::move(type),
           .extension = std::move(extension),
           .classifier = sol_util_get_or_default<std::string>(t, "classifier", "", context),
           .file = sol_util_get_or_default<std::string>(t, "file", "", context) };
}

capability capability_from_notation(std::string const &notation) {
  auto coords{ parse_coordinate_notation(notation) };
  return { .group = std::move(coords.group),
           .name = std::move(coords.name),
           .version = std::move(coords.version) };
}

// Wraps a Lua function returning dependency notations as a dependency action.
configuration::dependency_action_t lua_dependency_action(sol::protected_function fn,
                                                         resolution_session &session) {
  return [fn = std::move(fn), &session](configuration &config) {
    sol::protected_function_result result{ fn(config.name()) };
    if (!result.valid()) {
      sol::error err = result;
      throw std::runtime_error("Dependency action of " + config.display_name() +
                               " failed: " + err.what());
    }

    sol::object const returned{ result.get<sol::object>() };
    if (returned.get_type() == sol::type::lua_nil) { return; }
    if (!returned.is<sol::table>()) {
      throw std::runtime_error("Dependency action of " + config.display_name() +
                               " must return an array of dependency notations");
    }

    sol::table const notations{ returned.as<sol::table>() };
    for (std::size_t i{ 1 }, n{ notations.size() }; i <= n; ++i) {
      sol::object const item{ notations[i] };
      if (!item.is<std::string>()) {
        throw std::runtime_error("Dependency action of " + config.display_name() +
                                 " returned a non-string notation");
      }
      config.add_dependency(session.make_dependency(item.as<std::string>()));
    }
  };
}

}  // namespace

build_script::build_script(sol_state_ptr lua, std::string chunk_name, resolution_session &session)
    : lua_{ std::move(lua) }, chunk_name_{ std::move(chunk_name) }, session_{ &session } {}

std::unique_ptr<build_script> build_script::load(std::filesystem::path const &path,
                                                 resolution_session &session) {
  return load_string(util_load_file(path), path.string(), session);
}

std::unique_ptr<build_script> build_script::load_string(std::string_view script,
                                                        std::string const &chunk_name,
                                                        resolution_session &session) {
  auto lua{ sol_util_make_lua_state() };
  sol::protected_function_result result{
    lua->safe_script(script, sol::script_pass_on_error, chunk_name)
  };

  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to evaluate build script " + chunk_name + ": " +
                             err.what());
  }

  auto bs{ std::unique_ptr<build_script>(
      new build_script{ std::move(lua), chunk_name, session }) };
  bs->evaluate();
  return bs;
}

void build_script::evaluate() {
  sol::object const project_obj{ (*lua_)["PROJECT"] };
  if (project_obj.get_type() == sol::type::lua_nil) {
    project_path_ = ":";
  } else if (project_obj.is<std::string>()) {
    project_path_ = project_obj.as<std::string>();
  } else {
    throw std::runtime_error("Build script " + chunk_name_ + ": PROJECT must be a string");
  }

  sol::object const configs_obj{ (*lua_)["CONFIGURATIONS"] };
  if (!configs_obj.valid() || !configs_obj.is<sol::table>()) {
    throw std::runtime_error("Build script " + chunk_name_ +
                             " missing required 'CONFIGURATIONS' table");
  }

  container_ = &session_->project(project_path_);

  // Declare first so that extends_from and consistent_with may refer forward.
  sol::table const configs{ configs_obj.as<sol::table>() };
  std::vector<sol::table> tables;
  for (std::size_t i{ 1 }, n{ configs.size() }; i <= n; ++i) {
    sol::object const entry{ configs[i] };
    if (!entry.is<sol::table>()) {
      throw std::runtime_error("Build script " + chunk_name_ + ": CONFIGURATIONS[" +
                               std::to_string(i) + "] must be a table");
    }
    tables.push_back(entry.as<sol::table>());
  }

  for (auto const &t : tables) { declare(t); }
  for (auto const &t : tables) { populate(t); }

  tui::debug("evaluated %s: %zu configuration(s) in project %s",
             chunk_name_.c_str(),
             tables.size(),
             project_path_.c_str());
}

void build_script::declare(sol::table const &t) {
  auto name{ sol_util_get_required<std::string>(t, "name", "configuration") };
  auto const role_name{
    sol_util_get_or_default<std::string>(t, "role", "legacy", context_for(name))
  };
  auto const role{ configuration_role_parse(role_name) };
  if (!role) {
    throw std::runtime_error(context_for(name) + ": unknown role '" + role_name + "'");
  }
  container_->create(std::move(name), *role);
}

void build_script::populate(sol::table const &t) {
  auto const name{ sol_util_get_required<std::string>(t, "name", "configuration") };
  auto const ctx{ context_for(name) };
  auto &config{ container_->get(name) };

  if (auto v{ sol_util_get_optional<bool>(t, "can_be_consumed", ctx) }) {
    config.set_can_be_consumed(*v);
  }
  if (auto v{ sol_util_get_optional<bool>(t, "can_be_resolved", ctx) }) {
    config.set_can_be_resolved(*v);
  }
  if (auto v{ sol_util_get_optional<bool>(t, "can_be_declared_against", ctx) }) {
    config.set_can_be_declared_against(*v);
  }
  if (sol_util_get_or_default<bool>(t, "deprecated_for_consumption", false, ctx)) {
    config.deprecate_for_consumption();
  }
  if (sol_util_get_optional<sol::table>(t, "deprecated_for_resolution", ctx)) {
    config.deprecate_for_resolution(
        sol_util_get_string_array(t, "deprecated_for_resolution", ctx));
  }
  if (sol_util_get_optional<sol::table>(t, "deprecated_for_declaration", ctx)) {
    config.deprecate_for_declaration_against(
        sol_util_get_string_array(t, "deprecated_for_declaration", ctx));
  }

  for (auto const &parent : sol_util_get_string_array(t, "extends_from", ctx)) {
    config.extends_from(container_->get(parent));
  }

  for (auto const &notation : sol_util_get_string_array(t, "dependencies", ctx)) {
    config.add_dependency(session_->make_dependency(notation));
  }

  for (auto const &notation : sol_util_get_string_array(t, "constraints", ctx)) {
    auto dep{ session_->make_dependency(notation) };
    config.add_dependency_constraint(
        { .module = dep.module, .version = std::move(dep.version), .reason = {} });
  }

  for (auto const &ex : sol_util_get_table_array(t, "excludes", ctx)) {
    exclude_rule rule{ .group = sol_util_get_optional<std::string>(ex, "group", ctx),
                       .module = sol_util_get_optional<std::string>(ex, "module", ctx) };
    if (!rule.group && !rule.module) {
      throw std::runtime_error(ctx + ": exclude rule needs a group or a module");
    }
    config.exclude(std::move(rule));
  }

  for_each_attribute(t, ctx, [&](attribute_key key, attribute_value value) {
    config.set_attribute(std::move(key), std::move(value));
  });

  for (auto const &a : sol_util_get_table_array(t, "artifacts", ctx)) {
    config.add_artifact(artifact_from_lua(a, ctx));
  }

  for (auto const &notation : sol_util_get_string_array(t, "capabilities", ctx)) {
    config.add_capability(capability_from_notation(notation));
  }

  for (auto const &v : sol_util_get_table_array(t, "variants", ctx)) {
    auto const variant_name{ sol_util_get_required<std::string>(v, "name", ctx + " variant") };
    auto const vctx{ ctx + " variant '" + variant_name + "'" };
    config.add_variant(variant_name);

    for_each_attribute(v, vctx, [&](attribute_key key, attribute_value value) {
      config.set_variant_attribute(variant_name, std::move(key), std::move(value));
    });
    for (auto const &a : sol_util_get_table_array(v, "artifacts", vctx)) {
      config.add_variant_artifact(variant_name, artifact_from_lua(a, vctx));
    }
    for (auto const &notation : sol_util_get_string_array(v, "capabilities", vctx)) {
      config.add_variant_capability(variant_name, capability_from_notation(notation));
    }
  }

  if (auto source{ sol_util_get_optional<std::string>(t, "consistent_with", ctx) }) {
    config.shift_consistent_resolution_to(container_->get(*source));
  }

  if (auto v{ sol_util_get_optional<bool>(t, "return_all_variants", ctx) }) {
    config.set_return_all_variants(*v);
  }

  // Defaults first, so they see the declared dependencies only.
  if (auto fn{ sol_util_get_optional<sol::protected_function>(t, "default_dependencies", ctx) }) {
    config.default_dependencies(lua_dependency_action(std::move(*fn), *session_));
  }

  if (auto fn{ sol_util_get_optional<sol::protected_function>(t, "with_dependencies", ctx) }) {
    config.with_dependencies(lua_dependency_action(std::move(*fn), *session_));
  }
}

}  // namespace depconf
