#pragma once

#include "attributes.h"
#include "configuration_role.h"
#include "dependency.h"
#include "incubation.h"
#include "internal_state.h"
#include "mutation_guard.h"
#include "resolve_error.h"
#include "util.h"
#include "variants.h"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace depconf {

class configuration_container;

// A named set of dependencies, exclude rules, attributes and outgoing
// artifacts with its own usage policy and resolution lifecycle.
//
// Mutations are single-writer while the build script runs and always pass the
// mutation guard first. Once locked, every mutation fails and reads no longer
// take the content mutex. State advances monotonically and may be observed
// from any thread.
class configuration : unmovable {
 private:
  struct ctor_tag {
    ctor_tag() = default;
    friend class configuration_container;
  };

 public:
  using dependency_action_t = std::function<void(configuration &)>;
  using before_locking_action_t = std::function<void(configuration &)>;
  using constraint_supplier_t = std::function<std::vector<dependency_constraint>()>;

  configuration(ctor_tag,
                std::string const &project_path,
                std::string name,
                configuration_role role);

  std::string const &name() const { return name_; }
  std::string const &path() const { return path_; }                  // ":app:api"
  std::string const &display_name() const { return display_name_; }  // "configuration ':app:api'"
  configuration_role const &role() const { return role_; }           // role at creation

  // Lifecycle
  internal_state state() const { return state_.load(std::memory_order_acquire); }
  void mark_as_observed(internal_state requested);
  void run_dependency_actions();
  void with_dependencies(dependency_action_t action);
  void default_dependencies(dependency_action_t action);  // runs only while no dependencies

  // Mutation guard
  void add_mutation_validator(mutation_validator_ptr validator);
  void remove_mutation_validator(mutation_validator_ptr const &validator);
  void before_locking(before_locking_action_t action);
  std::vector<validation_failure> prevent_from_further_mutation_lenient();
  void prevent_from_further_mutation();  // throws validation_error
  bool can_be_mutated() const { return !locked_.load(std::memory_order_acquire); }

  // Usage
  bool can_be_consumed() const;
  bool can_be_resolved() const;
  bool can_be_declared_against() const;
  void set_can_be_consumed(bool allowed);
  void set_can_be_resolved(bool allowed);
  void set_can_be_declared_against(bool allowed);
  void prevent_usage_mutation();
  bool usage_mutation_prevented() const;

  void deprecate_for_consumption();
  void deprecate_for_resolution(std::vector<std::string> alternatives);
  void deprecate_for_declaration_against(std::vector<std::string> alternatives);
  bool deprecated_for_consumption() const;
  std::optional<std::vector<std::string>> resolution_alternatives() const;
  std::optional<std::vector<std::string>> declaration_alternatives() const;
  void maybe_emit_resolution_deprecation();

  // Hierarchy
  void extends_from(configuration &parent);
  std::vector<configuration *> extends_from() const;
  std::vector<configuration const *> hierarchy() const;  // this first, then ancestors (DFS, unique)

  // Content
  void add_dependency(dependency dep);
  void add_dependency_constraint(dependency_constraint constraint);
  void exclude(exclude_rule rule);
  std::vector<dependency> dependencies() const;
  std::vector<dependency> all_dependencies() const;  // own then inherited, unique
  std::vector<dependency_constraint> dependency_constraints() const;
  std::set<exclude_rule> exclude_rules() const;
  std::set<exclude_rule> all_exclude_rules() const;

  void set_attribute(attribute_key key, attribute_value value);
  template <attribute_value_type T>
  void set_attribute(attribute<T> const &attr, T value) {
    set_attribute(attr.erased(), attribute_value::of(std::move(value)));
  }
  immutable_attributes attributes() const;
  bool is_incubating(incubation_classifier const &classifier) const;

  void add_artifact(publish_artifact artifact);
  void add_capability(capability cap);
  std::vector<publish_artifact> artifacts() const;
  std::vector<publish_artifact> all_artifacts() const;  // own then inherited
  std::vector<capability> capabilities() const;

  // Secondary variants, visited in declaration order
  void add_variant(std::string variant_name);
  void set_variant_attribute(std::string_view variant_name,
                             attribute_key key,
                             attribute_value value);
  void add_variant_artifact(std::string_view variant_name, publish_artifact artifact);
  void add_variant_capability(std::string_view variant_name, capability cap);
  std::vector<std::string> variant_names() const;

  void collect_variants(variant_visitor &visitor) const;
  outgoing_variant convert_to_outgoing_variant() const { return outgoing_variant{ *this }; }

  // Resolution strategy
  void set_return_all_variants(bool value);
  bool return_all_variants() const;
  void shift_consistent_resolution_to(configuration &source);
  configuration const *consistent_resolution_source() const;
  constraint_supplier_t consistent_resolution_constraints() const;

  // Called by the resolver once the graph is solved; advances to graph_resolved.
  void set_resolution_result(std::vector<resolved_component> components);
  std::vector<resolved_component> resolution_result() const;

  resolve_error maybe_add_context(resolve_error const &error) const;

 private:
  friend class configuration_container;

  template <typename F>
  auto read(F &&fn) const {
    if (locked_.load(std::memory_order_acquire)) { return fn(); }
    std::lock_guard const lock{ mutex_ };
    return fn();
  }

  void validate_mutation(mutation_type type);  // throws illegal_mutation_error
  [[noreturn]] void reject(mutation_type type, std::string const &reason) const;
  void ensure_unlocked(mutation_type type) const;
  void change_usage(bool configuration::*flag, bool allowed, char const *what);
  void warn_usage_change_once(char const *what);
  child_variant &variant_for(std::string_view variant_name);  // call with mutex_ held
  void run_before_locking_actions(std::vector<validation_failure> &failures);
  std::vector<validation_failure> validate_locked() const;

  std::string const name_;
  std::string const path_;
  std::string const display_name_;
  configuration_role const role_;

  std::atomic<internal_state> state_{ internal_state::unresolved };
  std::atomic_bool locked_{ false };
  std::atomic_bool lock_requested_{ false };  // first lenient lock call wins
  std::atomic_bool usage_change_warned_{ false };
  std::atomic_bool resolution_deprecation_warned_{ false };

  mutable std::mutex mutex_;  // guards everything below until locked_
  bool can_be_consumed_;
  bool can_be_resolved_;
  bool can_be_declared_against_;
  bool usage_mutation_prevented_{ false };
  bool deprecated_for_consumption_{ false };
  std::optional<std::vector<std::string>> resolution_alternatives_;
  std::optional<std::vector<std::string>> declaration_alternatives_;
  bool return_all_variants_{ false };
  std::vector<configuration *> extends_from_;
  std::vector<dependency> dependencies_;
  std::vector<dependency_constraint> constraints_;
  std::set<exclude_rule> exclude_rules_;
  mutable_attributes attributes_;
  std::vector<publish_artifact> artifacts_;
  std::vector<capability> capabilities_;
  std::vector<child_variant> variants_;
  configuration *consistent_source_{ nullptr };

  mutable std::mutex validators_mutex_;
  std::vector<mutation_validator_ptr> validators_;

  std::mutex before_locking_mutex_;
  std::vector<before_locking_action_t> before_locking_actions_;
  bool before_locking_ran_{ false };

  std::mutex actions_mutex_;
  std::deque<dependency_action_t> dependency_actions_;  // pending, consumed by run

  mutable std::mutex result_mutex_;
  std::vector<resolved_component> resolution_result_;
};

// True if the configuration, or any configuration it transitively extends,
// can be declared against. Depth-first, stops at the first match.
bool is_declarable_against_by_extension(configuration const &config);

}  // namespace depconf
