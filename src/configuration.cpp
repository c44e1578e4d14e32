#include "configuration.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace depconf {

namespace {

constexpr char const *kLockedReason{ "after it has been locked for mutation" };
constexpr char const *kResolvedReason{ "after it has been resolved" };

// Artifacts and usage stay mutable after resolution; everything else that
// feeds the dependency graph does not.
bool blocked_after_resolution(mutation_type type) {
  return type != mutation_type::artifacts && type != mutation_type::usage;
}

std::string quoted_list(std::vector<std::string> const &names) {
  std::vector<std::string> quoted;
  quoted.reserve(names.size());
  for (auto const &n : names) { quoted.push_back("'" + n + "'"); }
  return util_join(quoted, ", ");
}

struct child_snapshot {
  std::string name;
  immutable_attributes attributes;
  std::vector<capability> capabilities;
  std::vector<publish_artifact> artifacts;
};

}  // namespace

configuration::configuration(ctor_tag,
                             std::string const &project_path,
                             std::string name,
                             configuration_role role)
    : name_{ std::move(name) },
      path_{ (project_path == ":" ? std::string{} : project_path) + ":" + name_ },
      display_name_{ "configuration '" + path_ + "'" },
      role_{ role },
      can_be_consumed_{ role.consumable },
      can_be_resolved_{ role.resolvable },
      can_be_declared_against_{ role.declarable } {}

// ---------------------------------------------------------------------------
// Mutation guard

[[noreturn]] void configuration::reject(mutation_type type, std::string const &reason) const {
  DEPCONF_TRACE_MUTATION_REJECTED(path_, std::string{ mutation_type_name(type) }, reason);
  throw illegal_mutation_error{ display_name_, type, reason };
}

void configuration::ensure_unlocked(mutation_type type) const {
  if (locked_.load(std::memory_order_acquire)) { reject(type, kLockedReason); }
}

void configuration::validate_mutation(mutation_type type) {
  ensure_unlocked(type);
  if (blocked_after_resolution(type) && state() >= internal_state::graph_resolved) {
    reject(type, kResolvedReason);
  }

  std::vector<mutation_validator_ptr> validators;
  {
    std::lock_guard const lock{ validators_mutex_ };
    validators = validators_;
  }

  for (auto const &validator : validators) {
    if (auto reason{ validator->validate(type) }) { reject(type, *reason); }
  }
}

void configuration::add_mutation_validator(mutation_validator_ptr validator) {
  std::lock_guard const lock{ validators_mutex_ };
  validators_.push_back(std::move(validator));
}

void configuration::remove_mutation_validator(mutation_validator_ptr const &validator) {
  std::lock_guard const lock{ validators_mutex_ };
  std::erase(validators_, validator);
}

void configuration::before_locking(before_locking_action_t action) {
  std::lock_guard const lock{ before_locking_mutex_ };
  if (before_locking_ran_) {
    throw std::runtime_error("Cannot register a before-locking action on " + display_name_ +
                             " after it has been locked");
  }
  before_locking_actions_.push_back(std::move(action));
}

void configuration::run_before_locking_actions(std::vector<validation_failure> &failures) {
  std::vector<before_locking_action_t> actions;
  {
    std::lock_guard const lock{ before_locking_mutex_ };
    if (before_locking_ran_) { return; }
    before_locking_ran_ = true;
    actions.swap(before_locking_actions_);
  }

  for (auto &action : actions) {
    try {
      action(*this);
    } catch (std::exception const &e) {
      failures.push_back({ .problem = validation_problem::before_locking_action_failed,
                           .configuration = path_,
                           .message = "A before-locking action of " + display_name_ +
                                      " failed: " + e.what() });
    }
  }
}

std::vector<validation_failure> configuration::prevent_from_further_mutation_lenient() {
  // Already locked or being locked: its problems were reported by that call.
  if (lock_requested_.exchange(true, std::memory_order_acq_rel)) { return {}; }

  std::vector<validation_failure> failures;
  run_before_locking_actions(failures);

  {
    std::lock_guard const lock{ mutex_ };
    locked_.store(true, std::memory_order_release);
  }

  auto validation{ validate_locked() };
  failures.insert(failures.end(),
                  std::make_move_iterator(validation.begin()),
                  std::make_move_iterator(validation.end()));

  tui::debug("locked %s (%zu problem(s))", display_name_.c_str(), failures.size());
  DEPCONF_TRACE_CONFIGURATION_LOCKED(path_, failures.size());
  return failures;
}

void configuration::prevent_from_further_mutation() {
  auto failures{ prevent_from_further_mutation_lenient() };
  if (!failures.empty()) { throw validation_error{ std::move(failures) }; }
}

// Runs after locked_ is set, so member reads need no lock.
std::vector<validation_failure> configuration::validate_locked() const {
  std::vector<validation_failure> failures;
  auto const fail{ [&](validation_problem problem, std::string message) {
    failures.push_back(
        { .problem = problem, .configuration = path_, .message = std::move(message) });
  } };

  if (!can_be_consumed_ && !can_be_resolved_ && !can_be_declared_against_) {
    fail(validation_problem::no_allowed_usage,
         display_name_ +
             " has no allowed usage: it cannot be consumed, resolved or declared against");
  }

  if (!can_be_declared_against_ && (!dependencies_.empty() || !constraints_.empty())) {
    fail(validation_problem::declared_against_non_declarable,
         "Dependencies were declared on " + display_name_ +
             ", which does not allow declaring dependencies");
  }

  if (deprecated_for_consumption_ && !can_be_consumed_) {
    fail(validation_problem::deprecated_disallowed_usage,
         display_name_ + " is deprecated for consumption but cannot be consumed");
  }
  if (resolution_alternatives_ && !can_be_resolved_) {
    fail(validation_problem::deprecated_disallowed_usage,
         display_name_ + " is deprecated for resolution but cannot be resolved");
  }
  if (declaration_alternatives_ && !can_be_declared_against_) {
    fail(validation_problem::deprecated_disallowed_usage,
         display_name_ + " is deprecated for declaration but cannot be declared against");
  }

  if (consistent_source_) {
    if (!can_be_resolved_) {
      fail(validation_problem::consistent_resolution_not_resolvable,
           display_name_ + " requests consistent resolution with " +
               consistent_source_->display_name() + " but cannot be resolved itself");
    }
    if (!consistent_source_->can_be_resolved()) {
      fail(validation_problem::dangling_consistent_resolution_source,
           display_name_ + " resolves consistently with " +
               consistent_source_->display_name() + ", which cannot be resolved");
    }
  }

  if (can_be_consumed_) {
    std::vector<std::pair<std::string, immutable_attributes>> exposed;
    if (variants_.empty() || !all_artifacts().empty()) {
      exposed.emplace_back(name_, attributes_.as_immutable());
    }
    for (auto const &v : variants_) { exposed.emplace_back(v.name, v.attributes.as_immutable()); }

    for (std::size_t i{ 0 }; i < exposed.size(); ++i) {
      for (std::size_t j{ i + 1 }; j < exposed.size(); ++j) {
        if (exposed[i].second == exposed[j].second) {
          fail(validation_problem::duplicate_variant_attributes,
               "Variants '" + exposed[i].first + "' and '" + exposed[j].first + "' of " +
                   display_name_ + " have identical attributes " +
                   exposed[i].second.to_string());
        }
      }
    }
  }

  return failures;
}

// ---------------------------------------------------------------------------
// Lifecycle

void configuration::mark_as_observed(internal_state requested) {
  internal_state current{ state_.load(std::memory_order_acquire) };
  while (current < requested) {
    if (state_.compare_exchange_weak(current, requested, std::memory_order_acq_rel)) {
      DEPCONF_TRACE_STATE_OBSERVED(path_, current, requested);
      break;
    }
  }

  for (auto *parent : extends_from()) { parent->mark_as_observed(requested); }
}

void configuration::with_dependencies(dependency_action_t action) {
  std::lock_guard const lock{ actions_mutex_ };
  dependency_actions_.push_back(std::move(action));
}

void configuration::default_dependencies(dependency_action_t action) {
  with_dependencies([fn = std::move(action)](configuration &config) {
    if (config.dependencies().empty()) { fn(config); }
  });
}

void configuration::run_dependency_actions() {
  // One pass over the actions pending at entry; actions registered while
  // running wait for the next call. Concurrent callers each take a disjoint
  // batch. A throwing action is consumed; the ones after it are requeued ahead
  // of anything registered meanwhile.
  std::deque<dependency_action_t> batch;
  {
    std::lock_guard const lock{ actions_mutex_ };
    batch.swap(dependency_actions_);
  }

  std::size_t const count{ batch.size() };
  while (!batch.empty()) {
    auto action{ std::move(batch.front()) };
    batch.pop_front();
    try {
      action(*this);
    } catch (...) {
      std::lock_guard const lock{ actions_mutex_ };
      dependency_actions_.insert(dependency_actions_.begin(),
                                 std::make_move_iterator(batch.begin()),
                                 std::make_move_iterator(batch.end()));
      throw;
    }
  }

  if (count > 0) { DEPCONF_TRACE_DEPENDENCY_ACTIONS_RUN(path_, count); }

  for (auto *parent : extends_from()) { parent->run_dependency_actions(); }
}

// ---------------------------------------------------------------------------
// Usage

bool configuration::can_be_consumed() const {
  return read([this] { return can_be_consumed_; });
}

bool configuration::can_be_resolved() const {
  return read([this] { return can_be_resolved_; });
}

bool configuration::can_be_declared_against() const {
  return read([this] { return can_be_declared_against_; });
}

bool configuration::usage_mutation_prevented() const {
  return read([this] { return usage_mutation_prevented_; });
}

void configuration::warn_usage_change_once(char const *what) {
  if (usage_change_warned_.exchange(true)) { return; }
  tui::warn("Allowed usage is changed on %s (%s). Only configurations with the legacy role "
            "should change their usage.",
            display_name_.c_str(),
            what);
}

void configuration::change_usage(bool configuration::*flag, bool allowed, char const *what) {
  validate_mutation(mutation_type::usage);
  {
    std::lock_guard const lock{ mutex_ };
    ensure_unlocked(mutation_type::usage);
    if (this->*flag == allowed) { return; }
    if (usage_mutation_prevented_) {
      reject(mutation_type::usage, "after usage mutation has been prevented");
    }
    this->*flag = allowed;
  }

  if (!role_.is_legacy()) { warn_usage_change_once(what); }
}

void configuration::set_can_be_consumed(bool allowed) {
  change_usage(&configuration::can_be_consumed_,
               allowed,
               allowed ? "consumable=true" : "consumable=false");
}

void configuration::set_can_be_resolved(bool allowed) {
  change_usage(&configuration::can_be_resolved_,
               allowed,
               allowed ? "resolvable=true" : "resolvable=false");
}

void configuration::set_can_be_declared_against(bool allowed) {
  change_usage(&configuration::can_be_declared_against_,
               allowed,
               allowed ? "declarable=true" : "declarable=false");
}

void configuration::prevent_usage_mutation() {
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::usage);
  usage_mutation_prevented_ = true;
}

void configuration::deprecate_for_consumption() {
  validate_mutation(mutation_type::usage);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::usage);
  if (deprecated_for_consumption_) { return; }
  if (usage_mutation_prevented_) {
    reject(mutation_type::usage, "after usage mutation has been prevented");
  }
  deprecated_for_consumption_ = true;
}

void configuration::deprecate_for_resolution(std::vector<std::string> alternatives) {
  validate_mutation(mutation_type::usage);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::usage);
  if (resolution_alternatives_ == alternatives) { return; }
  if (usage_mutation_prevented_) {
    reject(mutation_type::usage, "after usage mutation has been prevented");
  }
  resolution_alternatives_ = std::move(alternatives);
}

void configuration::deprecate_for_declaration_against(std::vector<std::string> alternatives) {
  validate_mutation(mutation_type::usage);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::usage);
  if (declaration_alternatives_ == alternatives) { return; }
  if (usage_mutation_prevented_) {
    reject(mutation_type::usage, "after usage mutation has been prevented");
  }
  declaration_alternatives_ = std::move(alternatives);
}

bool configuration::deprecated_for_consumption() const {
  return read([this] { return deprecated_for_consumption_; });
}

std::optional<std::vector<std::string>> configuration::resolution_alternatives() const {
  return read([this] { return resolution_alternatives_; });
}

std::optional<std::vector<std::string>> configuration::declaration_alternatives() const {
  return read([this] { return declaration_alternatives_; });
}

void configuration::maybe_emit_resolution_deprecation() {
  auto const alternatives{ resolution_alternatives() };
  if (!alternatives) { return; }
  if (resolution_deprecation_warned_.exchange(true)) { return; }

  if (alternatives->empty()) {
    tui::warn("The %s has been deprecated for resolution.", display_name_.c_str());
  } else {
    tui::warn("The %s has been deprecated for resolution. Please resolve %s instead.",
              display_name_.c_str(),
              quoted_list(*alternatives).c_str());
  }
}

// ---------------------------------------------------------------------------
// Hierarchy

void configuration::extends_from(configuration &parent) {
  if (&parent == this) {
    throw std::runtime_error("Cannot have " + display_name_ + " extend from itself");
  }

  validate_mutation(mutation_type::hierarchy);

  auto const parent_hierarchy{ parent.hierarchy() };
  if (std::ranges::find(parent_hierarchy, this) != parent_hierarchy.end()) {
    std::vector<std::string> names;
    for (auto const *c : parent_hierarchy) { names.push_back(c->display_name()); }
    throw std::runtime_error("Cyclic extendsFrom from " + display_name_ + " and " +
                             parent.display_name() +
                             " is not allowed. See existing hierarchy: [" +
                             util_join(names, ", ") + "]");
  }

  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::hierarchy);
  if (std::ranges::find(extends_from_, &parent) == extends_from_.end()) {
    extends_from_.push_back(&parent);
  }
}

std::vector<configuration *> configuration::extends_from() const {
  return read([this] { return extends_from_; });
}

std::vector<configuration const *> configuration::hierarchy() const {
  std::vector<configuration const *> out;
  std::set<configuration const *> seen;

  auto const visit{ [&](auto const &self, configuration const &config) -> void {
    if (!seen.insert(&config).second) { return; }
    out.push_back(&config);
    for (auto const *parent : config.extends_from()) { self(self, *parent); }
  } };
  visit(visit, *this);

  return out;
}

bool is_declarable_against_by_extension(configuration const &config) {
  std::set<configuration const *> visited;
  std::vector<configuration const *> stack{ &config };

  while (!stack.empty()) {
    auto const *current{ stack.back() };
    stack.pop_back();
    if (!visited.insert(current).second) { continue; }
    if (current->can_be_declared_against()) { return true; }

    auto const parents{ current->extends_from() };
    // Reverse push keeps declaration order on the way down.
    for (auto it{ parents.rbegin() }; it != parents.rend(); ++it) { stack.push_back(*it); }
  }

  return false;
}

// ---------------------------------------------------------------------------
// Content

void configuration::add_dependency(dependency dep) {
  validate_mutation(mutation_type::dependencies);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::dependencies);
  if (std::ranges::find(dependencies_, dep) == dependencies_.end()) {
    dependencies_.push_back(std::move(dep));
  }
}

void configuration::add_dependency_constraint(dependency_constraint constraint) {
  validate_mutation(mutation_type::dependencies);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::dependencies);
  constraints_.push_back(std::move(constraint));
}

void configuration::exclude(exclude_rule rule) {
  validate_mutation(mutation_type::dependencies);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::dependencies);
  exclude_rules_.insert(std::move(rule));
}

std::vector<dependency> configuration::dependencies() const {
  return read([this] { return dependencies_; });
}

std::vector<dependency> configuration::all_dependencies() const {
  std::vector<dependency> out;
  for (auto const *config : hierarchy()) {
    for (auto &dep : config->dependencies()) {
      if (std::ranges::find(out, dep) == out.end()) { out.push_back(std::move(dep)); }
    }
  }
  return out;
}

std::vector<dependency_constraint> configuration::dependency_constraints() const {
  return read([this] { return constraints_; });
}

std::set<exclude_rule> configuration::exclude_rules() const {
  return read([this] { return exclude_rules_; });
}

std::set<exclude_rule> configuration::all_exclude_rules() const {
  std::set<exclude_rule> out;
  for (auto const *config : hierarchy()) { out.merge(config->exclude_rules()); }
  return out;
}

void configuration::set_attribute(attribute_key key, attribute_value value) {
  validate_mutation(mutation_type::attributes);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::attributes);
  attributes_.put(std::move(key), std::move(value));
}

immutable_attributes configuration::attributes() const {
  return read([this] { return attributes_.as_immutable(); });
}

bool configuration::is_incubating(incubation_classifier const &classifier) const {
  auto const attrs{ attributes() };
  return std::ranges::any_of(attrs.keys(), [&](attribute_key const &key) {
    return classifier.is_incubating(key, attrs.find(key));
  });
}

void configuration::add_artifact(publish_artifact artifact) {
  validate_mutation(mutation_type::artifacts);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::artifacts);
  artifacts_.push_back(std::move(artifact));
}

void configuration::add_capability(capability cap) {
  validate_mutation(mutation_type::artifacts);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::artifacts);
  if (std::ranges::find(capabilities_, cap) == capabilities_.end()) {
    capabilities_.push_back(std::move(cap));
  }
}

std::vector<publish_artifact> configuration::artifacts() const {
  return read([this] { return artifacts_; });
}

std::vector<publish_artifact> configuration::all_artifacts() const {
  std::vector<publish_artifact> out;
  for (auto const *config : hierarchy()) {
    for (auto &artifact : config->artifacts()) {
      if (std::ranges::find(out, artifact) == out.end()) { out.push_back(std::move(artifact)); }
    }
  }
  return out;
}

std::vector<capability> configuration::capabilities() const {
  return read([this] { return capabilities_; });
}

// ---------------------------------------------------------------------------
// Variants

child_variant &configuration::variant_for(std::string_view variant_name) {
  auto it{ std::ranges::find_if(variants_,
                                [&](child_variant const &v) { return v.name == variant_name; }) };
  if (it == variants_.end()) {
    throw std::runtime_error("Unknown variant '" + std::string{ variant_name } + "' on " +
                             display_name_);
  }
  return *it;
}

void configuration::add_variant(std::string variant_name) {
  validate_mutation(mutation_type::artifacts);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::artifacts);
  if (std::ranges::any_of(variants_,
                          [&](child_variant const &v) { return v.name == variant_name; })) {
    throw std::runtime_error("Variant '" + variant_name + "' already exists on " +
                             display_name_);
  }
  variants_.push_back(child_variant{ .name = std::move(variant_name) });
}

void configuration::set_variant_attribute(std::string_view variant_name,
                                          attribute_key key,
                                          attribute_value value) {
  validate_mutation(mutation_type::attributes);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::attributes);
  variant_for(variant_name).attributes.put(std::move(key), std::move(value));
}

void configuration::add_variant_artifact(std::string_view variant_name,
                                         publish_artifact artifact) {
  validate_mutation(mutation_type::artifacts);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::artifacts);
  variant_for(variant_name).artifacts.push_back(std::move(artifact));
}

void configuration::add_variant_capability(std::string_view variant_name, capability cap) {
  validate_mutation(mutation_type::artifacts);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::artifacts);
  variant_for(variant_name).capabilities.push_back(std::move(cap));
}

std::vector<std::string> configuration::variant_names() const {
  return read([this] {
    std::vector<std::string> names;
    for (auto const &v : variants_) { names.push_back(v.name); }
    return names;
  });
}

void configuration::collect_variants(variant_visitor &visitor) const {
  visitor.visit_artifacts(artifacts());

  auto const children{ read([this] {
    std::vector<child_snapshot> out;
    for (auto const &v : variants_) {
      out.push_back({ .name = v.name,
                      .attributes = v.attributes.as_immutable(),
                      .capabilities = v.capabilities,
                      .artifacts = v.artifacts });
    }
    return out;
  }) };

  auto const own_capabilities{ capabilities() };
  auto const exposed_artifacts{ all_artifacts() };
  if (children.empty() || !exposed_artifacts.empty()) {
    visitor.visit_own_variant(display_name_, attributes(), own_capabilities, exposed_artifacts);
  }

  for (auto const &child : children) {
    visitor.visit_child_variant(child.name,
                                display_name_ + " variant " + child.name,
                                child.attributes,
                                child.capabilities.empty() ? own_capabilities
                                                           : child.capabilities,
                                child.artifacts);
  }
}

std::string const &outgoing_variant::display_name() const { return source_->display_name(); }

immutable_attributes outgoing_variant::attributes() const { return source_->attributes(); }

std::vector<capability> outgoing_variant::capabilities() const {
  return source_->capabilities();
}

std::vector<publish_artifact> outgoing_variant::artifacts() const {
  return source_->all_artifacts();
}

// ---------------------------------------------------------------------------
// Resolution strategy

void configuration::set_return_all_variants(bool value) {
  validate_mutation(mutation_type::strategy);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::strategy);
  return_all_variants_ = value;
}

bool configuration::return_all_variants() const {
  return read([this] { return return_all_variants_; });
}

void configuration::shift_consistent_resolution_to(configuration &source) {
  if (&source == this) {
    throw std::runtime_error("Cannot resolve " + display_name_ + " consistently with itself");
  }

  validate_mutation(mutation_type::strategy);
  std::lock_guard const lock{ mutex_ };
  ensure_unlocked(mutation_type::strategy);
  consistent_source_ = &source;
}

configuration const *configuration::consistent_resolution_source() const {
  return read([this]() -> configuration const * { return consistent_source_; });
}

configuration::constraint_supplier_t configuration::consistent_resolution_constraints() const {
  configuration const *source{ consistent_resolution_source() };
  if (!source) {
    return [] { return std::vector<dependency_constraint>{}; };
  }

  return [source, path = path_] {
    if (source->state() < internal_state::graph_resolved) {
      throw std::runtime_error("Cannot compute consistent resolution constraints for '" + path +
                               "': " + source->display_name() + " has not been resolved");
    }

    std::string const reason{ "version resolved in " + source->display_name() +
                              " by consistent resolution" };
    std::vector<dependency_constraint> constraints;
    for (auto const &component : source->resolution_result()) {
      constraints.push_back(
          { .module = component.module, .version = component.version, .reason = reason });
    }
    return constraints;
  };
}

void configuration::set_resolution_result(std::vector<resolved_component> components) {
  {
    std::lock_guard const lock{ result_mutex_ };
    resolution_result_ = std::move(components);
  }
  mark_as_observed(internal_state::graph_resolved);
}

std::vector<resolved_component> configuration::resolution_result() const {
  std::lock_guard const lock{ result_mutex_ };
  return resolution_result_;
}

resolve_error configuration::maybe_add_context(resolve_error const &error) const {
  std::vector<std::string> hints;

  if (!can_be_resolved()) {
    hints.push_back(display_name_ + " is not meant to be resolved; resolve a configuration "
                                    "that extends from it instead");
  }

  if (auto const alternatives{ resolution_alternatives() };
      alternatives && !alternatives->empty()) {
    hints.push_back(display_name_ + " is deprecated for resolution; resolve " +
                    quoted_list(*alternatives) + " instead");
  }

  if (auto const *source{ consistent_resolution_source() }) {
    hints.push_back("versions are pinned by consistent resolution with " +
                    source->display_name());
  }

  if (hints.empty()) { return error; }
  return error.with_context(std::move(hints));
}

}  // namespace depconf
