#include "mutation_guard.h"

#include <array>

namespace depconf {

namespace {

constinit std::array<std::string_view, 7> const mutation_type_name_table{ {
    "dependencies",
    "dependency attributes",
    "artifacts",
    "attributes",
    "resolution strategy",
    "hierarchy",
    "usage",
} };

constinit std::array<std::string_view, 7> const validation_problem_name_table{ {
    "no_allowed_usage",
    "declared_against_non_declarable",
    "deprecated_disallowed_usage",
    "consistent_resolution_not_resolvable",
    "dangling_consistent_resolution_source",
    "duplicate_variant_attributes",
    "before_locking_action_failed",
} };

class function_mutation_validator final : public mutation_validator {
 public:
  explicit function_mutation_validator(
      std::function<std::optional<std::string>(mutation_type)> fn)
      : fn_{ std::move(fn) } {}

  std::optional<std::string> validate(mutation_type type) const override { return fn_(type); }

 private:
  std::function<std::optional<std::string>(mutation_type)> fn_;
};

std::string build_validation_message(std::vector<validation_failure> const &failures) {
  std::string out{ "Configuration validation failed with " + std::to_string(failures.size()) +
                   (failures.size() == 1 ? " problem:" : " problems:") };
  for (auto const &f : failures) { out += "\n  - " + f.message; }
  return out;
}

}  // namespace

std::string_view mutation_type_name(mutation_type type) {
  auto const idx{ static_cast<std::size_t>(type) };
  if (idx >= mutation_type_name_table.size()) { return "unknown"; }
  return mutation_type_name_table[idx];
}

std::string_view validation_problem_name(validation_problem problem) {
  auto const idx{ static_cast<std::size_t>(problem) };
  if (idx >= validation_problem_name_table.size()) { return "unknown"; }
  return validation_problem_name_table[idx];
}

mutation_validator_ptr make_mutation_validator(
    std::function<std::optional<std::string>(mutation_type)> fn) {
  return std::make_shared<function_mutation_validator const>(std::move(fn));
}

illegal_mutation_error::illegal_mutation_error(std::string const &configuration_display_name,
                                               mutation_type type,
                                               std::string const &reason)
    : std::runtime_error{ "Cannot change " + std::string{ mutation_type_name(type) } + " of " +
                          configuration_display_name + " " + reason },
      type_{ type } {}

validation_error::validation_error(std::vector<validation_failure> failures)
    : std::runtime_error{ build_validation_message(failures) },
      failures_{ std::move(failures) } {}

}  // namespace depconf
