#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace depconf {

enum class mutation_type {
  dependencies,
  dependency_attributes,
  artifacts,
  attributes,
  strategy,
  hierarchy,
  usage,
};

std::string_view mutation_type_name(mutation_type type);

// Invoked synchronously on the mutating thread before every mutation is
// applied. Returning a reason vetoes the mutation. Must not block.
class mutation_validator {
 public:
  virtual ~mutation_validator() = default;
  virtual std::optional<std::string> validate(mutation_type type) const = 0;
};

using mutation_validator_ptr = std::shared_ptr<mutation_validator const>;

mutation_validator_ptr make_mutation_validator(
    std::function<std::optional<std::string>(mutation_type)> fn);

class illegal_mutation_error : public std::runtime_error {
 public:
  illegal_mutation_error(std::string const &configuration_display_name,
                         mutation_type type,
                         std::string const &reason);

  mutation_type type() const { return type_; }

 private:
  mutation_type type_;
};

enum class validation_problem {
  no_allowed_usage,
  declared_against_non_declarable,
  deprecated_disallowed_usage,
  consistent_resolution_not_resolvable,
  dangling_consistent_resolution_source,
  duplicate_variant_attributes,
  before_locking_action_failed,
};

std::string_view validation_problem_name(validation_problem problem);

struct validation_failure {
  validation_problem problem;
  std::string configuration;  // path
  std::string message;
};

// Strict form of lock-time validation: every collected failure in one error.
class validation_error : public std::runtime_error {
 public:
  explicit validation_error(std::vector<validation_failure> failures);

  std::vector<validation_failure> const &failures() const { return failures_; }

 private:
  std::vector<validation_failure> failures_;
};

}  // namespace depconf
