#include "incubation.h"

namespace depconf {

default_incubation_classifier::default_incubation_classifier()
    : default_incubation_classifier{
        {
            standard_attributes::test_suite_type.name(),
            standard_attributes::test_suite_name.name(),
            standard_attributes::test_suite_target_name.name(),
            standard_attributes::verification_type.name(),
        },
        { { standard_attributes::category.name(), "verification" } },
      } {}

default_incubation_classifier::default_incubation_classifier(
    std::set<std::string> incubating_names,
    std::set<std::pair<std::string, std::string>> incubating_values)
    : names_{ std::move(incubating_names) }, values_{ std::move(incubating_values) } {}

bool default_incubation_classifier::is_incubating(attribute_key const &key,
                                                  attribute_value const *value) const {
  if (names_.contains(key.name())) { return true; }
  if (!value) { return false; }

  auto const *text{ value->get_if<std::string>() };
  return text && values_.contains({ key.name(), *text });
}

}  // namespace depconf
