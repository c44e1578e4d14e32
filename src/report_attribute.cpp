#include "report_attribute.h"

namespace depconf {

report_attribute::report_attribute(std::string name,
                                   std::optional<attribute_value> value,
                                   bool incubating)
    : name_{ std::move(name) }, value_{ std::move(value) }, incubating_{ incubating } {}

report_attribute report_attribute::from_attribute_in_container(
    attribute_key const &key,
    attribute_container const &container,
    incubation_classifier const &classifier) {
  attribute_value const *value{ container.find(key) };
  std::optional<attribute_value> captured;
  if (value) { captured = *value; }
  return report_attribute{ key.name(), std::move(captured), classifier.is_incubating(key, value) };
}

std::string report_attribute::value_string() const {
  return value_ ? value_->to_string() : "(null)";
}

}  // namespace depconf
