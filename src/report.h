#pragma once

#include "configuration.h"
#include "incubation.h"
#include "mutation_guard.h"

#include <string>
#include <vector>

namespace depconf {

// Outgoing variants of cfg in the order collect_variants visits them: the own
// variant (when exposed) then each secondary variant. Incubating attributes
// carry an "(i)" marker with a legend at the end.
std::string report_outgoing_variants(configuration const &cfg,
                                     incubation_classifier const &classifier);

// Own plus inherited dependencies, own constraints and all exclude rules.
std::string report_dependencies(configuration const &cfg);

// One line per failure: "[problem] message".
std::string report_validation_failures(std::vector<validation_failure> const &failures);

}  // namespace depconf
