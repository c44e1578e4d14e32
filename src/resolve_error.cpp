#include "resolve_error.h"

#include <iterator>

namespace depconf {

namespace {

std::string format_resolve_error(std::string const &configuration,
                                 std::string const &cause,
                                 std::vector<std::string> const &hints) {
  std::string out{ "Could not resolve all dependencies for configuration '" + configuration +
                   "': " + cause };
  for (auto const &hint : hints) { out += "\n  hint: " + hint; }
  return out;
}

}  // namespace

resolve_error::resolve_error(std::string configuration, std::string cause)
    : resolve_error{ std::move(configuration), std::move(cause), {} } {}

resolve_error::resolve_error(std::string configuration,
                             std::string cause,
                             std::vector<std::string> hints)
    : std::runtime_error{ format_resolve_error(configuration, cause, hints) },
      configuration_{ std::move(configuration) },
      cause_{ std::move(cause) },
      hints_{ std::move(hints) } {}

resolve_error resolve_error::with_context(std::vector<std::string> hints) const {
  std::vector<std::string> combined{ hints_ };
  combined.insert(combined.end(),
                  std::make_move_iterator(hints.begin()),
                  std::make_move_iterator(hints.end()));
  return resolve_error{ configuration_, cause_, std::move(combined) };
}

}  // namespace depconf
