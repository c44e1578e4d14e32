#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace depconf {

// Resolution failure for one configuration. Hints are appended by
// configuration::maybe_add_context(); the cause is never replaced.
class resolve_error : public std::runtime_error {
 public:
  resolve_error(std::string configuration, std::string cause);

  std::string const &configuration() const { return configuration_; }
  std::string const &cause() const { return cause_; }
  std::vector<std::string> const &hints() const { return hints_; }

  resolve_error with_context(std::vector<std::string> hints) const;

 private:
  resolve_error(std::string configuration, std::string cause, std::vector<std::string> hints);

  std::string configuration_;
  std::string cause_;
  std::vector<std::string> hints_;
};

}  // namespace depconf
