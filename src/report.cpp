#include "report.h"

#include "report_attribute.h"

#include <sstream>

namespace depconf {

namespace {

constexpr char const *kRule{ "--------------------------------------------------" };
constexpr char const *kIndent{ "    - " };

class report_visitor final : public variant_visitor {
 public:
  report_visitor(configuration const &cfg, incubation_classifier const &classifier)
      : cfg_{ cfg }, classifier_{ classifier } {}

  void visit_artifacts(std::vector<publish_artifact> const &) override {}

  void visit_own_variant(std::string const &,
                         immutable_attributes const &attributes,
                         std::vector<capability> const &capabilities,
                         std::vector<publish_artifact> const &artifacts) override {
    write_variant("Variant " + cfg_.name(), attributes, capabilities, artifacts);
  }

  void visit_child_variant(std::string const &name,
                           std::string const &,
                           immutable_attributes const &attributes,
                           std::vector<capability> const &capabilities,
                           std::vector<publish_artifact> const &artifacts) override {
    write_variant("Secondary variant " + cfg_.name() + ":" + name,
                  attributes,
                  capabilities,
                  artifacts);
  }

  std::string finish() {
    if (saw_incubating_) { out_ << "\n(i) Incubating attribute\n"; }
    return out_.str();
  }

 private:
  void write_variant(std::string const &heading,
                     immutable_attributes const &attributes,
                     std::vector<capability> const &capabilities,
                     std::vector<publish_artifact> const &artifacts) {
    if (variants_++ > 0) { out_ << "\n"; }
    out_ << kRule << "\n" << heading << "\n" << kRule << "\n";

    if (!capabilities.empty()) {
      out_ << "Capabilities\n";
      for (auto const &cap : capabilities) { out_ << kIndent << cap.to_string() << "\n"; }
    }

    auto const keys{ attributes.keys() };
    if (!keys.empty()) {
      out_ << "Attributes\n";
      for (auto const &key : keys) {
        auto const attr{
          report_attribute::from_attribute_in_container(key, attributes, classifier_)
        };
        out_ << kIndent << attr.name() << " = " << attr.value_string();
        if (attr.is_incubating()) {
          out_ << " (i)";
          saw_incubating_ = true;
        }
        out_ << "\n";
      }
    }

    if (!artifacts.empty()) {
      out_ << "Artifacts\n";
      for (auto const &a : artifacts) { out_ << kIndent << a.to_string() << "\n"; }
    }
  }

  configuration const &cfg_;
  incubation_classifier const &classifier_;
  std::ostringstream out_;
  int variants_{ 0 };
  bool saw_incubating_{ false };
};

}  // namespace

std::string report_outgoing_variants(configuration const &cfg,
                                     incubation_classifier const &classifier) {
  report_visitor visitor{ cfg, classifier };
  cfg.collect_variants(visitor);
  return visitor.finish();
}

std::string report_dependencies(configuration const &cfg) {
  std::ostringstream oss;
  oss << cfg.display_name() << "\n";

  auto const deps{ cfg.all_dependencies() };
  oss << "Dependencies\n";
  if (deps.empty()) { oss << "    (none)\n"; }
  for (auto const &d : deps) { oss << kIndent << d.to_string() << "\n"; }

  auto const constraints{ cfg.dependency_constraints() };
  if (!constraints.empty()) {
    oss << "Constraints\n";
    for (auto const &c : constraints) { oss << kIndent << c.to_string() << "\n"; }
  }

  auto const excludes{ cfg.all_exclude_rules() };
  if (!excludes.empty()) {
    oss << "Excludes\n";
    for (auto const &e : excludes) { oss << kIndent << e.to_string() << "\n"; }
  }

  return oss.str();
}

std::string report_validation_failures(std::vector<validation_failure> const &failures) {
  std::ostringstream oss;
  for (auto const &f : failures) {
    oss << "[" << validation_problem_name(f.problem) << "] " << f.message << "\n";
  }
  return oss.str();
}

}  // namespace depconf
