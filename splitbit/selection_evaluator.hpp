#pragma once

#include "flag_sources.hpp"
#include "registered_experiment.hpp"
#include "resolution_context.hpp"

#include "bee/error.hpp"

#include <string>

namespace splitbit {

struct SelectionSources {
 public:
  FeatureFlagSource::ptr feature_flags;
  VariantFlagSource::ptr variant_flags;
  ConfigValueSource::ptr config_values;
};

// Computes the raw trial key for one call. The key is not checked against
// the registered trials here, the dispatcher does that so it can record the
// raw value.
struct SelectionEvaluator {
 public:
  explicit SelectionEvaluator(SelectionSources sources);

  bee::OrError<std::string> evaluate(
    const RegisteredExperiment& experiment, const ResolutionContext& ctx) const;

 private:
  bee::OrError<std::string> _feature_flag(
    const std::string& flag_name, const ResolutionContext& ctx) const;

  bee::OrError<std::string> _variant_flag(
    const std::string& flag_name, const ResolutionContext& ctx) const;

  bee::OrError<std::string> _configuration_value(const std::string& key) const;

  const SelectionSources _sources;
};

} // namespace splitbit
