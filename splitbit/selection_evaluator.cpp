#include "selection_evaluator.hpp"

#include "sticky_router.hpp"

using std::string;

namespace splitbit {

SelectionEvaluator::SelectionEvaluator(SelectionSources sources)
    : _sources(std::move(sources))
{}

bee::OrError<string> SelectionEvaluator::evaluate(
  const RegisteredExperiment& experiment, const ResolutionContext& ctx) const
{
  const auto& selector = experiment.selector_name;
  switch (experiment.spec.selection.mode) {
  case SelectionMode::BooleanFeatureFlag:
    return _feature_flag(selector, ctx);
  case SelectionMode::VariantFlag:
    return _variant_flag(selector, ctx);
  case SelectionMode::ConfigurationValue:
    return _configuration_value(selector);
  case SelectionMode::StickyRouting:
    if (!ctx.subject_id.has_value()) {
      shot(
        "Experiment '$' uses sticky routing but the call has no subject id",
        experiment.spec.name);
    }
    return StickyRouter::select_trial(
      *ctx.subject_id, selector, experiment.spec.trial_keys);
  case SelectionMode::Custom:
    if (experiment.custom_provider == nullptr) {
      shot(
        "Experiment '$' has no provider for selection mode '$'",
        experiment.spec.name,
        experiment.spec.selection.custom_mode);
    }
    return experiment.custom_provider->resolve(selector, ctx);
  }
  shot("Unknown selection mode for experiment '$'", experiment.spec.name);
}

bee::OrError<string> SelectionEvaluator::_feature_flag(
  const string& flag_name, const ResolutionContext& ctx) const
{
  if (_sources.feature_flags == nullptr) {
    return bee::Error("No feature flag source configured");
  }
  bail(enabled, _sources.feature_flags->is_enabled(flag_name, ctx));
  return string(enabled ? "true" : "false");
}

bee::OrError<string> SelectionEvaluator::_variant_flag(
  const string& flag_name, const ResolutionContext& ctx) const
{
  if (_sources.variant_flags == nullptr) {
    return bee::Error("No variant flag source configured");
  }
  bail(variant, _sources.variant_flags->variant(flag_name, ctx));
  if (!variant.has_value()) {
    shot("Variant flag '$' has no value", flag_name);
  }
  return *variant;
}

bee::OrError<string> SelectionEvaluator::_configuration_value(
  const string& key) const
{
  if (_sources.config_values == nullptr) {
    return bee::Error("No configuration source configured");
  }
  bail(value, _sources.config_values->value(key));
  if (!value.has_value()) { shot("Configuration key '$' is not set", key); }
  return *value;
}

} // namespace splitbit
