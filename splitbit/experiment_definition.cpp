#include "experiment_definition.hpp"

#include "bee/format_optional.hpp"
#include "bee/format_vector.hpp"

#include <set>

using std::set;
using std::string;
using std::vector;

namespace splitbit {

string to_string(SelectionMode mode)
{
  switch (mode) {
  case SelectionMode::BooleanFeatureFlag:
    return "BooleanFeatureFlag";
  case SelectionMode::ConfigurationValue:
    return "ConfigurationValue";
  case SelectionMode::VariantFlag:
    return "VariantFlag";
  case SelectionMode::StickyRouting:
    return "StickyRouting";
  case SelectionMode::Custom:
    return "Custom";
  }
  return "Unknown";
}

string SelectionSpec::to_string() const
{
  string out = splitbit::to_string(mode);
  if (mode == SelectionMode::Custom) { out += "(" + custom_mode + ")"; }
  if (selector_name.has_value()) { out += ":" + *selector_name; }
  return out;
}

string to_string(ErrorPolicyKind kind)
{
  switch (kind) {
  case ErrorPolicyKind::Throw:
    return "Throw";
  case ErrorPolicyKind::RedirectAndReplayDefault:
    return "RedirectAndReplayDefault";
  case ErrorPolicyKind::RedirectAndReplay:
    return "RedirectAndReplay";
  case ErrorPolicyKind::RedirectAndReplayOrdered:
    return "RedirectAndReplayOrdered";
  case ErrorPolicyKind::RedirectAndReplayAny:
    return "RedirectAndReplayAny";
  }
  return "Unknown";
}

////////////////////////////////////////////////////////////////////////////////
// ErrorPolicy
//

ErrorPolicy ErrorPolicy::throw_errors()
{
  return ErrorPolicy{.kind = ErrorPolicyKind::Throw};
}

ErrorPolicy ErrorPolicy::redirect_and_replay_default()
{
  return ErrorPolicy{.kind = ErrorPolicyKind::RedirectAndReplayDefault};
}

ErrorPolicy ErrorPolicy::redirect_and_replay(const string& fallback_key)
{
  return ErrorPolicy{
    .kind = ErrorPolicyKind::RedirectAndReplay,
    .fallback_key = fallback_key,
  };
}

ErrorPolicy ErrorPolicy::redirect_and_replay_ordered(const vector<string>& keys)
{
  return ErrorPolicy{
    .kind = ErrorPolicyKind::RedirectAndReplayOrdered,
    .ordered_keys = keys,
  };
}

ErrorPolicy ErrorPolicy::redirect_and_replay_any()
{
  return ErrorPolicy{.kind = ErrorPolicyKind::RedirectAndReplayAny};
}

string ErrorPolicy::to_string() const
{
  switch (kind) {
  case ErrorPolicyKind::RedirectAndReplay:
    return bee::format("$($)", splitbit::to_string(kind), fallback_key);
  case ErrorPolicyKind::RedirectAndReplayOrdered:
    return bee::format("$($)", splitbit::to_string(kind), ordered_keys);
  default:
    return splitbit::to_string(kind);
  }
}

////////////////////////////////////////////////////////////////////////////////
// ActivationSpec
//

bool ActivationSpec::has_conditions() const
{
  return active_from.has_value() || active_until.has_value() ||
         predicate != nullptr || !named_predicates.empty();
}

////////////////////////////////////////////////////////////////////////////////
// ExperimentSpec
//

bool ExperimentSpec::has_trial(const string& key) const
{
  for (const auto& k : trial_keys) {
    if (k == key) { return true; }
  }
  return false;
}

bee::OrError<bee::Unit> ExperimentSpec::validate() const
{
  if (name.empty()) { return bee::Error("Experiment name cannot be empty"); }
  if (service_name.empty()) {
    shot("Experiment '$' has no service name", name);
  }
  if (trial_keys.empty()) { shot("Experiment '$' has no trials", name); }

  set<string> seen;
  for (const auto& key : trial_keys) {
    if (key.empty()) { shot("Experiment '$' has an empty trial key", name); }
    if (!seen.insert(key).second) {
      shot("Experiment '$' registers trial '$' more than once", name, key);
    }
  }

  if (default_key.empty()) {
    shot("Experiment '$' has no default trial", name);
  }
  if (!has_trial(default_key)) {
    shot(
      "Experiment '$' default trial '$' is not registered", name, default_key);
  }

  if (selection.mode == SelectionMode::Custom && selection.custom_mode.empty()) {
    shot("Experiment '$' uses a custom selection mode without identifier", name);
  }

  switch (error_policy.kind) {
  case ErrorPolicyKind::Throw:
  case ErrorPolicyKind::RedirectAndReplayDefault:
  case ErrorPolicyKind::RedirectAndReplayAny:
    break;
  case ErrorPolicyKind::RedirectAndReplay:
    if (!error_policy.fallback_key.has_value()) {
      shot("Experiment '$' redirect policy has no fallback trial", name);
    }
    if (!has_trial(*error_policy.fallback_key)) {
      shot(
        "Experiment '$' fallback trial '$' is not registered",
        name,
        *error_policy.fallback_key);
    }
    break;
  case ErrorPolicyKind::RedirectAndReplayOrdered:
    if (error_policy.ordered_keys.empty()) {
      shot("Experiment '$' ordered redirect policy lists no trials", name);
    }
    for (const auto& key : error_policy.ordered_keys) {
      if (!has_trial(key)) {
        shot("Experiment '$' fallback trial '$' is not registered", name, key);
      }
    }
    break;
  }

  if (
    activation.active_from.has_value() && activation.active_until.has_value() &&
    *activation.active_until < *activation.active_from) {
    shot("Experiment '$' activation window ends before it starts", name);
  }

  return bee::ok();
}

////////////////////////////////////////////////////////////////////////////////
// ExperimentDefinitionBase
//

ExperimentDefinitionBase::~ExperimentDefinitionBase() {}

} // namespace splitbit
