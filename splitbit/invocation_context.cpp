#include "invocation_context.hpp"

#include "bee/format.hpp"
#include "bee/format_optional.hpp"
#include "bee/format_vector.hpp"

using std::string;

namespace splitbit {

string to_string(RouteReason reason)
{
  switch (reason) {
  case RouteReason::Selected:
    return "selected";
  case RouteReason::Inactive:
    return "inactive";
  case RouteReason::ExperimentDisabled:
    return "experiment-disabled";
  case RouteReason::TrialDisabled:
    return "trial-disabled";
  case RouteReason::SelectionFailed:
    return "selection-failed";
  case RouteReason::UnknownKey:
    return "unknown-key";
  }
  return "unknown";
}

////////////////////////////////////////////////////////////////////////////////
// InvocationContext
//

bool InvocationContext::is_fallback() const
{
  return trial_key != selected_key;
}

InvocationContext InvocationContext::with_trial(
  const string& key, int attempt_number) const
{
  auto out = *this;
  out.trial_key = key;
  out.attempt = attempt_number;
  return out;
}

string InvocationContext::to_string() const
{
  return bee::format(
    "$.$ trial:$ selected:$ attempt:$",
    service_name,
    method_name,
    trial_key,
    selected_key,
    attempt);
}

////////////////////////////////////////////////////////////////////////////////
// TrialAssignment
//

string TrialAssignment::to_string() const
{
  return bee::format(
    "experiment:$ method:$ selected:$ executed:$ fallback:$ reason:$ "
    "attempts:$ error:$",
    experiment_name,
    method_name,
    selected_key,
    executed_key,
    is_fallback,
    splitbit::to_string(route_reason),
    attempts,
    error);
}

} // namespace splitbit
