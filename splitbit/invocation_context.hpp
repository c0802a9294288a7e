#pragma once

#include "resolution_context.hpp"

#include "bee/span.hpp"
#include "bee/time.hpp"

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace splitbit {

// Why the dispatcher started on the trial it started on.
enum class RouteReason {
  Selected,
  Inactive,
  ExperimentDisabled,
  TrialDisabled,
  SelectionFailed,
  UnknownKey,
};

std::string to_string(RouteReason reason);

// Value a trial produced, or that a decorator supplied in its place. Empty
// when a decorator completed an attempt without one.
struct TrialResult {
 public:
  std::any value;

  template <class T> static TrialResult of(T value)
  {
    return TrialResult{.value = std::any(std::move(value))};
  }
};

// Per attempt view handed to decorators. Values are never mutated, a
// fallback attempt gets a fresh copy through with_trial().
struct InvocationContext {
 public:
  std::string experiment_name;
  std::string service_name;
  std::string method_name;

  // Key the selection produced, kept even when routing overrode it
  std::string selected_key;

  // Key of the trial this attempt runs
  std::string trial_key;

  // 1 for the first attempt of a call
  int attempt = 1;

  std::optional<std::string> subject_id;
  std::shared_ptr<const std::vector<std::any>> arguments;
  CancellationFlag::ptr cancellation;

  bool is_fallback() const;

  InvocationContext with_trial(const std::string& key, int attempt) const;

  std::string to_string() const;
};

// One per completed call, handed to the audit sink.
struct TrialAssignment {
 public:
  std::string experiment_name;
  std::string service_name;
  std::string method_name;
  std::string selected_key;
  std::string executed_key;
  bool is_fallback = false;
  RouteReason route_reason = RouteReason::Selected;
  bee::Time timestamp;
  std::vector<std::string> attempts;
  bee::Span duration;
  std::optional<std::string> error;

  std::string to_string() const;
};

} // namespace splitbit
