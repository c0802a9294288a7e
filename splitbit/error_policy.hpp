#pragma once

#include "experiment_definition.hpp"
#include "invocation_context.hpp"

#include "async/task.hpp"
#include "bee/error.hpp"

#include <functional>
#include <string>
#include <vector>

namespace splitbit {

struct AttemptLog {
 public:
  // Keys in the order they were tried
  std::vector<std::string> attempted;

  // Result of the last attempt
  bee::OrError<TrialResult> result = TrialResult();

  const std::string& executed_key() const;
};

// Runs the attempt sequence an error policy prescribes. Every attempt is an
// independent call of the attempt function; the first success ends the
// sequence, otherwise the error of the last attempt is the result.
struct ErrorPolicyExecutor {
 public:
  using AttemptFn = std::function<bee::OrError<TrialResult>(
    const std::string& key, int attempt)>;

  using AsyncAttemptFn = std::function<async::Task<bee::OrError<TrialResult>>(
    const std::string& key, int attempt)>;

  // The candidate keys, start key first. No key appears twice.
  static std::vector<std::string> plan_attempts(
    const ErrorPolicy& policy,
    const std::string& start_key,
    const std::string& default_key,
    const std::vector<std::string>& trial_keys);

  static AttemptLog run(
    const std::vector<std::string>& plan, const AttemptFn& attempt_fn);

  static async::Task<AttemptLog> run_async(
    std::vector<std::string> plan, AsyncAttemptFn attempt_fn);
};

} // namespace splitbit
