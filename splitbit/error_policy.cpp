#include "error_policy.hpp"

#include <algorithm>

using namespace async;

using std::string;
using std::vector;

namespace splitbit {
namespace {

void add_candidate(vector<string>& plan, const string& key)
{
  if (std::find(plan.begin(), plan.end(), key) != plan.end()) { return; }
  plan.push_back(key);
}

} // namespace

const string& AttemptLog::executed_key() const { return attempted.back(); }

vector<string> ErrorPolicyExecutor::plan_attempts(
  const ErrorPolicy& policy,
  const string& start_key,
  const string& default_key,
  const vector<string>& trial_keys)
{
  vector<string> plan = {start_key};
  switch (policy.kind) {
  case ErrorPolicyKind::Throw:
    break;
  case ErrorPolicyKind::RedirectAndReplayDefault:
    add_candidate(plan, default_key);
    break;
  case ErrorPolicyKind::RedirectAndReplay:
    if (policy.fallback_key.has_value()) {
      add_candidate(plan, *policy.fallback_key);
    }
    break;
  case ErrorPolicyKind::RedirectAndReplayOrdered:
    for (const auto& key : policy.ordered_keys) { add_candidate(plan, key); }
    break;
  case ErrorPolicyKind::RedirectAndReplayAny:
    for (const auto& key : trial_keys) { add_candidate(plan, key); }
    break;
  }
  return plan;
}

AttemptLog ErrorPolicyExecutor::run(
  const vector<string>& plan, const AttemptFn& attempt_fn)
{
  AttemptLog log;
  for (const auto& key : plan) {
    log.attempted.push_back(key);
    log.result = attempt_fn(key, int(log.attempted.size()));
    if (!log.result.is_error()) { break; }
  }
  return log;
}

Task<AttemptLog> ErrorPolicyExecutor::run_async(
  vector<string> plan, AsyncAttemptFn attempt_fn)
{
  AttemptLog log;
  for (const auto& key : plan) {
    log.attempted.push_back(key);
    log.result = co_await attempt_fn(key, int(log.attempted.size()));
    if (!log.result.is_error()) { break; }
  }
  co_return log;
}

} // namespace splitbit
