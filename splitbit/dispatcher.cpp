#include "dispatcher.hpp"

#include "activation_gate.hpp"

#include "bee/time.hpp"

using namespace async;

using bee::Time;
using std::shared_ptr;
using std::string;
using std::vector;

namespace splitbit {
namespace {

Decorator::Result require_value(
  const InvocationContext& ctx,
  Decorator::Result result,
  const std::type_info& result_type)
{
  if (result.is_error()) { return result; }
  if (result.value().value.type() != result_type) {
    shot(
      "Attempt $ of $ on trial '$' completed without a result",
      ctx.attempt,
      ctx.method_name,
      ctx.trial_key);
  }
  return result;
}

Task<Decorator::Result> run_attempt_async(
  ExperimentRegistry::ptr registry,
  InvocationContext attempt_ctx,
  Dispatcher::AsyncAttemptFn attempt_fn,
  const std::type_info* result_type)
{
  auto result = co_await registry->decorators().run_async(
    attempt_ctx,
    [attempt_ctx, attempt_fn]() { return attempt_fn(attempt_ctx); });
  co_return require_value(attempt_ctx, std::move(result), *result_type);
}

} // namespace

Dispatcher::Dispatcher(
  ExperimentRegistry::ptr registry,
  shared_ptr<const ExperimentRegistrationBase> registration)
    : _registry(std::move(registry)), _registration(std::move(registration))
{}

const RegisteredExperiment& Dispatcher::experiment() const
{
  return _registration->experiment();
}

const ExperimentRegistry& Dispatcher::registry() const { return *_registry; }

RouteDecision Dispatcher::decide_route(const ResolutionContext& ctx) const
{
  const auto& exp = experiment();
  const auto& spec = exp.spec;
  const auto& default_key = spec.default_key;
  const auto& kill_switch = _registry->kill_switch();

  if (!ActivationGate::is_active(
        spec.activation, exp.named_predicates, _registry->now(), ctx)) {
    return RouteDecision{
      .selected_key = default_key,
      .start_key = default_key,
      .reason = RouteReason::Inactive,
    };
  }

  if (kill_switch->is_experiment_disabled(spec.service_name)) {
    return RouteDecision{
      .selected_key = default_key,
      .start_key = default_key,
      .reason = RouteReason::ExperimentDisabled,
    };
  }

  auto selected = _registry->evaluator().evaluate(exp, ctx);
  if (selected.is_error()) {
    _registry->logger()->log_line(
      "Selection failed for experiment $, using default trial '$': $",
      spec.name,
      default_key,
      selected.error());
    return RouteDecision{
      .selected_key = default_key,
      .start_key = default_key,
      .reason = RouteReason::SelectionFailed,
    };
  }

  const string& key = selected.value();
  if (!spec.has_trial(key)) {
    _registry->logger()->log_line(
      "Experiment $ selected unknown trial '$', using default trial '$'",
      spec.name,
      key,
      default_key);
    return RouteDecision{
      .selected_key = key,
      .start_key = default_key,
      .reason = RouteReason::UnknownKey,
    };
  }

  if (kill_switch->is_trial_disabled(spec.service_name, key)) {
    return RouteDecision{
      .selected_key = key,
      .start_key = default_key,
      .reason = RouteReason::TrialDisabled,
    };
  }

  return RouteDecision{
    .selected_key = key,
    .start_key = key,
    .reason = RouteReason::Selected,
  };
}

vector<string> Dispatcher::plan_attempts(const RouteDecision& decision) const
{
  const auto& spec = experiment().spec;
  if (
    decision.reason == RouteReason::Inactive ||
    decision.reason == RouteReason::ExperimentDisabled) {
    return {spec.default_key};
  }

  auto candidates = ErrorPolicyExecutor::plan_attempts(
    spec.error_policy, decision.start_key, spec.default_key, spec.trial_keys);

  const auto& kill_switch = _registry->kill_switch();
  vector<string> plan;
  for (const auto& key : candidates) {
    if (
      !plan.empty() && key != spec.default_key &&
      kill_switch->is_trial_disabled(spec.service_name, key)) {
      continue;
    }
    plan.push_back(key);
  }
  return plan;
}

InvocationContext Dispatcher::_make_context(
  const string& method_name,
  const RouteDecision& decision,
  const ResolutionContext& ctx,
  shared_ptr<const vector<std::any>> arguments) const
{
  const auto& spec = experiment().spec;
  return InvocationContext{
    .experiment_name = spec.name,
    .service_name = spec.service_name,
    .method_name = method_name,
    .selected_key = decision.selected_key,
    .trial_key = decision.start_key,
    .attempt = 1,
    .subject_id = ctx.subject_id,
    .arguments = std::move(arguments),
    .cancellation = ctx.cancellation,
  };
}

Decorator::Result Dispatcher::dispatch(
  const string& method_name,
  const ResolutionContext& ctx,
  shared_ptr<const vector<std::any>> arguments,
  const std::type_info& result_type,
  const AttemptFn& attempt_fn) const
{
  auto timestamp = _registry->now();
  auto start = Time::monotonic();
  auto decision = decide_route(ctx);
  auto plan = plan_attempts(decision);
  auto base = _make_context(method_name, decision, ctx, std::move(arguments));

  const auto& decorators = _registry->decorators();
  auto log = ErrorPolicyExecutor::run(
    plan, [&](const string& key, int attempt) -> Decorator::Result {
      auto attempt_ctx = base.with_trial(key, attempt);
      return require_value(
        attempt_ctx,
        decorators.run(attempt_ctx, [&]() { return attempt_fn(attempt_ctx); }),
        result_type);
    });

  _audit(base, decision, log, timestamp, start);
  return log.result;
}

Task<Decorator::Result> Dispatcher::dispatch_async(
  string method_name,
  ResolutionContext ctx,
  shared_ptr<const vector<std::any>> arguments,
  const std::type_info& result_type,
  AsyncAttemptFn attempt_fn) const
{
  auto timestamp = _registry->now();
  auto start = Time::monotonic();
  auto decision = decide_route(ctx);
  auto plan = plan_attempts(decision);
  auto base = _make_context(method_name, decision, ctx, std::move(arguments));

  auto registry = _registry;
  const std::type_info* expected = &result_type;
  auto log = co_await ErrorPolicyExecutor::run_async(
    plan, [registry, base, attempt_fn, expected](const string& key, int attempt) {
      return run_attempt_async(
        registry, base.with_trial(key, attempt), attempt_fn, expected);
    });

  _audit(base, decision, log, timestamp, start);
  co_return log.result;
}

void Dispatcher::_audit(
  const InvocationContext& ctx,
  const RouteDecision& decision,
  const AttemptLog& log,
  Time timestamp,
  Time start) const
{
  TrialAssignment assignment{
    .experiment_name = ctx.experiment_name,
    .service_name = ctx.service_name,
    .method_name = ctx.method_name,
    .selected_key = decision.selected_key,
    .executed_key = log.executed_key(),
    .is_fallback = log.executed_key() != decision.selected_key,
    .route_reason = decision.reason,
    .timestamp = timestamp,
    .attempts = log.attempted,
    .duration = Time::monotonic().diff(start),
  };
  if (log.result.is_error()) {
    assignment.error = string(log.result.error().msg());
  }
  _registry->audit_sink()->record(assignment);
}

} // namespace splitbit
