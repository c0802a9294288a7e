#pragma once

#include "decorator.hpp"
#include "error_policy.hpp"
#include "experiment_registry.hpp"
#include "invocation_context.hpp"
#include "resolution_context.hpp"

#include "async/task.hpp"
#include "bee/error.hpp"
#include "bee/time.hpp"

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

namespace splitbit {

struct RouteDecision {
 public:
  // Raw selection, or the default key when selection was skipped or failed
  std::string selected_key;

  // Trial the first attempt runs
  std::string start_key;

  RouteReason reason;
};

// The type independent part of a call: routing, the attempt sequence and the
// audit event. Proxy<Service> supplies the trial invocation.
struct Dispatcher {
 public:
  using ptr = std::shared_ptr<Dispatcher>;

  using AttemptFn =
    std::function<Decorator::Result(const InvocationContext& ctx)>;

  using AsyncAttemptFn =
    std::function<async::Task<Decorator::Result>(const InvocationContext& ctx)>;

  Dispatcher(
    ExperimentRegistry::ptr registry,
    std::shared_ptr<const ExperimentRegistrationBase> registration);

  RouteDecision decide_route(const ResolutionContext& ctx) const;

  // Candidate keys for a call starting at decision.start_key. Kill switched
  // trials other than the default are left out of the fallbacks.
  std::vector<std::string> plan_attempts(const RouteDecision& decision) const;

  // Routes, then runs every planned attempt through the decorator chain until
  // one succeeds. The attempt function only runs the trial. An attempt
  // succeeds only when it yields a value of result_type, the returned result
  // then holds that value.
  Decorator::Result dispatch(
    const std::string& method_name,
    const ResolutionContext& ctx,
    std::shared_ptr<const std::vector<std::any>> arguments,
    const std::type_info& result_type,
    const AttemptFn& attempt_fn) const;

  async::Task<Decorator::Result> dispatch_async(
    std::string method_name,
    ResolutionContext ctx,
    std::shared_ptr<const std::vector<std::any>> arguments,
    const std::type_info& result_type,
    AsyncAttemptFn attempt_fn) const;

  const RegisteredExperiment& experiment() const;

  const ExperimentRegistry& registry() const;

 private:
  InvocationContext _make_context(
    const std::string& method_name,
    const RouteDecision& decision,
    const ResolutionContext& ctx,
    std::shared_ptr<const std::vector<std::any>> arguments) const;

  void _audit(
    const InvocationContext& ctx,
    const RouteDecision& decision,
    const AttemptLog& log,
    bee::Time timestamp,
    bee::Time start) const;

  const ExperimentRegistry::ptr _registry;
  const std::shared_ptr<const ExperimentRegistrationBase> _registration;
};

// Typed entry point for a routed service. A call names the method for
// telemetry and passes a function running it against a trial instance; the
// trial is created fresh for every attempt through its factory.
template <class Service> struct Proxy {
 public:
  using ptr = std::shared_ptr<Proxy>;

  static bee::OrError<ptr> create(const ExperimentRegistry::ptr& registry)
  {
    if (registry == nullptr) { return bee::Error("Registry is null"); }
    auto registration = registry->find<Service>();
    if (registration == nullptr) {
      return bee::Error::format(
        "No experiment registered for service type $",
        std::type_index(typeid(Service)).name());
    }
    return ptr(new Proxy(registry, registration));
  }

  template <class R>
  bee::OrError<R> call(
    const std::string& method_name,
    const ResolutionContext& ctx,
    const std::function<bee::OrError<R>(Service&)>& fn,
    std::vector<std::any> arguments = {}) const
  {
    auto res = _dispatcher->dispatch(
      method_name,
      ctx,
      std::make_shared<const std::vector<std::any>>(std::move(arguments)),
      typeid(R),
      [&](const InvocationContext& attempt) -> Decorator::Result {
        bail(instance, _registration->create_trial(attempt.trial_key, ctx));
        bail(value, fn(*instance));
        return TrialResult::of<R>(std::move(value));
      });
    if (res.is_error()) { return res.error(); }
    return std::any_cast<R>(std::move(res.value().value));
  }

  // Calls a member function, recording the arguments in the invocation
  // context.
  template <class R, class... Params, class... Args>
  bee::OrError<R> invoke(
    const std::string& method_name,
    const ResolutionContext& ctx,
    bee::OrError<R> (Service::*member)(Params...),
    Args... args) const
  {
    return call<R>(
      method_name,
      ctx,
      [member, args...](Service& service) {
        return (service.*member)(args...);
      },
      {std::any(args)...});
  }

  // Same as call() for trials whose methods suspend. Every attempt is
  // awaited before the next one starts.
  template <class R>
  async::Task<bee::OrError<R>> call_async(
    std::string method_name,
    ResolutionContext ctx,
    std::function<async::Task<bee::OrError<R>>(Service&)> fn,
    std::vector<std::any> arguments = {}) const
  {
    auto registration = _registration;
    auto res = co_await _dispatcher->dispatch_async(
      method_name,
      ctx,
      std::make_shared<const std::vector<std::any>>(std::move(arguments)),
      typeid(R),
      [=](const InvocationContext& attempt) {
        return _run_trial_async<R>(registration, attempt.trial_key, ctx, fn);
      });
    if (res.is_error()) { co_return res.error(); }
    co_return std::any_cast<R>(std::move(res.value().value));
  }

  const Dispatcher& dispatcher() const { return *_dispatcher; }

 private:
  using Registration = std::shared_ptr<const ExperimentRegistration<Service>>;

  Proxy(const ExperimentRegistry::ptr& registry, Registration registration)
      : _dispatcher(std::make_shared<Dispatcher>(registry, registration)),
        _registration(std::move(registration))
  {}

  template <class R>
  static async::Task<Decorator::Result> _run_trial_async(
    Registration registration,
    std::string trial_key,
    ResolutionContext ctx,
    std::function<async::Task<bee::OrError<R>>(Service&)> fn)
  {
    co_bail(instance, registration->create_trial(trial_key, ctx));
    co_bail(value, co_await fn(*instance));
    co_return TrialResult::of<R>(std::move(value));
  }

  const Dispatcher::ptr _dispatcher;
  const Registration _registration;
};

} // namespace splitbit
