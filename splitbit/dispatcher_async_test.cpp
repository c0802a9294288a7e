#include "dispatcher.hpp"

#include "audit_sink.hpp"
#include "flag_sources.hpp"
#include "testing_support.hpp"

#include "async/async_command.hpp"
#include "bee/format.hpp"
#include "bee/format_vector.hpp"
#include "command/command_builder.hpp"

#include <cassert>
#include <functional>
#include <utility>

using namespace async;

using bee::print_line;
using std::make_shared;
using std::shared_ptr;
using std::string;
using std::vector;

namespace splitbit {
namespace {

struct Quote {
 public:
  virtual ~Quote() {}
  virtual Task<bee::OrError<string>> quote(int items) = 0;
};

struct QuoteLog {
 public:
  vector<string> quotes;
  vector<CancellationFlag::ptr> factory_cancellations;
};

struct ScriptedQuote : public Quote {
 public:
  ScriptedQuote(string name, bool fail, shared_ptr<QuoteLog> log)
      : _name(std::move(name)), _fail(fail), _log(std::move(log))
  {}

  virtual Task<bee::OrError<string>> quote(int items) override
  {
    _log->quotes.push_back(_name);
    if (_fail) { co_return bee::Error::format("$ failed", _name); }
    co_return bee::format("$:$", _name, items);
  }

 private:
  string _name;
  bool _fail;
  shared_ptr<QuoteLog> _log;
};

TrialFactory<Quote> scripted(
  const string& name, bool fail, const shared_ptr<QuoteLog>& log)
{
  return [=](const ResolutionContext& ctx) -> bee::OrError<shared_ptr<Quote>> {
    log->factory_cancellations.push_back(ctx.cancellation);
    return shared_ptr<Quote>(make_shared<ScriptedQuote>(name, fail, log));
  };
}

// Awaits the rest of the chain and records which trials completed.
struct AwaitingDecorator : public Decorator {
 public:
  virtual Result invoke(const InvocationContext&, const Next& next) override
  {
    return next();
  }

  virtual Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override
  {
    auto result = co_await next();
    completed.push_back(ctx.trial_key);
    co_return result;
  }

  vector<string> completed;
};

// Completes attempts on the "true" trial without a value.
struct EmptyForNewTrial : public Decorator {
 public:
  virtual Result invoke(const InvocationContext&, const Next& next) override
  {
    return next();
  }

  virtual Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override
  {
    if (ctx.trial_key == "true") { co_return TrialResult(); }
    co_return co_await next();
  }
};

struct Fixture {
 public:
  InMemoryFlags::ptr flags = InMemoryFlags::create();
  InMemoryAuditSink::ptr audit = InMemoryAuditSink::create();
  TraceCapturingDecorator::ptr trace = TraceCapturingDecorator::create();
  shared_ptr<AwaitingDecorator> awaiting = make_shared<AwaitingDecorator>();
  shared_ptr<QuoteLog> log = make_shared<QuoteLog>();

  Proxy<Quote>::ptr proxy(
    bool v2_fails,
    ErrorPolicy policy,
    vector<Decorator::ptr> extra_decorators = {})
  {
    auto builder = ExperimentBuilder<Quote>("quote-v2", "IQuote");
    builder.add_default_trial("control", scripted("control", false, log))
      .add_trial("true", scripted("v2", v2_fails, log))
      .using_feature_flag("UseV2")
      .on_error(std::move(policy));
    must(def, builder.build());

    RegistryOptions options{
      .sources =
        {
          .feature_flags = flags,
          .variant_flags = flags,
          .config_values = flags,
        },
      .decorators =
        {
          DecoratorFactory::of_instance(trace),
          DecoratorFactory::of_instance(awaiting),
        },
      .audit_sink = audit,
    };
    for (auto& decorator : extra_decorators) {
      options.decorators.push_back(DecoratorFactory::of_instance(decorator));
    }
    must(registry, ExperimentRegistry::create({def}, options));
    must(p, Proxy<Quote>::create(registry));
    return p;
  }

  TrialAssignment last_assignment() const
  {
    auto assignments = audit->assignments();
    assert(!assignments.empty());
    return assignments.back();
  }
};

Task<bee::OrError<string>> call(
  const Proxy<Quote>::ptr& proxy, ResolutionContext ctx)
{
  return proxy->call_async<string>(
    "quote",
    std::move(ctx),
    [](Quote& quote) { return quote.quote(3); },
    {std::any(3)});
}

void print_result(const bee::OrError<string>& result)
{
  if (result.is_error()) {
    print_line("error: $", result.error());
  } else {
    print_line("result: $", result.value());
  }
}

ResolutionContext cancellable_context()
{
  auto ctx = ResolutionContext::for_subject("user-1");
  ctx.cancellation = CancellationFlag::create();
  return ctx;
}

Task<bee::OrError<bee::Unit>> failing_trial_replays_on_default()
{
  Fixture f;
  f.flags->set_flag("UseV2", true);
  auto proxy = f.proxy(true, ErrorPolicy::redirect_and_replay_default());
  auto ctx = cancellable_context();

  auto result = co_await call(proxy, ctx);
  print_result(result);
  print_line("traced trials: $", f.trace->trial_keys());
  print_line("completed after await: $", f.awaiting->completed);

  auto assignment = f.last_assignment();
  assert(result.value() == "control:3");
  assert((f.trace->trial_keys() == vector<string>{"true", "control"}));
  assert((f.awaiting->completed == vector<string>{"true", "control"}));
  assert((f.log->quotes == vector<string>{"v2", "control"}));
  assert(assignment.selected_key == "true");
  assert(assignment.executed_key == "control");
  assert(assignment.is_fallback);

  for (const auto& attempt : f.trace->attempts()) {
    assert(attempt.cancellation == ctx.cancellation);
  }
  assert(f.log->factory_cancellations.size() == 2);
  for (const auto& cancellation : f.log->factory_cancellations) {
    assert(cancellation == ctx.cancellation);
  }
  co_return bee::ok();
}

Task<bee::OrError<bee::Unit>> throw_policy_propagates()
{
  Fixture f;
  f.flags->set_flag("UseV2", true);
  auto proxy = f.proxy(true, ErrorPolicy::throw_errors());

  auto result = co_await call(proxy, cancellable_context());
  print_result(result);
  assert(result.is_error());
  assert((f.log->quotes == vector<string>{"v2"}));
  assert(f.last_assignment().error.has_value());
  co_return bee::ok();
}

Task<bee::OrError<bee::Unit>> empty_completion_replays_on_default()
{
  Fixture f;
  f.flags->set_flag("UseV2", true);
  auto proxy = f.proxy(
    false,
    ErrorPolicy::redirect_and_replay_default(),
    {make_shared<EmptyForNewTrial>()});

  auto result = co_await call(proxy, cancellable_context());
  print_result(result);

  auto assignment = f.last_assignment();
  assert(result.value() == "control:3");
  assert((f.log->quotes == vector<string>{"control"}));
  assert((assignment.attempts == vector<string>{"true", "control"}));
  assert(assignment.is_fallback);
  co_return bee::ok();
}

Task<bee::OrError<bee::Unit>> run_all()
{
  vector<std::pair<string, std::function<Task<bee::OrError<bee::Unit>>()>>>
    tests = {
      {"failing_trial_replays_on_default", failing_trial_replays_on_default},
      {"throw_policy_propagates", throw_policy_propagates},
      {"empty_completion_replays_on_default",
       empty_completion_replays_on_default},
    };
  for (const auto& [name, test] : tests) {
    print_line("==== $", name);
    auto result = co_await test();
    if (result.is_error()) { co_return result.error(); }
  }
  co_return bee::ok();
}

command::Cmd main_command()
{
  auto builder = command::CommandBuilder("Async dispatch tests");
  return run_coro(builder, [] { return run_all(); });
}

} // namespace
} // namespace splitbit

int main(int argc, char* argv[])
{
  return splitbit::main_command().main(argc, argv);
}
