#include "outcome_store.hpp"

#include "builtin_decorators.hpp"
#include "testing_support.hpp"

#include "bee/format_map.hpp"
#include "bee/format_optional.hpp"
#include "bee/format_vector.hpp"
#include "bee/testing.hpp"

#include <cassert>

using bee::print_line;
using std::string;

namespace splitbit {
namespace {

InvocationContext make_ctx(const string& trial_key)
{
  return InvocationContext{
    .experiment_name = "exp",
    .service_name = "IService",
    .method_name = "run",
    .selected_key = "b",
    .trial_key = trial_key,
    .subject_id = "user-7",
  };
}

TEST(records_every_attempt)
{
  auto store = OutcomeStore::create();
  auto trace = TraceCapturingDecorator::create();
  auto logger = Logger::null();
  DecoratorChain chain({
    OutcomeCollectionDecorator::factory(store)->create(logger),
    trace,
    BenchmarkDecorator::factory()->create(logger),
    ErrorLoggingDecorator::factory()->create(logger),
  });

  auto fail = []() -> Decorator::Result { return bee::Error("boom"); };
  auto succeed = []() -> Decorator::Result { return TrialResult::of(1); };

  auto r1 = chain.run(make_ctx("b"), fail);
  auto r2 = chain.run(make_ctx("control").with_trial("control", 2), succeed);
  auto r3 = chain.run(make_ctx("b"), succeed);
  assert(r1.is_error());
  assert(!r2.is_error());
  assert(!r3.is_error());

  for (const auto& outcome : store->outcomes()) {
    print_line(
      "$ $ subject:$ success:$ error:$",
      outcome.experiment_name,
      outcome.trial_key,
      outcome.subject_id,
      outcome.success,
      outcome.error);
    assert(outcome.subject_id == "user-7");
  }
  print_line("traced: $", trace->trial_keys());

  auto summary = store->summary("exp");
  for (const auto& [key, s] : summary) {
    print_line(
      "$ count:$ failures:$ failure_rate:$",
      key,
      s.count,
      s.failures,
      s.failure_rate());
  }
  assert(summary["b"].count == 2);
  assert(summary["b"].failures == 1);
  assert(summary["control"].count == 1);
  assert(summary["b"].failure_rate() == 0.5);
  assert(store->outcomes_for("other").empty());

  store->clear();
  trace->clear();
  assert(store->outcomes().empty());
  assert(store->summary("exp").empty());
  assert(trace->attempts().empty());
}

TEST(chain_order)
{
  struct Tag : public Decorator {
    explicit Tag(string name) : name(std::move(name)) {}

    virtual Result invoke(
      const InvocationContext&, const Next& next) override
    {
      print_line("enter $", name);
      auto res = next();
      print_line("leave $", name);
      return res;
    }

    virtual async::Task<Result> invoke_async(
      InvocationContext, AsyncNext next) override
    {
      return next();
    }

    string name;
  };

  DecoratorChain chain({
    std::make_shared<Tag>("first"),
    std::make_shared<Tag>("second"),
  });
  auto res = chain.run(make_ctx("b"), []() -> Decorator::Result {
    print_line("trial");
    return TrialResult::of(string("done"));
  });
  assert(!res.is_error());
}

} // namespace
} // namespace splitbit
