#include "outcome_store.hpp"

#include "bee/format.hpp"
#include "bee/time.hpp"

using namespace async;

using bee::Span;
using bee::Time;
using std::map;
using std::string;
using std::unique_lock;
using std::vector;

namespace splitbit {

////////////////////////////////////////////////////////////////////////////////
// TrialSummary
//

double TrialSummary::failure_rate() const
{
  if (count == 0) { return 0; }
  return double(failures) / double(count);
}

string TrialSummary::to_string() const
{
  return bee::format(
    "count:$ failures:$ mean_duration:$s",
    count,
    failures,
    mean_duration_seconds);
}

////////////////////////////////////////////////////////////////////////////////
// OutcomeStore
//

OutcomeStore::ptr OutcomeStore::create()
{
  return std::make_shared<OutcomeStore>();
}

void OutcomeStore::record(Outcome outcome)
{
  auto lock = unique_lock(_mutex);
  _outcomes.push_back(std::move(outcome));
}

vector<Outcome> OutcomeStore::outcomes() const
{
  auto lock = unique_lock(_mutex);
  return _outcomes;
}

vector<Outcome> OutcomeStore::outcomes_for(const string& experiment_name) const
{
  auto lock = unique_lock(_mutex);
  vector<Outcome> out;
  for (const auto& outcome : _outcomes) {
    if (outcome.experiment_name == experiment_name) { out.push_back(outcome); }
  }
  return out;
}

map<string, TrialSummary> OutcomeStore::summary(
  const string& experiment_name) const
{
  map<string, TrialSummary> out;
  map<string, double> total_seconds;
  for (const auto& outcome : outcomes_for(experiment_name)) {
    auto& s = out[outcome.trial_key];
    s.count++;
    if (!outcome.success) { s.failures++; }
    total_seconds[outcome.trial_key] += outcome.duration.to_seconds();
  }
  for (auto& [key, s] : out) {
    s.mean_duration_seconds = total_seconds[key] / s.count;
  }
  return out;
}

void OutcomeStore::clear()
{
  auto lock = unique_lock(_mutex);
  _outcomes.clear();
}

////////////////////////////////////////////////////////////////////////////////
// OutcomeCollectionDecorator
//

namespace {

struct OutcomeCollectionFactory : public DecoratorFactory {
 public:
  explicit OutcomeCollectionFactory(const OutcomeStore::ptr& store)
      : _store(store)
  {}

  virtual ~OutcomeCollectionFactory() {}

  virtual Decorator::ptr create(const Logger::ptr&) override
  {
    return std::make_shared<OutcomeCollectionDecorator>(_store);
  }

 private:
  const OutcomeStore::ptr _store;
};

} // namespace

OutcomeCollectionDecorator::OutcomeCollectionDecorator(
  const OutcomeStore::ptr& store)
    : _store(store)
{}

OutcomeCollectionDecorator::~OutcomeCollectionDecorator() {}

Decorator::Result OutcomeCollectionDecorator::invoke(
  const InvocationContext& ctx, const Next& next)
{
  auto start = Time::monotonic();
  auto result = next();
  _record(ctx, result, Time::monotonic().diff(start));
  return result;
}

Task<Decorator::Result> OutcomeCollectionDecorator::invoke_async(
  InvocationContext ctx, AsyncNext next)
{
  auto start = Time::monotonic();
  auto result = co_await next();
  _record(ctx, result, Time::monotonic().diff(start));
  co_return result;
}

DecoratorFactory::ptr OutcomeCollectionDecorator::factory(
  const OutcomeStore::ptr& store)
{
  return std::make_shared<OutcomeCollectionFactory>(store);
}

void OutcomeCollectionDecorator::_record(
  const InvocationContext& ctx,
  const Result& result,
  Span duration)
{
  Outcome outcome{
    .experiment_name = ctx.experiment_name,
    .trial_key = ctx.trial_key,
    .method_name = ctx.method_name,
    .subject_id = ctx.subject_id,
    .success = !result.is_error(),
    .duration = duration,
  };
  if (result.is_error()) { outcome.error = string(result.error().msg()); }
  _store->record(std::move(outcome));
}

} // namespace splitbit
