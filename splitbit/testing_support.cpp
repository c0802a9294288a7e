#include "testing_support.hpp"

using namespace async;

using std::map;
using std::string;
using std::unique_lock;
using std::vector;

namespace splitbit {

////////////////////////////////////////////////////////////////////////////////
// TraceCapturingDecorator
//

TraceCapturingDecorator::ptr TraceCapturingDecorator::create()
{
  return std::make_shared<TraceCapturingDecorator>();
}

TraceCapturingDecorator::~TraceCapturingDecorator() {}

Decorator::Result TraceCapturingDecorator::invoke(
  const InvocationContext& ctx, const Next& next)
{
  auto result = next();
  _record(ctx, result);
  return result;
}

Task<Decorator::Result> TraceCapturingDecorator::invoke_async(
  InvocationContext ctx, AsyncNext next)
{
  auto result = co_await next();
  _record(ctx, result);
  co_return result;
}

vector<TracedAttempt> TraceCapturingDecorator::attempts() const
{
  auto lock = unique_lock(_mutex);
  return _attempts;
}

vector<string> TraceCapturingDecorator::trial_keys() const
{
  vector<string> out;
  for (const auto& attempt : attempts()) { out.push_back(attempt.trial_key); }
  return out;
}

void TraceCapturingDecorator::clear()
{
  auto lock = unique_lock(_mutex);
  _attempts.clear();
}

void TraceCapturingDecorator::_record(
  const InvocationContext& ctx, const Result& result)
{
  TracedAttempt attempt{
    .experiment_name = ctx.experiment_name,
    .method_name = ctx.method_name,
    .selected_key = ctx.selected_key,
    .trial_key = ctx.trial_key,
    .attempt = ctx.attempt,
    .success = !result.is_error(),
    .cancellation = ctx.cancellation,
  };
  if (result.is_error()) { attempt.error = string(result.error().msg()); }
  auto lock = unique_lock(_mutex);
  _attempts.push_back(std::move(attempt));
}

////////////////////////////////////////////////////////////////////////////////
// FixedSelectionProvider
//

FixedSelectionProvider::ptr FixedSelectionProvider::create(
  string mode_identifier, map<string, string> keys)
{
  return std::make_shared<FixedSelectionProvider>(
    std::move(mode_identifier), std::move(keys));
}

FixedSelectionProvider::FixedSelectionProvider(
  string mode_identifier, map<string, string> keys)
    : _mode_identifier(std::move(mode_identifier)), _keys(std::move(keys))
{}

FixedSelectionProvider::~FixedSelectionProvider() {}

string FixedSelectionProvider::mode_identifier() const
{
  return _mode_identifier;
}

bee::OrError<string> FixedSelectionProvider::resolve(
  const string& selector_name, const ResolutionContext&)
{
  auto it = _keys.find(selector_name);
  if (it == _keys.end()) {
    shot("No fixed selection for selector '$'", selector_name);
  }
  return it->second;
}

} // namespace splitbit
