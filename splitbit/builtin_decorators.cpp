#include "builtin_decorators.hpp"

#include "bee/time.hpp"

using namespace async;

using bee::Time;

namespace splitbit {
namespace {

template <class D> struct SimpleFactory : public DecoratorFactory {
 public:
  virtual ~SimpleFactory() {}

  virtual Decorator::ptr create(const Logger::ptr& logger) override
  {
    return std::make_shared<D>(logger);
  }
};

} // namespace

////////////////////////////////////////////////////////////////////////////////
// BenchmarkDecorator
//

BenchmarkDecorator::BenchmarkDecorator(const Logger::ptr& logger)
    : _logger(logger)
{}

BenchmarkDecorator::~BenchmarkDecorator() {}

Decorator::Result BenchmarkDecorator::invoke(
  const InvocationContext& ctx, const Next& next)
{
  auto start = Time::monotonic();
  auto result = next();
  _logger->log_line(
    "$ took $", ctx.to_string(), Time::monotonic().diff(start));
  return result;
}

Task<Decorator::Result> BenchmarkDecorator::invoke_async(
  InvocationContext ctx, AsyncNext next)
{
  auto start = Time::monotonic();
  auto result = co_await next();
  _logger->log_line(
    "$ took $", ctx.to_string(), Time::monotonic().diff(start));
  co_return result;
}

DecoratorFactory::ptr BenchmarkDecorator::factory()
{
  return std::make_shared<SimpleFactory<BenchmarkDecorator>>();
}

////////////////////////////////////////////////////////////////////////////////
// ErrorLoggingDecorator
//

ErrorLoggingDecorator::ErrorLoggingDecorator(const Logger::ptr& logger)
    : _logger(logger)
{}

ErrorLoggingDecorator::~ErrorLoggingDecorator() {}

Decorator::Result ErrorLoggingDecorator::invoke(
  const InvocationContext& ctx, const Next& next)
{
  auto result = next();
  _log_result(ctx, result);
  return result;
}

Task<Decorator::Result> ErrorLoggingDecorator::invoke_async(
  InvocationContext ctx, AsyncNext next)
{
  auto result = co_await next();
  _log_result(ctx, result);
  co_return result;
}

void ErrorLoggingDecorator::_log_result(
  const InvocationContext& ctx, const Result& result)
{
  if (!result.is_error()) { return; }
  _logger->log_line(
    "Trial failed: experiment:$ $ error:$",
    ctx.experiment_name,
    ctx.to_string(),
    result.error());
}

DecoratorFactory::ptr ErrorLoggingDecorator::factory()
{
  return std::make_shared<SimpleFactory<ErrorLoggingDecorator>>();
}

} // namespace splitbit
