#pragma once

#include "decorator.hpp"
#include "logger.hpp"

namespace splitbit {

// Logs how long each attempt took.
struct BenchmarkDecorator : public Decorator {
 public:
  explicit BenchmarkDecorator(const Logger::ptr& logger);

  virtual ~BenchmarkDecorator();

  virtual Result invoke(
    const InvocationContext& ctx, const Next& next) override;

  virtual async::Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override;

  static DecoratorFactory::ptr factory();

 private:
  const Logger::ptr _logger;
};

// Logs failed attempts with their context. The error is passed on unchanged.
struct ErrorLoggingDecorator : public Decorator {
 public:
  explicit ErrorLoggingDecorator(const Logger::ptr& logger);

  virtual ~ErrorLoggingDecorator();

  virtual Result invoke(
    const InvocationContext& ctx, const Next& next) override;

  virtual async::Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override;

  static DecoratorFactory::ptr factory();

 private:
  void _log_result(
    const InvocationContext& ctx, const Result& result);

  const Logger::ptr _logger;
};

} // namespace splitbit
