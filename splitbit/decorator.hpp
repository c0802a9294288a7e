#pragma once

#include "invocation_context.hpp"
#include "logger.hpp"

#include "async/task.hpp"
#include "bee/error.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace splitbit {

// Middleware wrapping every attempt. The continuation runs the rest of the
// chain and then the trial itself, and yields the trial's value or error. A
// decorator may skip the continuation and supply a value of its own. An
// attempt that ends without a value of the call's result type counts as
// failed.
//
// Decorators are shared by every call of every experiment in a registry and
// must be safe to call concurrently.
struct Decorator {
 public:
  using ptr = std::shared_ptr<Decorator>;

  using Result = bee::OrError<TrialResult>;
  using Next = std::function<Result()>;
  using AsyncNext = std::function<async::Task<Result>()>;

  virtual ~Decorator();

  virtual Result invoke(const InvocationContext& ctx, const Next& next) = 0;

  // Must co_await the continuation rather than assume it completes
  // synchronously.
  virtual async::Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) = 0;
};

// Produces one decorator instance per registry.
struct DecoratorFactory {
 public:
  using ptr = std::shared_ptr<DecoratorFactory>;

  virtual ~DecoratorFactory();

  virtual Decorator::ptr create(const Logger::ptr& logger) = 0;

  static ptr of_instance(Decorator::ptr decorator);
};

// Runs decorators in registration order, first registered is outermost.
struct DecoratorChain {
 public:
  DecoratorChain();
  explicit DecoratorChain(std::vector<Decorator::ptr> decorators);

  Decorator::Result run(
    const InvocationContext& ctx, const Decorator::Next& terminal) const;

  async::Task<Decorator::Result> run_async(
    InvocationContext ctx, Decorator::AsyncNext terminal) const;

  size_t size() const;

 private:
  Decorator::Result _run_from(
    size_t index,
    const InvocationContext& ctx,
    const Decorator::Next& terminal) const;

  async::Task<Decorator::Result> _run_async_from(
    size_t index, InvocationContext ctx, Decorator::AsyncNext terminal) const;

  std::vector<Decorator::ptr> _decorators;
};

} // namespace splitbit
