#include "decorator.hpp"

using namespace async;

using std::vector;

namespace splitbit {
namespace {

struct InstanceFactory : public DecoratorFactory {
 public:
  explicit InstanceFactory(Decorator::ptr decorator)
      : _decorator(std::move(decorator))
  {}

  virtual ~InstanceFactory() {}

  virtual Decorator::ptr create(const Logger::ptr&) override
  {
    return _decorator;
  }

 private:
  Decorator::ptr _decorator;
};

} // namespace

Decorator::~Decorator() {}

DecoratorFactory::~DecoratorFactory() {}

DecoratorFactory::ptr DecoratorFactory::of_instance(Decorator::ptr decorator)
{
  return std::make_shared<InstanceFactory>(std::move(decorator));
}

////////////////////////////////////////////////////////////////////////////////
// DecoratorChain
//

DecoratorChain::DecoratorChain() {}

DecoratorChain::DecoratorChain(vector<Decorator::ptr> decorators)
    : _decorators(std::move(decorators))
{}

Decorator::Result DecoratorChain::run(
  const InvocationContext& ctx, const Decorator::Next& terminal) const
{
  return _run_from(0, ctx, terminal);
}

Task<Decorator::Result> DecoratorChain::run_async(
  InvocationContext ctx, Decorator::AsyncNext terminal) const
{
  return _run_async_from(0, std::move(ctx), std::move(terminal));
}

size_t DecoratorChain::size() const { return _decorators.size(); }

Decorator::Result DecoratorChain::_run_from(
  size_t index,
  const InvocationContext& ctx,
  const Decorator::Next& terminal) const
{
  if (index >= _decorators.size()) { return terminal(); }
  return _decorators[index]->invoke(
    ctx, [&]() { return _run_from(index + 1, ctx, terminal); });
}

Task<Decorator::Result> DecoratorChain::_run_async_from(
  size_t index, InvocationContext ctx, Decorator::AsyncNext terminal) const
{
  if (index >= _decorators.size()) { co_return co_await terminal(); }
  auto next = [this, index, ctx, terminal]() {
    return _run_async_from(index + 1, ctx, terminal);
  };
  co_return co_await _decorators[index]->invoke_async(ctx, next);
}

} // namespace splitbit
