#include "sample_checkout.hpp"

#include "bee/format.hpp"

using namespace async;

using std::optional;
using std::string;

namespace splitbit {
namespace {

struct ControlCheckout : public CheckoutService {
 public:
  virtual ~ControlCheckout() {}

  virtual bee::OrError<string> quote(int items) override
  {
    return bee::format("control: $ items at 10.00", items);
  }

  virtual Task<bee::OrError<string>> quote_async(int items) override
  {
    co_return quote(items);
  }
};

struct V2Checkout : public CheckoutService {
 public:
  explicit V2Checkout(bool fails) : _fails(fails) {}

  virtual ~V2Checkout() {}

  virtual bee::OrError<string> quote(int items) override
  {
    if (_fails) { shot("v2 pricing backend unavailable"); }
    return bee::format("v2: $ items at 9.50", items);
  }

  virtual Task<bee::OrError<string>> quote_async(int items) override
  {
    co_return quote(items);
  }

 private:
  const bool _fails;
};

optional<string> selector_or_default(const string& selector)
{
  if (selector.empty()) { return std::nullopt; }
  return selector;
}

} // namespace

CheckoutService::~CheckoutService() {}

bee::OrError<ExperimentDefinitionBase::ptr> SampleCheckout::definition(
  const Options& options)
{
  bool v2_fails = options.v2_fails;
  auto v2_factory = [v2_fails](const ResolutionContext&)
    -> bee::OrError<CheckoutService::ptr> {
    return CheckoutService::ptr(std::make_shared<V2Checkout>(v2_fails));
  };

  auto builder = ExperimentBuilder<CheckoutService>("checkout-v2", "ICheckout");
  builder.add_default_trial<ControlCheckout>("control")
    .add_trial("true", v2_factory)
    .add_trial("v2", v2_factory)
    .with_metadata("owner", "checkout-team");

  auto selector = selector_or_default(options.selector);
  const auto& mode = options.selection_mode;
  if (mode == "feature-flag") {
    builder.using_feature_flag(selector);
  } else if (mode == "variant") {
    builder.using_variant_flag(selector);
  } else if (mode == "config") {
    builder.using_configuration_key(selector);
  } else if (mode == "sticky") {
    builder.using_sticky_routing(selector);
  } else {
    shot("Unknown selection mode '$'", mode);
  }

  const auto& policy = options.error_policy;
  if (policy == "throw") {
    builder.on_error_throw();
  } else if (policy == "default") {
    builder.on_error_redirect_and_replay_default();
  } else if (policy == "any") {
    builder.on_error_redirect_and_replay_any();
  } else {
    shot("Unknown error policy '$'", policy);
  }

  return builder.build();
}

} // namespace splitbit
