#include "activation_gate.hpp"

using std::string;
using std::vector;

namespace splitbit {
namespace {

struct FunctionPredicate : public ActivationPredicateProvider {
 public:
  FunctionPredicate(string name, ActivationPredicate predicate)
      : _name(std::move(name)), _predicate(std::move(predicate))
  {}

  virtual ~FunctionPredicate() {}

  virtual string name() const override { return _name; }

  virtual bool is_active(const ResolutionContext& ctx) override
  {
    return _predicate(ctx);
  }

 private:
  const string _name;
  const ActivationPredicate _predicate;
};

} // namespace

ActivationPredicateProvider::~ActivationPredicateProvider() {}

ActivationPredicateProvider::ptr ActivationPredicateProvider::of_function(
  string name, ActivationPredicate predicate)
{
  return std::make_shared<FunctionPredicate>(
    std::move(name), std::move(predicate));
}

bool ActivationGate::is_within_window(
  const ActivationSpec& activation, const bee::Time& now)
{
  if (activation.active_from.has_value() && now < *activation.active_from) {
    return false;
  }
  if (activation.active_until.has_value() && *activation.active_until < now) {
    return false;
  }
  return true;
}

bool ActivationGate::is_active(
  const ActivationSpec& activation,
  const vector<ActivationPredicateProvider::ptr>& named_predicates,
  const bee::Time& now,
  const ResolutionContext& ctx)
{
  if (!is_within_window(activation, now)) { return false; }
  if (activation.predicate != nullptr && !activation.predicate(ctx)) {
    return false;
  }
  for (const auto& predicate : named_predicates) {
    if (!predicate->is_active(ctx)) { return false; }
  }
  return true;
}

} // namespace splitbit
