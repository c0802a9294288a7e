#include "selection_evaluator.hpp"

#include "testing_support.hpp"

#include "bee/testing.hpp"

#include <cassert>

using bee::print_line;
using std::string;

namespace splitbit {
namespace {

RegisteredExperiment make_experiment(SelectionMode mode, const string& selector)
{
  RegisteredExperiment exp;
  exp.spec.name = "exp";
  exp.spec.service_name = "IService";
  exp.spec.trial_keys = {"control", "true", "false", "blue"};
  exp.spec.default_key = "control";
  exp.spec.selection.mode = mode;
  exp.selector_name = selector;
  return exp;
}

void show(const bee::OrError<string>& result)
{
  if (result.is_error()) {
    print_line("error: $", result.error());
  } else {
    print_line("key: $", result.value());
  }
}

TEST(feature_flag)
{
  auto flags = InMemoryFlags::create();
  SelectionEvaluator evaluator(SelectionSources{.feature_flags = flags});
  auto exp = make_experiment(SelectionMode::BooleanFeatureFlag, "UseBlue");
  auto ctx = ResolutionContext::empty();

  show(evaluator.evaluate(exp, ctx));
  flags->set_flag("UseBlue", true);
  show(evaluator.evaluate(exp, ctx));
  flags->set_flag("UseBlue", false);
  show(evaluator.evaluate(exp, ctx));
  assert(evaluator.evaluate(exp, ctx).value() == "false");
}

TEST(variant_and_config)
{
  auto flags = InMemoryFlags::create();
  SelectionEvaluator evaluator(
    SelectionSources{.variant_flags = flags, .config_values = flags});
  auto ctx = ResolutionContext::empty();

  auto variant = make_experiment(SelectionMode::VariantFlag, "Color");
  show(evaluator.evaluate(variant, ctx));
  flags->set_variant("Color", "blue");
  show(evaluator.evaluate(variant, ctx));

  auto config = make_experiment(SelectionMode::ConfigurationValue, "Exp:Color");
  show(evaluator.evaluate(config, ctx));
  flags->set_value("Exp:Color", "anything");
  show(evaluator.evaluate(config, ctx));
  assert(evaluator.evaluate(config, ctx).value() == "anything");
}

TEST(missing_sources)
{
  SelectionEvaluator evaluator(SelectionSources{});
  auto ctx = ResolutionContext::empty();
  show(evaluator.evaluate(
    make_experiment(SelectionMode::BooleanFeatureFlag, "f"), ctx));
  show(
    evaluator.evaluate(make_experiment(SelectionMode::VariantFlag, "f"), ctx));
  show(evaluator.evaluate(
    make_experiment(SelectionMode::ConfigurationValue, "f"), ctx));
}

TEST(sticky)
{
  SelectionEvaluator evaluator(SelectionSources{});
  auto exp = make_experiment(SelectionMode::StickyRouting, "exp");
  show(evaluator.evaluate(exp, ResolutionContext::empty()));
  auto key = evaluator.evaluate(exp, ResolutionContext::for_subject("user-1"));
  show(key);
  assert(exp.spec.has_trial(key.value()));
}

TEST(custom)
{
  SelectionEvaluator evaluator(SelectionSources{});
  auto exp = make_experiment(SelectionMode::Custom, "selector");
  exp.spec.selection.custom_mode = "fixed";
  show(evaluator.evaluate(exp, ResolutionContext::empty()));

  exp.custom_provider =
    FixedSelectionProvider::create("fixed", {{"selector", "blue"}});
  show(evaluator.evaluate(exp, ResolutionContext::empty()));
  exp.selector_name = "other";
  show(evaluator.evaluate(exp, ResolutionContext::empty()));
}

} // namespace
} // namespace splitbit
