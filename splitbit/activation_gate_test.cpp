#include "activation_gate.hpp"

#include "bee/testing.hpp"

#include <cassert>
#include <chrono>
#include <thread>

using bee::print_line;
using bee::Time;

namespace splitbit {
namespace {

Time later_than(const Time& t)
{
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto now = Time::now();
  assert(t < now);
  return now;
}

TEST(window)
{
  auto t1 = Time::now();
  auto t2 = later_than(t1);
  auto t3 = later_than(t2);

  ActivationSpec spec;
  print_line("no bounds: $", ActivationGate::is_within_window(spec, t2));

  spec.active_from = t2;
  print_line("before start: $", ActivationGate::is_within_window(spec, t1));
  print_line("at start: $", ActivationGate::is_within_window(spec, t2));

  spec.active_from = std::nullopt;
  spec.active_until = t2;
  print_line("at end: $", ActivationGate::is_within_window(spec, t2));
  print_line("after end: $", ActivationGate::is_within_window(spec, t3));

  assert(ActivationGate::is_within_window(spec, t2));
  assert(!ActivationGate::is_within_window(spec, t3));
}

TEST(predicates_are_anded)
{
  auto now = Time::now();
  ActivationSpec spec;
  spec.predicate = [](const ResolutionContext& ctx) {
    return ctx.subject_id.has_value();
  };
  auto beta = ActivationPredicateProvider::of_function(
    "beta-users", [](const ResolutionContext& ctx) {
      return ctx.attribute("beta") == "yes";
    });

  auto anonymous = ResolutionContext::empty();
  auto user = ResolutionContext::for_subject("u1");
  auto beta_user = ResolutionContext::for_subject("u2");
  beta_user.attributes["beta"] = "yes";

  print_line("anonymous: $", ActivationGate::is_active(spec, {beta}, now, anonymous));
  print_line("user: $", ActivationGate::is_active(spec, {beta}, now, user));
  print_line("beta user: $", ActivationGate::is_active(spec, {beta}, now, beta_user));
  print_line("user, no named: $", ActivationGate::is_active(spec, {}, now, user));
  assert(ActivationGate::is_active(spec, {beta}, now, beta_user));
  assert(!ActivationGate::is_active(spec, {beta}, now, user));
}

} // namespace
} // namespace splitbit
