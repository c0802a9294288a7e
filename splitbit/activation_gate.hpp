#pragma once

#include "experiment_definition.hpp"
#include "resolution_context.hpp"

#include "bee/time.hpp"

#include <memory>
#include <string>
#include <vector>

namespace splitbit {

// Named activation predicate, referenced from definitions by name.
struct ActivationPredicateProvider {
 public:
  using ptr = std::shared_ptr<ActivationPredicateProvider>;

  virtual ~ActivationPredicateProvider();

  virtual std::string name() const = 0;

  virtual bool is_active(const ResolutionContext& ctx) = 0;

  static ptr of_function(std::string name, ActivationPredicate predicate);
};

struct ActivationGate {
 public:
  // Window bounds are inclusive. Every condition present must hold.
  static bool is_active(
    const ActivationSpec& activation,
    const std::vector<ActivationPredicateProvider::ptr>& named_predicates,
    const bee::Time& now,
    const ResolutionContext& ctx);

  static bool is_within_window(
    const ActivationSpec& activation, const bee::Time& now);
};

} // namespace splitbit
