#pragma once

#include "activation_gate.hpp"
#include "experiment_definition.hpp"
#include "selection_provider.hpp"

#include <string>
#include <vector>

namespace splitbit {

// An experiment spec with every name resolved against the registry: the
// selector name is never empty and custom modes and named predicates point
// at their providers.
struct RegisteredExperiment {
 public:
  ExperimentSpec spec;
  std::string selector_name;
  SelectionModeProvider::ptr custom_provider;
  std::vector<ActivationPredicateProvider::ptr> named_predicates;
};

} // namespace splitbit
