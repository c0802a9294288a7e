#pragma once

#include "activation_gate.hpp"
#include "audit_sink.hpp"
#include "decorator.hpp"
#include "experiment_definition.hpp"
#include "kill_switch.hpp"
#include "logger.hpp"
#include "naming_convention.hpp"
#include "registered_experiment.hpp"
#include "selection_evaluator.hpp"
#include "selection_provider.hpp"

#include "bee/error.hpp"
#include "bee/time.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace splitbit {

// Everything left null gets a default: a null logger, an in-memory kill
// switch, the default naming convention, a null audit sink and the wall
// clock.
struct RegistryOptions {
 public:
  Logger::ptr logger;
  KillSwitchProvider::ptr kill_switch;
  SelectionSources sources;
  std::vector<SelectionModeProvider::ptr> selection_modes;
  std::vector<ActivationPredicateProvider::ptr> activation_predicates;
  std::vector<DecoratorFactory::ptr> decorators;
  NamingConvention::ptr naming_convention;
  AuditSink::ptr audit_sink;
  std::function<bee::Time()> clock;
};

// Build once, read only afterwards. Lookups take no locks.
struct ExperimentRegistry {
 public:
  using ptr = std::shared_ptr<ExperimentRegistry>;

  static bee::OrError<ptr> create(
    const std::vector<ExperimentDefinitionBase::ptr>& definitions,
    RegistryOptions options);

  ~ExperimentRegistry();

  ExperimentRegistrationBase::ptr find(const std::type_index& service) const;

  template <class Service>
  std::shared_ptr<const ExperimentRegistration<Service>> find() const
  {
    auto reg = find(std::type_index(typeid(Service)));
    if (reg == nullptr) { return nullptr; }
    return std::static_pointer_cast<const ExperimentRegistration<Service>>(reg);
  }

  ExperimentRegistrationBase::ptr find_by_name(
    const std::string& experiment_name) const;

  std::vector<std::string> experiment_names() const;

  const Logger::ptr& logger() const;
  const KillSwitchProvider::ptr& kill_switch() const;
  const SelectionEvaluator& evaluator() const;
  const DecoratorChain& decorators() const;
  const AuditSink::ptr& audit_sink() const;

  bee::Time now() const;

 private:
  ExperimentRegistry(
    std::map<std::type_index, ExperimentRegistrationBase::ptr> registrations,
    RegistryOptions options,
    DecoratorChain decorators);

  static bee::OrError<std::shared_ptr<const RegisteredExperiment>> _resolve(
    const ExperimentSpec& spec,
    const RegistryOptions& options,
    const SelectionModeRegistry& modes,
    const std::map<std::string, ActivationPredicateProvider::ptr>& predicates);

  const std::map<std::type_index, ExperimentRegistrationBase::ptr>
    _registrations;
  const RegistryOptions _options;
  const SelectionEvaluator _evaluator;
  const DecoratorChain _decorators;
};

} // namespace splitbit
