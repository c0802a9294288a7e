#include "experiment_registry.hpp"

#include "bee/format_vector.hpp"

#include <set>

using std::map;
using std::set;
using std::shared_ptr;
using std::string;
using std::type_index;
using std::vector;

namespace splitbit {

////////////////////////////////////////////////////////////////////////////////
// ExperimentRegistrationBase
//

ExperimentRegistrationBase::ExperimentRegistrationBase(
  shared_ptr<const RegisteredExperiment> experiment)
    : _experiment(std::move(experiment))
{}

ExperimentRegistrationBase::~ExperimentRegistrationBase() {}

const RegisteredExperiment& ExperimentRegistrationBase::experiment() const
{
  return *_experiment;
}

////////////////////////////////////////////////////////////////////////////////
// ExperimentRegistry
//

bee::OrError<ExperimentRegistry::ptr> ExperimentRegistry::create(
  const vector<ExperimentDefinitionBase::ptr>& definitions,
  RegistryOptions options)
{
  if (options.logger == nullptr) { options.logger = Logger::null(); }
  if (options.kill_switch == nullptr) {
    options.kill_switch = InMemoryKillSwitch::create();
  }
  if (options.naming_convention == nullptr) {
    options.naming_convention = NamingConvention::default_convention();
  }
  if (options.audit_sink == nullptr) {
    options.audit_sink = NullAuditSink::create();
  }
  if (options.clock == nullptr) {
    options.clock = []() { return bee::Time::now(); };
  }

  SelectionModeRegistry modes;
  for (const auto& provider : options.selection_modes) {
    bail_unit(modes.add(provider));
  }

  map<string, ActivationPredicateProvider::ptr> predicates;
  for (const auto& provider : options.activation_predicates) {
    if (provider == nullptr) {
      return bee::Error("Cannot register a null activation predicate");
    }
    if (!predicates.emplace(provider->name(), provider).second) {
      shot("Activation predicate '$' registered more than once", provider->name());
    }
  }

  map<type_index, ExperimentRegistrationBase::ptr> registrations;
  set<string> names;
  set<string> service_names;
  for (const auto& definition : definitions) {
    if (definition == nullptr) {
      return bee::Error("Cannot register a null experiment definition");
    }
    const auto& spec = definition->spec();
    bail_unit(spec.validate());
    if (registrations.contains(definition->service_type())) {
      shot(
        "Service '$' is registered by more than one experiment (second: '$')",
        spec.service_name,
        spec.name);
    }
    if (!names.insert(spec.name).second) {
      shot("Experiment name '$' is used more than once", spec.name);
    }
    if (!service_names.insert(spec.service_name).second) {
      shot(
        "Service name '$' is used by more than one experiment (second: '$')",
        spec.service_name,
        spec.name);
    }
    bail(experiment, _resolve(spec, options, modes, predicates));
    registrations.emplace(
      definition->service_type(), definition->materialize(experiment));
  }

  vector<Decorator::ptr> decorators;
  for (const auto& factory : options.decorators) {
    if (factory == nullptr) {
      return bee::Error("Cannot register a null decorator factory");
    }
    auto decorator = factory->create(options.logger);
    if (decorator == nullptr) {
      return bee::Error("Decorator factory produced a null decorator");
    }
    decorators.push_back(std::move(decorator));
  }

  options.logger->log_line(
    "Experiment registry built with $ experiments and $ decorators",
    registrations.size(),
    decorators.size());

  return ptr(new ExperimentRegistry(
    std::move(registrations),
    std::move(options),
    DecoratorChain(std::move(decorators))));
}

bee::OrError<shared_ptr<const RegisteredExperiment>>
ExperimentRegistry::_resolve(
  const ExperimentSpec& spec,
  const RegistryOptions& options,
  const SelectionModeRegistry& modes,
  const map<string, ActivationPredicateProvider::ptr>& predicates)
{
  auto experiment = std::make_shared<RegisteredExperiment>();
  experiment->spec = spec;

  const auto& naming = *options.naming_convention;
  const auto& selection = spec.selection;
  if (selection.selector_name.has_value()) {
    experiment->selector_name = *selection.selector_name;
  } else {
    switch (selection.mode) {
    case SelectionMode::BooleanFeatureFlag:
    case SelectionMode::StickyRouting:
    case SelectionMode::Custom:
      experiment->selector_name =
        naming.feature_flag_name_for(spec.service_name);
      break;
    case SelectionMode::VariantFlag:
      experiment->selector_name =
        naming.variant_flag_name_for(spec.service_name);
      break;
    case SelectionMode::ConfigurationValue:
      experiment->selector_name =
        naming.configuration_key_for(spec.service_name);
      break;
    }
  }
  if (experiment->selector_name.empty()) {
    shot("Experiment '$' resolved to an empty selector name", spec.name);
  }
  experiment->spec.selection.selector_name = experiment->selector_name;

  if (selection.mode == SelectionMode::Custom) {
    experiment->custom_provider = modes.find(selection.custom_mode);
    if (experiment->custom_provider == nullptr) {
      shot(
        "Experiment '$' uses unknown selection mode '$', registered modes: $",
        spec.name,
        selection.custom_mode,
        modes.identifiers());
    }
  }

  for (const auto& name : spec.activation.named_predicates) {
    auto it = predicates.find(name);
    if (it == predicates.end()) {
      shot(
        "Experiment '$' uses unknown activation predicate '$'", spec.name, name);
    }
    experiment->named_predicates.push_back(it->second);
  }

  if (
    spec.error_policy.kind == ErrorPolicyKind::RedirectAndReplayAny &&
    spec.trial_keys.empty()) {
    shot("Experiment '$' replays on any trial but has no trials", spec.name);
  }

  return shared_ptr<const RegisteredExperiment>(std::move(experiment));
}

ExperimentRegistry::ExperimentRegistry(
  map<type_index, ExperimentRegistrationBase::ptr> registrations,
  RegistryOptions options,
  DecoratorChain decorators)
    : _registrations(std::move(registrations)),
      _options(std::move(options)),
      _evaluator(_options.sources),
      _decorators(std::move(decorators))
{}

ExperimentRegistry::~ExperimentRegistry() {}

ExperimentRegistrationBase::ptr ExperimentRegistry::find(
  const type_index& service) const
{
  auto it = _registrations.find(service);
  if (it == _registrations.end()) { return nullptr; }
  return it->second;
}

ExperimentRegistrationBase::ptr ExperimentRegistry::find_by_name(
  const string& experiment_name) const
{
  for (const auto& [_, reg] : _registrations) {
    if (reg->experiment().spec.name == experiment_name) { return reg; }
  }
  return nullptr;
}

vector<string> ExperimentRegistry::experiment_names() const
{
  vector<string> out;
  for (const auto& [_, reg] : _registrations) {
    out.push_back(reg->experiment().spec.name);
  }
  return out;
}

const Logger::ptr& ExperimentRegistry::logger() const
{
  return _options.logger;
}

const KillSwitchProvider::ptr& ExperimentRegistry::kill_switch() const
{
  return _options.kill_switch;
}

const SelectionEvaluator& ExperimentRegistry::evaluator() const
{
  return _evaluator;
}

const DecoratorChain& ExperimentRegistry::decorators() const
{
  return _decorators;
}

const AuditSink::ptr& ExperimentRegistry::audit_sink() const
{
  return _options.audit_sink;
}

bee::Time ExperimentRegistry::now() const { return _options.clock(); }

} // namespace splitbit
