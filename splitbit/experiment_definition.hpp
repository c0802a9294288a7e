#pragma once

#include "resolution_context.hpp"

#include "bee/error.hpp"
#include "bee/time.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace splitbit {

enum class SelectionMode {
  BooleanFeatureFlag,
  ConfigurationValue,
  VariantFlag,
  StickyRouting,
  Custom,
};

std::string to_string(SelectionMode mode);

struct SelectionSpec {
 public:
  SelectionMode mode = SelectionMode::BooleanFeatureFlag;

  // Only used by SelectionMode::Custom
  std::string custom_mode;

  // Filled from the naming convention at registry build when missing
  std::optional<std::string> selector_name;

  std::string to_string() const;
};

enum class ErrorPolicyKind {
  Throw,
  RedirectAndReplayDefault,
  RedirectAndReplay,
  RedirectAndReplayOrdered,
  RedirectAndReplayAny,
};

std::string to_string(ErrorPolicyKind kind);

struct ErrorPolicy {
 public:
  ErrorPolicyKind kind = ErrorPolicyKind::Throw;
  std::optional<std::string> fallback_key;
  std::vector<std::string> ordered_keys;

  static ErrorPolicy throw_errors();
  static ErrorPolicy redirect_and_replay_default();
  static ErrorPolicy redirect_and_replay(const std::string& fallback_key);
  static ErrorPolicy redirect_and_replay_ordered(
    const std::vector<std::string>& keys);
  static ErrorPolicy redirect_and_replay_any();

  std::string to_string() const;
};

using ActivationPredicate = std::function<bool(const ResolutionContext&)>;

struct ActivationSpec {
 public:
  std::optional<bee::Time> active_from;
  std::optional<bee::Time> active_until;
  ActivationPredicate predicate;

  // Predicates looked up by name in the registry options
  std::vector<std::string> named_predicates;

  bool has_conditions() const;
};

// The type independent part of an experiment definition.
struct ExperimentSpec {
 public:
  std::string name;
  std::string service_name;
  std::vector<std::string> trial_keys;
  std::string default_key;
  SelectionSpec selection;
  ErrorPolicy error_policy;
  ActivationSpec activation;
  std::map<std::string, std::string> metadata;

  bool has_trial(const std::string& key) const;

  bee::OrError<bee::Unit> validate() const;
};

template <class Service>
using TrialFactory = std::function<bee::OrError<std::shared_ptr<Service>>(
  const ResolutionContext&)>;

struct RegisteredExperiment;

// Runtime form of a definition: the materialized experiment plus the typed
// trial factories.
struct ExperimentRegistrationBase {
 public:
  using ptr = std::shared_ptr<ExperimentRegistrationBase>;

  explicit ExperimentRegistrationBase(
    std::shared_ptr<const RegisteredExperiment> experiment);

  virtual ~ExperimentRegistrationBase();

  virtual std::type_index service_type() const = 0;

  const RegisteredExperiment& experiment() const;

 private:
  std::shared_ptr<const RegisteredExperiment> _experiment;
};

template <class Service>
struct ExperimentRegistration : public ExperimentRegistrationBase {
 public:
  ExperimentRegistration(
    std::shared_ptr<const RegisteredExperiment> experiment,
    std::map<std::string, TrialFactory<Service>> factories)
      : ExperimentRegistrationBase(std::move(experiment)),
        _factories(std::move(factories))
  {}

  virtual ~ExperimentRegistration() {}

  virtual std::type_index service_type() const override
  {
    return std::type_index(typeid(Service));
  }

  bee::OrError<std::shared_ptr<Service>> create_trial(
    const std::string& key, const ResolutionContext& ctx) const
  {
    auto it = _factories.find(key);
    if (it == _factories.end()) {
      return bee::Error::format("No trial registered with key '$'", key);
    }
    bail(instance, it->second(ctx));
    if (instance == nullptr) {
      return bee::Error::format("Factory for trial '$' returned null", key);
    }
    return instance;
  }

 private:
  std::map<std::string, TrialFactory<Service>> _factories;
};

struct ExperimentDefinitionBase {
 public:
  using ptr = std::shared_ptr<ExperimentDefinitionBase>;

  virtual ~ExperimentDefinitionBase();

  virtual std::type_index service_type() const = 0;

  virtual const ExperimentSpec& spec() const = 0;

  virtual std::shared_ptr<ExperimentRegistrationBase> materialize(
    std::shared_ptr<const RegisteredExperiment> experiment) const = 0;
};

template <class Service>
struct ExperimentDefinition : public ExperimentDefinitionBase {
 public:
  using ptr = std::shared_ptr<ExperimentDefinition>;

  ExperimentDefinition(
    ExperimentSpec spec, std::map<std::string, TrialFactory<Service>> factories)
      : _spec(std::move(spec)), _factories(std::move(factories))
  {}

  virtual ~ExperimentDefinition() {}

  virtual std::type_index service_type() const override
  {
    return std::type_index(typeid(Service));
  }

  virtual const ExperimentSpec& spec() const override { return _spec; }

  const std::map<std::string, TrialFactory<Service>>& factories() const
  {
    return _factories;
  }

  virtual std::shared_ptr<ExperimentRegistrationBase> materialize(
    std::shared_ptr<const RegisteredExperiment> experiment) const override
  {
    return std::make_shared<ExperimentRegistration<Service>>(
      std::move(experiment), _factories);
  }

 private:
  ExperimentSpec _spec;
  std::map<std::string, TrialFactory<Service>> _factories;
};

template <class Service> struct ExperimentBuilder {
 public:
  ExperimentBuilder(std::string name, std::string service_name)
  {
    _spec.name = std::move(name);
    _spec.service_name = std::move(service_name);
  }

  ExperimentBuilder& add_default_trial(
    const std::string& key, TrialFactory<Service> factory)
  {
    _default_count++;
    _spec.default_key = key;
    return _add(key, std::move(factory));
  }

  ExperimentBuilder& add_trial(
    const std::string& key, TrialFactory<Service> factory)
  {
    return _add(key, std::move(factory));
  }

  template <class Impl> ExperimentBuilder& add_default_trial(const std::string& key)
  {
    return add_default_trial(key, _make_factory<Impl>());
  }

  template <class Impl> ExperimentBuilder& add_trial(const std::string& key)
  {
    return add_trial(key, _make_factory<Impl>());
  }

  ExperimentBuilder& using_feature_flag(
    std::optional<std::string> flag_name = std::nullopt)
  {
    return _select(SelectionMode::BooleanFeatureFlag, std::move(flag_name));
  }

  ExperimentBuilder& using_variant_flag(
    std::optional<std::string> flag_name = std::nullopt)
  {
    return _select(SelectionMode::VariantFlag, std::move(flag_name));
  }

  ExperimentBuilder& using_configuration_key(
    std::optional<std::string> config_key = std::nullopt)
  {
    return _select(SelectionMode::ConfigurationValue, std::move(config_key));
  }

  ExperimentBuilder& using_sticky_routing(
    std::optional<std::string> selector_name = std::nullopt)
  {
    return _select(SelectionMode::StickyRouting, std::move(selector_name));
  }

  ExperimentBuilder& using_custom_mode(
    const std::string& mode_identifier,
    std::optional<std::string> selector_name = std::nullopt)
  {
    _spec.selection.custom_mode = mode_identifier;
    return _select(SelectionMode::Custom, std::move(selector_name));
  }

  ExperimentBuilder& on_error(ErrorPolicy policy)
  {
    _spec.error_policy = std::move(policy);
    return *this;
  }

  ExperimentBuilder& on_error_throw()
  {
    return on_error(ErrorPolicy::throw_errors());
  }

  ExperimentBuilder& on_error_redirect_and_replay_default()
  {
    return on_error(ErrorPolicy::redirect_and_replay_default());
  }

  ExperimentBuilder& on_error_redirect_and_replay(const std::string& key)
  {
    return on_error(ErrorPolicy::redirect_and_replay(key));
  }

  ExperimentBuilder& on_error_redirect_and_replay_ordered(
    const std::vector<std::string>& keys)
  {
    return on_error(ErrorPolicy::redirect_and_replay_ordered(keys));
  }

  ExperimentBuilder& on_error_redirect_and_replay_any()
  {
    return on_error(ErrorPolicy::redirect_and_replay_any());
  }

  ExperimentBuilder& active_from(bee::Time time)
  {
    _spec.activation.active_from = time;
    return *this;
  }

  ExperimentBuilder& active_until(bee::Time time)
  {
    _spec.activation.active_until = time;
    return *this;
  }

  ExperimentBuilder& active_when(ActivationPredicate predicate)
  {
    _spec.activation.predicate = std::move(predicate);
    return *this;
  }

  ExperimentBuilder& active_when_named(const std::string& predicate_name)
  {
    _spec.activation.named_predicates.push_back(predicate_name);
    return *this;
  }

  ExperimentBuilder& with_metadata(
    const std::string& key, const std::string& value)
  {
    _spec.metadata.insert_or_assign(key, value);
    return *this;
  }

  bee::OrError<ExperimentDefinitionBase::ptr> build() const
  {
    if (_default_count > 1) {
      return bee::Error::format(
        "Experiment '$' marks $ trials as default, expected exactly one",
        _spec.name,
        _default_count);
    }
    if (_duplicate_key.has_value()) {
      return bee::Error::format(
        "Experiment '$' registers trial '$' more than once",
        _spec.name,
        *_duplicate_key);
    }
    bail_unit(_spec.validate());
    return ExperimentDefinitionBase::ptr(
      std::make_shared<ExperimentDefinition<Service>>(_spec, _factories));
  }

 private:
  ExperimentBuilder& _add(const std::string& key, TrialFactory<Service> factory)
  {
    if (_factories.contains(key)) {
      if (!_duplicate_key.has_value()) { _duplicate_key = key; }
      return *this;
    }
    _spec.trial_keys.push_back(key);
    _factories.emplace(key, std::move(factory));
    return *this;
  }

  ExperimentBuilder& _select(
    SelectionMode mode, std::optional<std::string> selector_name)
  {
    _spec.selection.mode = mode;
    _spec.selection.selector_name = std::move(selector_name);
    return *this;
  }

  template <class Impl> static TrialFactory<Service> _make_factory()
  {
    return [](const ResolutionContext&)
             -> bee::OrError<std::shared_ptr<Service>> {
      return std::shared_ptr<Service>(std::make_shared<Impl>());
    };
  }

  ExperimentSpec _spec;
  std::map<std::string, TrialFactory<Service>> _factories;
  int _default_count = 0;
  std::optional<std::string> _duplicate_key;
};

} // namespace splitbit
