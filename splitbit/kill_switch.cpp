#include "kill_switch.hpp"

#include <mutex>

using std::make_pair;
using std::shared_lock;
using std::string;
using std::unique_lock;

namespace splitbit {

KillSwitchProvider::~KillSwitchProvider() {}

////////////////////////////////////////////////////////////////////////////////
// InMemoryKillSwitch
//

InMemoryKillSwitch::ptr InMemoryKillSwitch::create()
{
  return std::make_shared<InMemoryKillSwitch>();
}

InMemoryKillSwitch::InMemoryKillSwitch() {}

InMemoryKillSwitch::InMemoryKillSwitch(KillSwitchState initial_state)
    : _state(std::move(initial_state))
{}

InMemoryKillSwitch::~InMemoryKillSwitch() {}

bool InMemoryKillSwitch::is_experiment_disabled(const string& service) const
{
  auto lock = shared_lock(_mutex);
  return _state.disabled_experiments.contains(service);
}

bool InMemoryKillSwitch::is_trial_disabled(
  const string& service, const string& trial_key) const
{
  auto lock = shared_lock(_mutex);
  return _state.disabled_trials.contains(make_pair(service, trial_key));
}

void InMemoryKillSwitch::disable_experiment(const string& service)
{
  auto lock = unique_lock(_mutex);
  _state.disabled_experiments.insert(service);
}

void InMemoryKillSwitch::enable_experiment(const string& service)
{
  auto lock = unique_lock(_mutex);
  _state.disabled_experiments.erase(service);
}

void InMemoryKillSwitch::disable_trial(
  const string& service, const string& trial_key)
{
  auto lock = unique_lock(_mutex);
  _state.disabled_trials.emplace(service, trial_key);
}

void InMemoryKillSwitch::enable_trial(
  const string& service, const string& trial_key)
{
  auto lock = unique_lock(_mutex);
  _state.disabled_trials.erase(make_pair(service, trial_key));
}

KillSwitchState InMemoryKillSwitch::snapshot() const
{
  auto lock = shared_lock(_mutex);
  return _state;
}

void InMemoryKillSwitch::restore(KillSwitchState state)
{
  auto lock = unique_lock(_mutex);
  _state = std::move(state);
}

} // namespace splitbit
