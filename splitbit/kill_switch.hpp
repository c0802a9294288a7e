#pragma once

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>

namespace splitbit {

struct KillSwitchState {
 public:
  std::set<std::string> disabled_experiments;
  std::set<std::pair<std::string, std::string>> disabled_trials;

  bool operator==(const KillSwitchState& other) const = default;
};

// Runtime override forcing calls to the default trial. Reads happen on every
// dispatch, implementations must allow concurrent readers while a writer
// toggles a switch.
struct KillSwitchProvider {
 public:
  using ptr = std::shared_ptr<KillSwitchProvider>;

  virtual ~KillSwitchProvider();

  virtual bool is_experiment_disabled(const std::string& service) const = 0;

  virtual bool is_trial_disabled(
    const std::string& service, const std::string& trial_key) const = 0;

  virtual void disable_experiment(const std::string& service) = 0;
  virtual void enable_experiment(const std::string& service) = 0;

  virtual void disable_trial(
    const std::string& service, const std::string& trial_key) = 0;
  virtual void enable_trial(
    const std::string& service, const std::string& trial_key) = 0;
};

struct InMemoryKillSwitch : public KillSwitchProvider {
 public:
  using ptr = std::shared_ptr<InMemoryKillSwitch>;

  static ptr create();

  InMemoryKillSwitch();
  explicit InMemoryKillSwitch(KillSwitchState initial_state);

  virtual ~InMemoryKillSwitch();

  virtual bool is_experiment_disabled(
    const std::string& service) const override;

  virtual bool is_trial_disabled(
    const std::string& service, const std::string& trial_key) const override;

  virtual void disable_experiment(const std::string& service) override;
  virtual void enable_experiment(const std::string& service) override;

  virtual void disable_trial(
    const std::string& service, const std::string& trial_key) override;
  virtual void enable_trial(
    const std::string& service, const std::string& trial_key) override;

  KillSwitchState snapshot() const;

  void restore(KillSwitchState state);

 private:
  mutable std::shared_mutex _mutex;
  KillSwitchState _state;
};

} // namespace splitbit
