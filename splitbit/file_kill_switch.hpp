#pragma once

#include "kill_switch.hpp"
#include "logger.hpp"

#include "bee/error.hpp"
#include "bee/file_path.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace splitbit {

// Kill switch backed by a file of Cof serialized entries, one per line. The
// in-memory state is authoritative: a mutation always takes effect in
// process, a failure to write the file is only logged.
struct FileKillSwitchProvider : public KillSwitchProvider {
 public:
  using ptr = std::shared_ptr<FileKillSwitchProvider>;

  // Loads the existing state, a missing file means nothing is disabled.
  static bee::OrError<ptr> open(
    const bee::FilePath& path, const Logger::ptr& logger);

  virtual ~FileKillSwitchProvider();

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

  static bee::OrError<KillSwitchState> read_state(const bee::FilePath& path);

  static bee::OrError<bee::Unit> write_state(
    const bee::FilePath& path, const KillSwitchState& state);

 private:
  FileKillSwitchProvider(
    const bee::FilePath& path,
    const Logger::ptr& logger,
    KillSwitchState initial_state);

  void _persist();

  const bee::FilePath _path;
  const Logger::ptr _logger;
  InMemoryKillSwitch _state;

  std::mutex _persist_mutex;
};

} // namespace splitbit
