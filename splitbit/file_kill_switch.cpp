#include "file_kill_switch.hpp"

#include "generated_audit_record.hpp"

#include "bee/file_reader.hpp"
#include "bee/file_writer.hpp"
#include "bee/filesystem.hpp"
#include "bee/string_util.hpp"
#include "yasf/cof.hpp"

#include <filesystem>

using bee::FilePath;
using bee::FileSystem;
using std::string;
using std::unique_lock;
using std::vector;

namespace fs = std::filesystem;

namespace splitbit {

namespace gar = generated_audit_record;

bee::OrError<FileKillSwitchProvider::ptr> FileKillSwitchProvider::open(
  const FilePath& path, const Logger::ptr& logger)
{
  KillSwitchState state;
  if (FileSystem::exists(path)) { bail_assign(state, read_state(path)); }
  logger->log_line(
    "Loaded kill switch state from $: $ experiments, $ trials disabled",
    path.to_std_path().native(),
    state.disabled_experiments.size(),
    state.disabled_trials.size());
  return ptr(new FileKillSwitchProvider(path, logger, std::move(state)));
}

FileKillSwitchProvider::FileKillSwitchProvider(
  const FilePath& path, const Logger::ptr& logger, KillSwitchState initial_state)
    : _path(path), _logger(logger), _state(std::move(initial_state))
{}

FileKillSwitchProvider::~FileKillSwitchProvider() {}

bool FileKillSwitchProvider::is_experiment_disabled(const string& service) const
{
  return _state.is_experiment_disabled(service);
}

bool FileKillSwitchProvider::is_trial_disabled(
  const string& service, const string& trial_key) const
{
  return _state.is_trial_disabled(service, trial_key);
}

void FileKillSwitchProvider::disable_experiment(const string& service)
{
  _state.disable_experiment(service);
  _persist();
}

void FileKillSwitchProvider::enable_experiment(const string& service)
{
  _state.enable_experiment(service);
  _persist();
}

void FileKillSwitchProvider::disable_trial(
  const string& service, const string& trial_key)
{
  _state.disable_trial(service, trial_key);
  _persist();
}

void FileKillSwitchProvider::enable_trial(
  const string& service, const string& trial_key)
{
  _state.enable_trial(service, trial_key);
  _persist();
}

KillSwitchState FileKillSwitchProvider::snapshot() const
{
  return _state.snapshot();
}

bee::OrError<KillSwitchState> FileKillSwitchProvider::read_state(
  const FilePath& path)
{
  KillSwitchState state;
  bail(reader, bee::FileReader::open(path));
  while (!reader->is_eof()) {
    bail(line, reader->read_line());
    if (line.empty()) { continue; }
    bail(entry, yasf::Cof::deserialize<gar::KillSwitchEntry>(line));
    if (entry.trial_key.has_value()) {
      state.disabled_trials.emplace(entry.service, *entry.trial_key);
    } else {
      state.disabled_experiments.insert(entry.service);
    }
  }
  return state;
}

bee::OrError<bee::Unit> FileKillSwitchProvider::write_state(
  const FilePath& path, const KillSwitchState& state)
{
  vector<string> lines;
  for (const auto& service : state.disabled_experiments) {
    lines.push_back(
      yasf::Cof::serialize(gar::KillSwitchEntry{.service = service}) + "\n");
  }
  for (const auto& [service, trial_key] : state.disabled_trials) {
    lines.push_back(
      yasf::Cof::serialize(
        gar::KillSwitchEntry{.service = service, .trial_key = trial_key}) +
      "\n");
  }

  auto tmp_file = path + ".tmp";
  bail_unit(bee::FileWriter::save_file(tmp_file, bee::join(lines, "")));
  std::error_code ec;
  fs::rename(tmp_file.to_std_path(), path.to_std_path(), ec);
  if (ec) {
    return bee::Error::format(
      "Failed to replace kill switch file $: $",
      path.to_std_path().native(),
      ec.message());
  }
  return bee::ok();
}

void FileKillSwitchProvider::_persist()
{
  auto lock = unique_lock(_persist_mutex);
  auto res = write_state(_path, _state.snapshot());
  if (res.is_error()) {
    _logger->log_line(
      "Failed to persist kill switch state to $: $",
      _path.to_std_path().native(),
      res.error());
  }
}

} // namespace splitbit
