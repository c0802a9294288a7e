#include "kill_switch_command.hpp"

#include "file_kill_switch.hpp"
#include "logger.hpp"

#include "bee/format.hpp"

using bee::print_line;
using std::optional;
using std::string;

namespace splitbit {
namespace {

bee::OrError<bee::Unit> toggle(
  const string& filename,
  const string& service,
  const optional<string>& trial,
  bool enable)
{
  auto path = bee::FilePath::of_string(filename);
  bail(kill_switch, FileKillSwitchProvider::open(path, Logger::standard()));

  if (trial.has_value()) {
    if (enable) {
      kill_switch->enable_trial(service, *trial);
    } else {
      kill_switch->disable_trial(service, *trial);
    }
  } else {
    if (enable) {
      kill_switch->enable_experiment(service);
    } else {
      kill_switch->disable_experiment(service);
    }
  }

  bail(state, FileKillSwitchProvider::read_state(path));
  if (state != kill_switch->snapshot()) {
    shot("Kill switch file $ was not updated", filename);
  }

  print_line("Disabled experiments:");
  for (const auto& s : state.disabled_experiments) { print_line("  $", s); }
  print_line("Disabled trials:");
  for (const auto& [s, key] : state.disabled_trials) {
    print_line("  $ $", s, key);
  }
  return bee::ok();
}

} // namespace

command::Cmd KillSwitchCommand::command()
{
  using namespace command::flags;
  auto builder =
    command::CommandBuilder("Disable or enable an experiment or a trial");
  auto file = builder.required("--file", string_flag);
  auto service = builder.required("--service", string_flag);
  auto trial = builder.optional("--trial", string_flag);
  auto enable = builder.no_arg("--enable");
  return builder.run(
    [=]() { return toggle(*file, *service, *trial, *enable); });
}

} // namespace splitbit
