#include "file_kill_switch.hpp"
#include "kill_switch.hpp"

#include "bee/testing.hpp"

#include <cassert>
#include <filesystem>
#include <thread>
#include <vector>

using bee::print_line;
using std::string;

namespace fs = std::filesystem;

namespace splitbit {
namespace {

void show(const KillSwitchProvider& ks)
{
  print_line(
    "experiment:$ trial-a:$ trial-b:$",
    ks.is_experiment_disabled("IService"),
    ks.is_trial_disabled("IService", "a"),
    ks.is_trial_disabled("IService", "b"));
}

TEST(in_memory)
{
  auto ks = InMemoryKillSwitch::create();
  show(*ks);
  ks->disable_trial("IService", "a");
  show(*ks);
  ks->disable_experiment("IService");
  show(*ks);
  ks->enable_experiment("IService");
  ks->enable_trial("IService", "a");
  show(*ks);
  assert(!ks->is_trial_disabled("IService", "a"));
  assert(!ks->is_trial_disabled("IOther", "a"));
}

TEST(snapshot_and_restore)
{
  auto ks = InMemoryKillSwitch::create();
  ks->disable_trial("IService", "b");
  auto snapshot = ks->snapshot();
  ks->enable_trial("IService", "b");
  ks->disable_experiment("IService");
  ks->restore(snapshot);
  show(*ks);
  assert(ks->snapshot() == snapshot);
}

TEST(concurrent_readers_and_writer)
{
  auto ks = InMemoryKillSwitch::create();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([ks]() {
      for (int i = 0; i < 10000; i++) {
        ks->is_trial_disabled("IService", "a");
        ks->is_experiment_disabled("IService");
      }
    });
  }
  threads.emplace_back([ks]() {
    for (int i = 0; i < 1000; i++) {
      ks->disable_trial("IService", "a");
      ks->enable_trial("IService", "a");
    }
  });
  for (auto& t : threads) { t.join(); }
  show(*ks);
}

fs::path test_dir(const string& name)
{
  auto dir = fs::temp_directory_path() / ("splitbit_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

TEST(file_persists_across_instances)
{
  auto dir = test_dir("kill_switch");
  auto path = bee::FilePath::of_std_path(dir / "kill_switch.cof");
  auto logger = Logger::null();
  {
    must(ks, FileKillSwitchProvider::open(path, logger));
    show(*ks);
    ks->disable_experiment("IService");
    ks->disable_trial("IService", "b");
  }
  {
    must(ks, FileKillSwitchProvider::open(path, logger));
    show(*ks);
    assert(ks->is_experiment_disabled("IService"));
    assert(ks->is_trial_disabled("IService", "b"));
    ks->enable_experiment("IService");
  }
  must(state, FileKillSwitchProvider::read_state(path));
  print_line(
    "on disk: $ experiments, $ trials",
    state.disabled_experiments.size(),
    state.disabled_trials.size());
  assert(state.disabled_experiments.empty());
  fs::remove_all(dir);
}

TEST(failed_persist_still_toggles)
{
  auto dir = test_dir("kill_switch_unwritable");
  auto path =
    bee::FilePath::of_std_path(dir / "missing_dir" / "kill_switch.cof");
  must(ks, FileKillSwitchProvider::open(path, Logger::null()));
  ks->disable_trial("IService", "a");
  show(*ks);
  assert(ks->is_trial_disabled("IService", "a"));
  fs::remove_all(dir);
}

} // namespace
} // namespace splitbit
