#include "kill_switch_command.hpp"
#include "route_command.hpp"
#include "sticky_command.hpp"

#include "command/command_builder.hpp"

using namespace command;

namespace splitbit {
namespace {

Cmd main_command()
{
  return GroupBuilder("Splitbit")
    .cmd("route", RouteCommand::command())
    .cmd("route-async", RouteCommand::async_command())
    .cmd("kill-switch", KillSwitchCommand::command())
    .cmd("sticky", StickyCommand::command())
    .build();
}

} // namespace
} // namespace splitbit

int main(int argc, char* argv[])
{
  return splitbit::main_command().main(argc, argv);
}
