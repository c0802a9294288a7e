#pragma once

#include "command/command_builder.hpp"

namespace splitbit {

struct KillSwitchCommand {
 public:
  static command::Cmd command();
};

} // namespace splitbit
