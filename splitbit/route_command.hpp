#pragma once

#include "command/command_builder.hpp"

namespace splitbit {

struct RouteCommand {
 public:
  static command::Cmd command();
  static command::Cmd async_command();
};

} // namespace splitbit
