#pragma once

#include "command/command_builder.hpp"

namespace splitbit {

struct StickyCommand {
 public:
  static command::Cmd command();
};

} // namespace splitbit
