#include "yasf/core_types.hpp"
#include "yasf/generator.hpp"
#include "yasf/generator_main_lib.hpp"

using namespace yasf;

namespace splitbit {
namespace {

Definitions create_def()
{
  using namespace types;

  constexpr auto audit_event = record(
    "AuditEvent",
    fields(
      required_field("experiment", str),
      required_field("service", str),
      required_field("method", str),
      required_field("selected_key", str),
      required_field("executed_key", str),
      required_field("route_reason", str),
      required_field("timestamp", Time),
      optional_field("attempts", vec(str)),
      optional_field("duration", Span),
      optional_field("error", str)));

  constexpr auto kill_switch_entry = record(
    "KillSwitchEntry",
    fields(
      required_field("service", str), optional_field("trial_key", str)));

  return Definitions{
    .types =
      {
        audit_event,
        kill_switch_entry,
      },
  };
}

} // namespace
} // namespace splitbit

Definitions create_def() { return splitbit::create_def(); }
