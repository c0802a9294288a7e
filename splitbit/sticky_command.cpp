#include "sticky_command.hpp"

#include "sticky_router.hpp"

#include "bee/format.hpp"
#include "bee/string_util.hpp"

using bee::print_line;
using std::string;

namespace splitbit {
namespace {

bee::OrError<bee::Unit> show_assignment(
  const string& subject, const string& selector, const string& trials)
{
  auto keys = bee::split(trials, ",");
  bail(key, StickyRouter::select_trial(subject, selector, keys));
  print_line(
    "subject:$ selector:$ hash:$ trial:$",
    subject,
    selector,
    StickyRouter::hash_subject(subject, selector),
    key);
  return bee::ok();
}

} // namespace

command::Cmd StickyCommand::command()
{
  using namespace command::flags;
  auto builder = command::CommandBuilder("Show the sticky trial of a subject");
  auto subject = builder.required("--subject", string_flag);
  auto selector = builder.required("--selector", string_flag);
  auto trials = builder.required("--trials", string_flag);
  return builder.run(
    [=]() { return show_assignment(*subject, *selector, *trials); });
}

} // namespace splitbit
