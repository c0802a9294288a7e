#include "route_command.hpp"

#include "audit_sink.hpp"
#include "builtin_decorators.hpp"
#include "dispatcher.hpp"
#include "file_kill_switch.hpp"
#include "flag_sources.hpp"
#include "outcome_store.hpp"
#include "sample_checkout.hpp"

#include "async/async_command.hpp"
#include "bee/format.hpp"
#include "bee/pretty_print.hpp"

#include <map>

using namespace async;

using bee::PrettyPrint;
using bee::print_line;
using std::map;
using std::optional;
using std::string;

namespace splitbit {
namespace {

struct RouteParams {
 public:
  string config_file;
  string mode;
  optional<string> selector;
  string policy;
  int subjects;
  bool v2_fails;
  optional<string> audit_file;
  optional<string> kill_switch_file;
  optional<string> log_dir;
};

struct RouteSetup {
 public:
  Proxy<CheckoutService>::ptr proxy;
  OutcomeStore::ptr outcomes;
  string experiment_name;
};

bee::OrError<RouteSetup> prepare(const RouteParams& params)
{
  Logger::ptr logger = Logger::standard();
  if (params.log_dir.has_value()) {
    bail_assign(logger, Logger::create(*params.log_dir));
  }

  bail(config, ConfigStore::load_file(params.config_file));
  bail(
    definition,
    SampleCheckout::definition({
      .selection_mode = params.mode,
      .selector = params.selector.value_or(""),
      .error_policy = params.policy,
      .v2_fails = params.v2_fails,
    }));

  auto outcomes = OutcomeStore::create();
  RegistryOptions options{
    .logger = logger,
    .sources =
      {
        .feature_flags = config,
        .variant_flags = config,
        .config_values = config,
      },
    .decorators =
      {
        ErrorLoggingDecorator::factory(),
        OutcomeCollectionDecorator::factory(outcomes),
      },
  };

  if (params.kill_switch_file.has_value()) {
    bail(
      kill_switch,
      FileKillSwitchProvider::open(
        bee::FilePath::of_string(*params.kill_switch_file), logger));
    options.kill_switch = kill_switch;
  }
  if (params.audit_file.has_value()) {
    bail(
      audit_sink,
      FileAuditSink::create(
        bee::FilePath::of_string(*params.audit_file), logger));
    options.audit_sink = audit_sink;
  }

  bail(registry, ExperimentRegistry::create({definition}, std::move(options)));
  bail(proxy, Proxy<CheckoutService>::create(registry));
  return RouteSetup{
    .proxy = proxy,
    .outcomes = outcomes,
    .experiment_name = definition->spec().name,
  };
}

ResolutionContext subject_context(int index)
{
  return ResolutionContext::for_subject(bee::format("user-$", index));
}

void print_report(
  const RouteSetup& setup,
  int subjects,
  const map<string, int>& results,
  int failures)
{
  print_line("Routed $ subjects, $ failed", subjects, failures);
  for (const auto& [result, count] : results) {
    print_line(
      "  $: $ ($%)",
      result,
      count,
      PrettyPrint::format_double(count * 100.0 / subjects, 1));
  }
  print_line("Attempts per trial:");
  for (const auto& [key, summary] : setup.outcomes->summary(setup.experiment_name)) {
    print_line("  $: $", key, summary.to_string());
  }
}

bee::OrError<bee::Unit> route_main(const RouteParams& params)
{
  bail(setup, prepare(params));

  map<string, int> results;
  int failures = 0;
  for (int i = 0; i < params.subjects; i++) {
    auto result = setup.proxy->invoke(
      "quote", subject_context(i), &CheckoutService::quote, 3);
    if (result.is_error()) {
      failures++;
    } else {
      results[result.value()]++;
    }
  }

  print_report(setup, params.subjects, results, failures);
  return bee::ok();
}

Task<bee::OrError<bee::Unit>> route_async_main(RouteParams params)
{
  co_bail(setup, prepare(params));

  map<string, int> results;
  int failures = 0;
  for (int i = 0; i < params.subjects; i++) {
    auto result = co_await setup.proxy->call_async<string>(
      "quote",
      subject_context(i),
      [](CheckoutService& service) { return service.quote_async(3); },
      {std::any(3)});
    if (result.is_error()) {
      failures++;
    } else {
      results[result.value()]++;
    }
  }

  print_report(setup, params.subjects, results, failures);
  co_return bee::ok();
}

template <class F> command::Cmd make_command(const char* description, F run)
{
  using namespace command::flags;
  auto builder = command::CommandBuilder(description);
  auto config_file = builder.required("--config", string_flag);
  auto mode =
    builder.optional_with_default("--mode", string_flag, "feature-flag");
  auto selector = builder.optional("--selector", string_flag);
  auto policy = builder.optional_with_default("--policy", string_flag, "default");
  auto subjects = builder.optional_with_default("--subjects", int_flag, 1000);
  auto v2_fails = builder.no_arg("--v2-fails");
  auto audit_file = builder.optional("--audit-file", string_flag);
  auto kill_switch_file = builder.optional("--kill-switch-file", string_flag);
  auto log_dir = builder.optional("--log-dir", string_flag);
  return run(builder, [=]() {
    return RouteParams{
      .config_file = *config_file,
      .mode = *mode,
      .selector = *selector,
      .policy = *policy,
      .subjects = *subjects,
      .v2_fails = *v2_fails,
      .audit_file = *audit_file,
      .kill_switch_file = *kill_switch_file,
      .log_dir = *log_dir,
    };
  });
}

} // namespace

command::Cmd RouteCommand::command()
{
  return make_command(
    "Route synthetic subjects through the checkout experiment",
    [](command::CommandBuilder& builder, auto params) {
      return builder.run([=]() { return route_main(params()); });
    });
}

command::Cmd RouteCommand::async_command()
{
  return make_command(
    "Route synthetic subjects through the checkout experiment asynchronously",
    [](command::CommandBuilder& builder, auto params) {
      return run_coro(builder, [=]() { return route_async_main(params()); });
    });
}

} // namespace splitbit
