#pragma once

#include "decorator.hpp"
#include "selection_provider.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace splitbit {

struct TracedAttempt {
 public:
  std::string experiment_name;
  std::string method_name;
  std::string selected_key;
  std::string trial_key;
  int attempt;
  bool success;
  std::optional<std::string> error;
  CancellationFlag::ptr cancellation;
};

// Records every attempt that passes through the chain, in order.
struct TraceCapturingDecorator : public Decorator {
 public:
  using ptr = std::shared_ptr<TraceCapturingDecorator>;

  static ptr create();

  virtual ~TraceCapturingDecorator();

  virtual Result invoke(
    const InvocationContext& ctx, const Next& next) override;

  virtual async::Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override;

  std::vector<TracedAttempt> attempts() const;

  // Trial keys of the recorded attempts
  std::vector<std::string> trial_keys() const;

  void clear();

 private:
  void _record(
    const InvocationContext& ctx, const Result& result);

  mutable std::mutex _mutex;
  std::vector<TracedAttempt> _attempts;
};

// Custom selection mode answering from a fixed selector -> key table.
struct FixedSelectionProvider : public SelectionModeProvider {
 public:
  using ptr = std::shared_ptr<FixedSelectionProvider>;

  static ptr create(
    std::string mode_identifier, std::map<std::string, std::string> keys);

  FixedSelectionProvider(
    std::string mode_identifier, std::map<std::string, std::string> keys);

  virtual ~FixedSelectionProvider();

  virtual std::string mode_identifier() const override;

  virtual bee::OrError<std::string> resolve(
    const std::string& selector_name, const ResolutionContext& ctx) override;

 private:
  const std::string _mode_identifier;
  const std::map<std::string, std::string> _keys;
};

} // namespace splitbit
