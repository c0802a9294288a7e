#pragma once

#include "decorator.hpp"

#include "bee/span.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace splitbit {

struct Outcome {
 public:
  std::string experiment_name;
  std::string trial_key;
  std::string method_name;
  std::optional<std::string> subject_id;
  bool success = false;
  bee::Span duration;
  std::optional<std::string> error;
};

struct TrialSummary {
 public:
  int count = 0;
  int failures = 0;
  double mean_duration_seconds = 0;

  double failure_rate() const;

  std::string to_string() const;
};

// In-memory outcome rows, safe to append to from many threads.
struct OutcomeStore {
 public:
  using ptr = std::shared_ptr<OutcomeStore>;

  static ptr create();

  void record(Outcome outcome);

  std::vector<Outcome> outcomes() const;

  std::vector<Outcome> outcomes_for(const std::string& experiment_name) const;

  // Keyed by trial key
  std::map<std::string, TrialSummary> summary(
    const std::string& experiment_name) const;

  void clear();

 private:
  mutable std::mutex _mutex;
  std::vector<Outcome> _outcomes;
};

// Records one outcome per attempt, fallbacks included.
struct OutcomeCollectionDecorator : public Decorator {
 public:
  explicit OutcomeCollectionDecorator(const OutcomeStore::ptr& store);

  virtual ~OutcomeCollectionDecorator();

  virtual Result invoke(
    const InvocationContext& ctx, const Next& next) override;

  virtual async::Task<Result> invoke_async(
    InvocationContext ctx, AsyncNext next) override;

  static DecoratorFactory::ptr factory(const OutcomeStore::ptr& store);

 private:
  void _record(
    const InvocationContext& ctx,
    const Result& result,
    bee::Span duration);

  const OutcomeStore::ptr _store;
};

} // namespace splitbit
