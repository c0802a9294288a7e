#pragma once

#include "experiment_definition.hpp"

#include "async/task.hpp"
#include "bee/error.hpp"

#include <memory>
#include <string>

namespace splitbit {

// Service used by the command line tool to exercise routing end to end.
struct CheckoutService {
 public:
  using ptr = std::shared_ptr<CheckoutService>;

  virtual ~CheckoutService();

  virtual bee::OrError<std::string> quote(int items) = 0;

  virtual async::Task<bee::OrError<std::string>> quote_async(int items) = 0;
};

struct SampleCheckout {
 public:
  struct Options {
    std::string selection_mode;
    std::string selector;
    std::string error_policy;
    bool v2_fails = false;
  };

  // Trials "control" (default), "true" and "v2". The "true" key lets a
  // boolean flag select v2.
  static bee::OrError<ExperimentDefinitionBase::ptr> definition(
    const Options& options);
};

} // namespace splitbit
