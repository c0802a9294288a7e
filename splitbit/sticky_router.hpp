#pragma once

#include "bee/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace splitbit {

// Deterministic subject -> trial assignment. The trial keys are sorted before
// partitioning so the declaration order does not affect the assignment, and
// the selector name is part of the hash so different experiments split the
// same population independently.
struct StickyRouter {
 public:
  static uint64_t hash_subject(
    const std::string& subject_id, const std::string& selector_name);

  static bee::OrError<std::string> select_trial(
    const std::string& subject_id,
    const std::string& selector_name,
    const std::vector<std::string>& trial_keys);
};

} // namespace splitbit
