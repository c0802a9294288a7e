#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace splitbit {

struct CancellationFlag {
 public:
  using ptr = std::shared_ptr<CancellationFlag>;

  static ptr create();

  void cancel();

  bool is_cancelled() const;

 private:
  std::atomic_bool _cancelled = false;
};

// Per-call scope handed to trial factories, activation predicates and
// selection providers.
struct ResolutionContext {
 public:
  std::optional<std::string> subject_id;
  std::map<std::string, std::string> attributes;
  CancellationFlag::ptr cancellation;

  static ResolutionContext empty();

  static ResolutionContext for_subject(const std::string& subject_id);

  std::optional<std::string> attribute(const std::string& name) const;

  bool is_cancelled() const;
};

} // namespace splitbit
