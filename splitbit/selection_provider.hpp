#pragma once

#include "resolution_context.hpp"

#include "bee/error.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace splitbit {

// Extension point for SelectionMode::Custom.
struct SelectionModeProvider {
 public:
  using ptr = std::shared_ptr<SelectionModeProvider>;

  virtual ~SelectionModeProvider();

  virtual std::string mode_identifier() const = 0;

  virtual bee::OrError<std::string> resolve(
    const std::string& selector_name, const ResolutionContext& ctx) = 0;
};

struct SelectionModeRegistry {
 public:
  bee::OrError<bee::Unit> add(const SelectionModeProvider::ptr& provider);

  SelectionModeProvider::ptr find(const std::string& mode_identifier) const;

  std::vector<std::string> identifiers() const;

 private:
  std::map<std::string, SelectionModeProvider::ptr> _providers;
};

} // namespace splitbit
