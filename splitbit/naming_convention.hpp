#pragma once

#include <memory>
#include <string>

namespace splitbit {

// Derives selector names from a service name when a definition does not name
// one explicitly.
struct NamingConvention {
 public:
  using ptr = std::shared_ptr<NamingConvention>;

  virtual ~NamingConvention();

  virtual std::string feature_flag_name_for(
    const std::string& service_name) const = 0;

  virtual std::string variant_flag_name_for(
    const std::string& service_name) const = 0;

  virtual std::string configuration_key_for(
    const std::string& service_name) const = 0;

  // "IMyService" -> "my-service"
  static std::string to_kebab_case(const std::string& service_name);

  static ptr default_convention();
};

} // namespace splitbit
