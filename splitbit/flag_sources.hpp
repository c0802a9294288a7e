#pragma once

#include "resolution_context.hpp"

#include "bee/error.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace splitbit {

struct FeatureFlagSource {
 public:
  using ptr = std::shared_ptr<FeatureFlagSource>;

  virtual ~FeatureFlagSource();

  virtual bee::OrError<bool> is_enabled(
    const std::string& flag_name, const ResolutionContext& ctx) = 0;
};

struct VariantFlagSource {
 public:
  using ptr = std::shared_ptr<VariantFlagSource>;

  virtual ~VariantFlagSource();

  virtual bee::OrError<std::optional<std::string>> variant(
    const std::string& flag_name, const ResolutionContext& ctx) = 0;
};

struct ConfigValueSource {
 public:
  using ptr = std::shared_ptr<ConfigValueSource>;

  virtual ~ConfigValueSource();

  virtual bee::OrError<std::optional<std::string>> value(
    const std::string& key) = 0;
};

// Mutable flag store, mostly for tests and embedding hosts that push flag
// values in from elsewhere.
struct InMemoryFlags : public FeatureFlagSource,
                       public VariantFlagSource,
                       public ConfigValueSource {
 public:
  using ptr = std::shared_ptr<InMemoryFlags>;

  static ptr create();

  virtual ~InMemoryFlags();

  void set_flag(const std::string& flag_name, bool enabled);
  void set_variant(const std::string& flag_name, const std::string& variant);
  void set_value(const std::string& key, const std::string& value);
  void clear(const std::string& name);

  virtual bee::OrError<bool> is_enabled(
    const std::string& flag_name, const ResolutionContext& ctx) override;

  virtual bee::OrError<std::optional<std::string>> variant(
    const std::string& flag_name, const ResolutionContext& ctx) override;

  virtual bee::OrError<std::optional<std::string>> value(
    const std::string& key) override;

 private:
  mutable std::shared_mutex _mutex;
  std::map<std::string, bool> _flags;
  std::map<std::string, std::string> _variants;
  std::map<std::string, std::string> _values;
};

// Read-only key/value configuration loaded from a yasf config file. Boolean
// flags are the strings "true" and "false".
struct ConfigStore : public FeatureFlagSource,
                     public VariantFlagSource,
                     public ConfigValueSource {
 public:
  using ptr = std::shared_ptr<ConfigStore>;

  static bee::OrError<ptr> load_file(const std::string& filename);

  static ptr of_map(std::map<std::string, std::string> values);

  virtual ~ConfigStore();

  virtual bee::OrError<bool> is_enabled(
    const std::string& flag_name, const ResolutionContext& ctx) override;

  virtual bee::OrError<std::optional<std::string>> variant(
    const std::string& flag_name, const ResolutionContext& ctx) override;

  virtual bee::OrError<std::optional<std::string>> value(
    const std::string& key) override;

  const std::map<std::string, std::string>& values() const;

 private:
  explicit ConfigStore(std::map<std::string, std::string> values);

  const std::map<std::string, std::string> _values;
};

} // namespace splitbit
