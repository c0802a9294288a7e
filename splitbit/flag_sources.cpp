#include "flag_sources.hpp"

#include "yasf/config_parser.hpp"
#include "yasf/serializer.hpp"

#include <mutex>

using std::map;
using std::optional;
using std::shared_lock;
using std::string;
using std::unique_lock;

namespace splitbit {
namespace {

bee::OrError<bool> parse_bool_flag(const string& name, const string& value)
{
  if (value == "true") { return true; }
  if (value == "false") { return false; }
  return bee::Error::format(
    "Flag '$' has value '$', expected true or false", name, value);
}

} // namespace

FeatureFlagSource::~FeatureFlagSource() {}

VariantFlagSource::~VariantFlagSource() {}

ConfigValueSource::~ConfigValueSource() {}

////////////////////////////////////////////////////////////////////////////////
// InMemoryFlags
//

InMemoryFlags::ptr InMemoryFlags::create()
{
  return std::make_shared<InMemoryFlags>();
}

InMemoryFlags::~InMemoryFlags() {}

void InMemoryFlags::set_flag(const string& flag_name, bool enabled)
{
  auto lock = unique_lock(_mutex);
  _flags.insert_or_assign(flag_name, enabled);
}

void InMemoryFlags::set_variant(const string& flag_name, const string& variant)
{
  auto lock = unique_lock(_mutex);
  _variants.insert_or_assign(flag_name, variant);
}

void InMemoryFlags::set_value(const string& key, const string& value)
{
  auto lock = unique_lock(_mutex);
  _values.insert_or_assign(key, value);
}

void InMemoryFlags::clear(const string& name)
{
  auto lock = unique_lock(_mutex);
  _flags.erase(name);
  _variants.erase(name);
  _values.erase(name);
}

bee::OrError<bool> InMemoryFlags::is_enabled(
  const string& flag_name, const ResolutionContext&)
{
  auto lock = shared_lock(_mutex);
  auto it = _flags.find(flag_name);
  if (it == _flags.end()) {
    return bee::Error::format("Feature flag '$' is not defined", flag_name);
  }
  return it->second;
}

bee::OrError<optional<string>> InMemoryFlags::variant(
  const string& flag_name, const ResolutionContext&)
{
  auto lock = shared_lock(_mutex);
  auto it = _variants.find(flag_name);
  if (it == _variants.end()) { return optional<string>(); }
  return optional<string>(it->second);
}

bee::OrError<optional<string>> InMemoryFlags::value(const string& key)
{
  auto lock = shared_lock(_mutex);
  auto it = _values.find(key);
  if (it == _values.end()) { return optional<string>(); }
  return optional<string>(it->second);
}

////////////////////////////////////////////////////////////////////////////////
// ConfigStore
//

bee::OrError<ConfigStore::ptr> ConfigStore::load_file(const string& filename)
{
  bail(parsed, yasf::ConfigParser::parse_from_file(filename));
  bail(values, yasf::des<map<string, string>>(parsed));
  return of_map(std::move(values));
}

ConfigStore::ptr ConfigStore::of_map(map<string, string> values)
{
  return ptr(new ConfigStore(std::move(values)));
}

ConfigStore::ConfigStore(map<string, string> values)
    : _values(std::move(values))
{}

ConfigStore::~ConfigStore() {}

bee::OrError<bool> ConfigStore::is_enabled(
  const string& flag_name, const ResolutionContext&)
{
  auto it = _values.find(flag_name);
  if (it == _values.end()) {
    return bee::Error::format("Feature flag '$' is not configured", flag_name);
  }
  return parse_bool_flag(flag_name, it->second);
}

bee::OrError<optional<string>> ConfigStore::variant(
  const string& flag_name, const ResolutionContext&)
{
  return value(flag_name);
}

bee::OrError<optional<string>> ConfigStore::value(const string& key)
{
  auto it = _values.find(key);
  if (it == _values.end()) { return optional<string>(); }
  return optional<string>(it->second);
}

const map<string, string>& ConfigStore::values() const { return _values; }

} // namespace splitbit
