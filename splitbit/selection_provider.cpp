#include "selection_provider.hpp"

using std::string;
using std::vector;

namespace splitbit {

SelectionModeProvider::~SelectionModeProvider() {}

bee::OrError<bee::Unit> SelectionModeRegistry::add(
  const SelectionModeProvider::ptr& provider)
{
  if (provider == nullptr) {
    return bee::Error("Cannot register a null selection mode provider");
  }
  auto id = provider->mode_identifier();
  if (id.empty()) {
    return bee::Error("Selection mode provider has an empty identifier");
  }
  if (!_providers.emplace(id, provider).second) {
    shot("Selection mode '$' registered more than once", id);
  }
  return bee::ok();
}

SelectionModeProvider::ptr SelectionModeRegistry::find(
  const string& mode_identifier) const
{
  auto it = _providers.find(mode_identifier);
  if (it == _providers.end()) { return nullptr; }
  return it->second;
}

vector<string> SelectionModeRegistry::identifiers() const
{
  vector<string> out;
  for (const auto& [id, _] : _providers) { out.push_back(id); }
  return out;
}

} // namespace splitbit
