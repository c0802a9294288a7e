#include "resolution_context.hpp"

using std::nullopt;
using std::optional;
using std::string;

namespace splitbit {

////////////////////////////////////////////////////////////////////////////////
// CancellationFlag
//

CancellationFlag::ptr CancellationFlag::create()
{
  return std::make_shared<CancellationFlag>();
}

void CancellationFlag::cancel() { _cancelled = true; }

bool CancellationFlag::is_cancelled() const { return _cancelled; }

////////////////////////////////////////////////////////////////////////////////
// ResolutionContext
//

ResolutionContext ResolutionContext::empty() { return ResolutionContext{}; }

ResolutionContext ResolutionContext::for_subject(const string& subject_id)
{
  return ResolutionContext{.subject_id = subject_id};
}

optional<string> ResolutionContext::attribute(const string& name) const
{
  auto it = attributes.find(name);
  if (it == attributes.end()) { return nullopt; }
  return it->second;
}

bool ResolutionContext::is_cancelled() const
{
  return cancellation != nullptr && cancellation->is_cancelled();
}

} // namespace splitbit
