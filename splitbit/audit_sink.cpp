#include "audit_sink.hpp"

#include "generated_audit_record.hpp"

#include "bee/format.hpp"
#include "yasf/cof.hpp"

using std::string;
using std::unique_lock;
using std::vector;

namespace splitbit {

namespace gar = generated_audit_record;

AuditSink::~AuditSink() {}

////////////////////////////////////////////////////////////////////////////////
// NullAuditSink
//

AuditSink::ptr NullAuditSink::create()
{
  return std::make_shared<NullAuditSink>();
}

NullAuditSink::~NullAuditSink() {}

void NullAuditSink::record(const TrialAssignment&) {}

////////////////////////////////////////////////////////////////////////////////
// InMemoryAuditSink
//

InMemoryAuditSink::ptr InMemoryAuditSink::create()
{
  return std::make_shared<InMemoryAuditSink>();
}

InMemoryAuditSink::~InMemoryAuditSink() {}

void InMemoryAuditSink::record(const TrialAssignment& assignment)
{
  auto lock = unique_lock(_mutex);
  _assignments.push_back(assignment);
}

vector<TrialAssignment> InMemoryAuditSink::assignments() const
{
  auto lock = unique_lock(_mutex);
  return _assignments;
}

size_t InMemoryAuditSink::size() const
{
  auto lock = unique_lock(_mutex);
  return _assignments.size();
}

void InMemoryAuditSink::clear()
{
  auto lock = unique_lock(_mutex);
  _assignments.clear();
}

////////////////////////////////////////////////////////////////////////////////
// FileAuditSink
//

bee::OrError<FileAuditSink::ptr> FileAuditSink::create(
  const bee::FilePath& path, const Logger::ptr& logger)
{
  bail(writer, bee::FileWriter::create(path));
  return ptr(new FileAuditSink(std::move(writer), logger));
}

FileAuditSink::FileAuditSink(
  bee::FileWriter::ptr writer, const Logger::ptr& logger)
    : _writer(std::move(writer)), _logger(logger)
{}

FileAuditSink::~FileAuditSink() {}

string FileAuditSink::serialize(const TrialAssignment& assignment)
{
  gar::AuditEvent event{
    .experiment = assignment.experiment_name,
    .service = assignment.service_name,
    .method = assignment.method_name,
    .selected_key = assignment.selected_key,
    .executed_key = assignment.executed_key,
    .route_reason = to_string(assignment.route_reason),
    .timestamp = assignment.timestamp,
    .attempts = assignment.attempts,
    .duration = assignment.duration,
    .error = assignment.error,
  };
  return yasf::Cof::serialize(event);
}

void FileAuditSink::record(const TrialAssignment& assignment)
{
  auto line = bee::format("$\n", serialize(assignment));
  auto lock = unique_lock(_mutex);
  auto res = _writer->write(line);
  if (res.is_error()) {
    _logger->log_line(
      "Failed to write audit event for experiment $: $",
      assignment.experiment_name,
      res.error());
  }
}

} // namespace splitbit
