#pragma once

#include "invocation_context.hpp"
#include "logger.hpp"

#include "bee/file_path.hpp"
#include "bee/file_writer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace splitbit {

// Receives one assignment per completed call. Implementations deal with
// their own failures, nothing is reported back to the dispatcher.
struct AuditSink {
 public:
  using ptr = std::shared_ptr<AuditSink>;

  virtual ~AuditSink();

  virtual void record(const TrialAssignment& assignment) = 0;
};

struct NullAuditSink : public AuditSink {
 public:
  static ptr create();

  virtual ~NullAuditSink();

  virtual void record(const TrialAssignment& assignment) override;
};

struct InMemoryAuditSink : public AuditSink {
 public:
  using ptr = std::shared_ptr<InMemoryAuditSink>;

  static ptr create();

  virtual ~InMemoryAuditSink();

  virtual void record(const TrialAssignment& assignment) override;

  std::vector<TrialAssignment> assignments() const;

  size_t size() const;

  void clear();

 private:
  mutable std::mutex _mutex;
  std::vector<TrialAssignment> _assignments;
};

// Appends one Cof serialized AuditEvent per line.
struct FileAuditSink : public AuditSink {
 public:
  using ptr = std::shared_ptr<FileAuditSink>;

  static bee::OrError<ptr> create(
    const bee::FilePath& path, const Logger::ptr& logger);

  virtual ~FileAuditSink();

  virtual void record(const TrialAssignment& assignment) override;

  static std::string serialize(const TrialAssignment& assignment);

 private:
  FileAuditSink(bee::FileWriter::ptr writer, const Logger::ptr& logger);

  std::mutex _mutex;
  bee::FileWriter::ptr _writer;
  const Logger::ptr _logger;
};

} // namespace splitbit
