#include "logger.hpp"

#include "bee/file_descriptor.hpp"

using bee::FileDescriptor;
using bee::FilePath;
using std::make_shared;
using std::string;
using std::unique_lock;

namespace fs = std::filesystem;

namespace splitbit {

Logger::~Logger() {}

bee::OrError<Logger::ptr> Logger::create(const fs::path& log_dir)
{
  auto main_log_path = FilePath::of_std_path(log_dir / "main.log");
  bail(main_log_fd, FileDescriptor::create_file(main_log_path));
  return ptr(new Logger(make_shared<FileDescriptor>(std::move(main_log_fd))));
}

Logger::ptr Logger::standard()
{
  return ptr(new Logger(FileDescriptor::stderr_filedesc()));
}

Logger::ptr Logger::null() { return ptr(new Logger(nullptr)); }

void Logger::log_line(string msg) { _log_line(std::move(msg)); }

bool Logger::is_null() const { return _main_log_fd == nullptr; }

Logger::Logger(const FileDescriptor::shared_ptr& main_log_fd)
    : _main_log_fd(main_log_fd)
{}

void Logger::_log_line(string msg)
{
  if (_main_log_fd == nullptr) { return; }
  msg += '\n';
  auto lock = unique_lock(_write_mutex);
  must_unit(_main_log_fd->write(msg));
}

} // namespace splitbit
