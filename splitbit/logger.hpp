#pragma once

#include "bee/error.hpp"
#include "bee/file_descriptor.hpp"
#include "bee/format.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

namespace splitbit {

struct Logger {
 public:
  using ptr = std::shared_ptr<Logger>;

  ~Logger();

  static bee::OrError<ptr> create(const std::filesystem::path& log_dir);

  static ptr standard();

  static ptr null();

  template <class... Ts> void log_line(const char* format, Ts&&... args)
  {
    if (_main_log_fd == nullptr) { return; }
    _log_line(bee::format(format, std::forward<Ts>(args)...));
  }

  void log_line(std::string msg);

  bool is_null() const;

 private:
  Logger(const std::shared_ptr<bee::FileDescriptor>& main_log_fd);

  void _log_line(std::string msg);

  std::shared_ptr<bee::FileDescriptor> _main_log_fd;

  std::mutex _write_mutex;
};

} // namespace splitbit
