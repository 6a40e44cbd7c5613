#pragma once
#include <memory>

#include "../formatters/formatter_interface.hpp"
#include "../log_entry.hpp"
#include "../log_level.hpp"

namespace diag_sink
{

// Destination for internal diagnostic log lines. Called from the logger
// backend thread (or from Logger::Drain in manual mode).
class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  virtual void Write(const LogEntry& entry) = 0;
  virtual void Flush() = 0;

  void SetFormatter(std::unique_ptr<IFormatter> formatter) { formatter_ = std::move(formatter); }

  void SetLevel(LogLevel level) { min_level_ = level; }
  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel entry_level) const { return entry_level >= min_level_; }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel min_level_ = LogLevel::Trace;
  char format_buf_[1024];

  size_t DoFormat(const LogEntry& entry)
  {
    if (!formatter_) return 0;
    return formatter_->Format(entry, format_buf_, sizeof(format_buf_));
  }
};

}  // namespace diag_sink
