#pragma once
#include <fmt/format.h>

#include <atomic>
#include <cstring>
#include <memory>

#include "backend.hpp"
#include "log_entry.hpp"
#include "log_level.hpp"
#include "sinks/sink_interface.hpp"
#include "source_location.hpp"
#include "timestamp.hpp"

namespace diag_sink
{

uint32_t CurrentThreadId();

// Process-wide diagnostic logger used by the sink to report its own work.
// Producers format with {fmt} into a LogEntry and push it to the backend ring;
// without Start() entries wait for Drain().
class Logger
{
 public:
  static Logger& Instance();

  void AddSink(std::unique_ptr<ILogSink> sink);
  void ClearSinks();
  void SetLevel(LogLevel level);
  LogLevel Level() const;

  void Start();
  void Stop();

  size_t Drain(size_t max_entries = 64);

  uint64_t DropCount() const;
  void ResetDropCount();

  template <typename... Args>
  void LogImpl(LogLevel level, const SourceLocation& loc, const char* format, Args&&... args);

 private:
  Logger();
  ~Logger();

  LogBackend backend_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::atomic<uint64_t> sequence_{0};
  std::atomic<uint64_t> drop_count_{0};
};

template <typename... Args>
void Logger::LogImpl(LogLevel level, const SourceLocation& loc, const char* format,
                     Args&&... args)
{
  LogEntry entry{};
  entry.timestamp_ns = MonotonicNowNs();
  entry.wall_clock_ns = WallClockNowNs();
  entry.level = level;
  entry.file_name = loc.file_name;
  entry.function_name = loc.function_name;
  entry.line = loc.line;
  entry.thread_id = CurrentThreadId();
  entry.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);

  try
  {
    auto result = fmt::format_to_n(entry.msg, DIAG_SINK_LOG_MAX_MSG_LEN - 1,
                                   fmt::runtime(format), std::forward<Args>(args)...);
    entry.msg_len = static_cast<uint16_t>(
        result.size < DIAG_SINK_LOG_MAX_MSG_LEN - 1 ? result.size : DIAG_SINK_LOG_MAX_MSG_LEN - 1);
  }
  catch (const fmt::format_error&)
  {
    // Keep the raw format string rather than losing the line.
    size_t len = std::strlen(format);
    if (len > DIAG_SINK_LOG_MAX_MSG_LEN - 1) len = DIAG_SINK_LOG_MAX_MSG_LEN - 1;
    std::memcpy(entry.msg, format, len);
    entry.msg_len = static_cast<uint16_t>(len);
  }
  entry.msg[entry.msg_len] = '\0';

  if (!backend_.TryPush(entry))
  {
    drop_count_.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace diag_sink

// ===== Logging macros =====

#define DIAG_SINK_LOG_CALL(lvl, fmt_str, ...)                                        \
  do                                                                                 \
  {                                                                                  \
    constexpr auto _ds_lvl = ::diag_sink::LogLevel::lvl;                             \
    if (static_cast<int>(_ds_lvl) >= DIAG_SINK_LOG_ACTIVE_LEVEL)                     \
    {                                                                                \
      auto& _ds_logger = ::diag_sink::Logger::Instance();                            \
      if (_ds_lvl >= _ds_logger.Level())                                             \
      {                                                                              \
        _ds_logger.LogImpl(_ds_lvl, DIAG_SINK_CURRENT_LOCATION(), fmt_str, ##__VA_ARGS__); \
      }                                                                              \
    }                                                                                \
  } while (0)

#define LOG_TRACE(fmt, ...) DIAG_SINK_LOG_CALL(Trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) DIAG_SINK_LOG_CALL(Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) DIAG_SINK_LOG_CALL(Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) DIAG_SINK_LOG_CALL(Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) DIAG_SINK_LOG_CALL(Error, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) DIAG_SINK_LOG_CALL(Fatal, fmt, ##__VA_ARGS__)

#define LOG_WARN_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_WARN(fmt, ##__VA_ARGS__); \
  } while (0)
#define LOG_ERROR_IF(cond, fmt, ...) \
  do                                 \
  {                                  \
    if (cond) LOG_ERROR(fmt, ##__VA_ARGS__); \
  } while (0)

#define LOG_EVERY_N(lvl, n, fmt, ...)                                       \
  do                                                                        \
  {                                                                         \
    static std::atomic<uint64_t> _ds_count{0};                              \
    if (_ds_count.fetch_add(1, std::memory_order_relaxed) % (n) == 0)       \
    {                                                                       \
      DIAG_SINK_LOG_CALL(lvl, fmt, ##__VA_ARGS__);                          \
    }                                                                       \
  } while (0)

#define LOG_ONCE(lvl, fmt, ...)                                  \
  do                                                             \
  {                                                              \
    static std::atomic<bool> _ds_logged{false};                  \
    if (!_ds_logged.exchange(true, std::memory_order_relaxed))   \
    {                                                            \
      DIAG_SINK_LOG_CALL(lvl, fmt, ##__VA_ARGS__);               \
    }                                                            \
  } while (0)
