#include "diag_sink/logger.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace diag_sink
{

uint32_t CurrentThreadId()
{
  thread_local uint32_t cached = 0;
  if (cached == 0)
  {
#if defined(DIAG_SINK_PLATFORM_LINUX)
    cached = static_cast<uint32_t>(::syscall(SYS_gettid));
#else
    cached = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
  }
  return cached;
}

Logger& Logger::Instance()
{
  static Logger inst;
  return inst;
}

Logger::Logger() = default;

Logger::~Logger() { Stop(); }

void Logger::AddSink(std::unique_ptr<ILogSink> sink) { backend_.AddSink(std::move(sink)); }

void Logger::ClearSinks() { backend_.ClearSinks(); }

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::Start() { backend_.Start(); }

void Logger::Stop() { backend_.Stop(); }

size_t Logger::Drain(size_t max_entries) { return backend_.Drain(max_entries); }

uint64_t Logger::DropCount() const { return drop_count_.load(std::memory_order_relaxed); }

void Logger::ResetDropCount() { drop_count_.store(0, std::memory_order_relaxed); }

}  // namespace diag_sink
