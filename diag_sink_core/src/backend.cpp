#include "diag_sink/backend.hpp"

#include <chrono>

namespace diag_sink
{

LogBackend::LogBackend() = default;

LogBackend::~LogBackend() { Stop(); }

bool LogBackend::TryPush(const LogEntry& entry) { return ring_.TryPush(entry); }

void LogBackend::AddSink(std::unique_ptr<ILogSink> sink)
{
  if (!sink) return;
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

void LogBackend::ClearSinks()
{
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.clear();
}

void LogBackend::Start()
{
  if (running_.exchange(true, std::memory_order_relaxed))
  {
    return;
  }
  worker_ = std::thread(&LogBackend::WorkerLoop, this);
}

void LogBackend::Stop()
{
  running_.store(false, std::memory_order_relaxed);
  if (worker_.joinable())
  {
    worker_.join();
  }
  while (Drain(64) > 0)
  {
  }
  FlushSinks();
}

size_t LogBackend::Drain(size_t max_entries)
{
  std::lock_guard<std::mutex> consumer(drain_mutex_);
  size_t count = 0;
  LogEntry entry{};
  while (count < max_entries && ring_.TryPop(entry))
  {
    Dispatch(entry);
    ++count;
  }
  return count;
}

void LogBackend::Dispatch(const LogEntry& entry)
{
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Write(entry);
  }
}

void LogBackend::FlushSinks()
{
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

void LogBackend::WorkerLoop()
{
  uint32_t idle = 0;
  while (running_.load(std::memory_order_relaxed))
  {
    if (Drain(64) > 0)
    {
      idle = 0;
      continue;
    }
    ++idle;
    if (idle < 64)
    {
      std::this_thread::yield();
    }
    else
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
}

}  // namespace diag_sink
