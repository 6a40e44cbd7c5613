#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "log_entry.hpp"
#include "platform.hpp"
#include "ring_buffer.hpp"
#include "sinks/sink_interface.hpp"

namespace diag_sink
{

// Consumer side of the internal logger: owns the ring and the log sinks.
class LogBackend
{
 public:
  LogBackend();
  ~LogBackend();

  LogBackend(const LogBackend&) = delete;
  LogBackend& operator=(const LogBackend&) = delete;

  // Producer side (any thread). False means the ring is full.
  bool TryPush(const LogEntry& entry);

  void AddSink(std::unique_ptr<ILogSink> sink);
  void ClearSinks();

  void Start();
  void Stop();  // joins the worker, drains what is left, flushes sinks

  // Manual pump, usable with or without the worker thread.
  size_t Drain(size_t max_entries = 64);

  bool Running() const { return running_.load(std::memory_order_relaxed); }

 private:
  MpscRing<LogEntry, DIAG_SINK_LOG_RING_SIZE> ring_;

  std::mutex sinks_mutex_;
  std::vector<std::unique_ptr<ILogSink>> sinks_;

  std::mutex drain_mutex_;  // the ring tolerates a single consumer at a time
  std::atomic<bool> running_{false};
  std::thread worker_;

  void WorkerLoop();
  void Dispatch(const LogEntry& entry);
  void FlushSinks();
};

}  // namespace diag_sink
