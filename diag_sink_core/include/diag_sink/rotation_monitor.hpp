#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "retired_writer_set.hpp"
#include "rotating_writer.hpp"
#include "status.hpp"

namespace diag_sink
{

struct MonitorOptions
{
  uint64_t max_segment_bytes;
  std::chrono::milliseconds check_interval;
  std::chrono::milliseconds reclaim_interval;
};

struct MonitorStats
{
  uint64_t ticks = 0;
  uint64_t rotations = 0;
  uint64_t reopens = 0;  // segment opened where none was active
  uint64_t rotation_failures = 0;
  uint64_t reclaimed = 0;
  uint64_t reclaim_failures = 0;
};

// Background task that rotates the active segment once it reaches the size
// threshold and closes retired segments. Cancellation is observed between
// iterations: Stop() lets a running check or reclaim finish, then joins.
class RotationMonitor
{
 public:
  RotationMonitor(RotatingWriter& writer, MonitorOptions options);
  ~RotationMonitor();

  RotationMonitor(const RotationMonitor&) = delete;
  RotationMonitor& operator=(const RotationMonitor&) = delete;

  Status Start();
  void Stop();
  bool Running() const { return running_.load(std::memory_order_acquire); }

  // One full iteration (size check, then reclaim) on the calling thread.
  void Tick();

  // Returns true when a new segment was opened (a rotation, or a reopen
  // after the active segment could not be opened).
  bool CheckOnce();
  ReclaimResult ReclaimOnce();

  MonitorStats Stats() const;
  const MonitorOptions& Options() const { return options_; }

 private:
  void Loop();

  RotatingWriter& writer_;
  MonitorOptions options_;

  std::mutex lifecycle_mutex_;  // serializes Start/Stop, guards thread_
  std::mutex mutex_;            // guards stop_requested_
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> rotations_{0};
  std::atomic<uint64_t> reopens_{0};
  std::atomic<uint64_t> rotation_failures_{0};
  std::atomic<uint64_t> reclaimed_{0};
  std::atomic<uint64_t> reclaim_failures_{0};
};

}  // namespace diag_sink
