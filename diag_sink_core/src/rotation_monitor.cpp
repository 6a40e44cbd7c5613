#include "diag_sink/rotation_monitor.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include "diag_sink/logger.hpp"

namespace diag_sink
{

RotationMonitor::RotationMonitor(RotatingWriter& writer, MonitorOptions options)
    : writer_(writer), options_(options)
{
}

RotationMonitor::~RotationMonitor() { Stop(); }

Status RotationMonitor::Start()
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (thread_.joinable())
  {
    return Status::Ok();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  try
  {
    thread_ = std::thread(&RotationMonitor::Loop, this);
  }
  catch (const std::system_error& e)
  {
    LOG_ERROR("cannot start rotation monitor: {}", e.what());
    return Status::Error(ErrorCode::StartFailed, e.what());
  }
  running_.store(true, std::memory_order_release);
  LOG_DEBUG("rotation monitor started (threshold {} bytes, check every {} ms, reclaim every {} ms)",
            options_.max_segment_bytes, options_.check_interval.count(),
            options_.reclaim_interval.count());
  return Status::Ok();
}

void RotationMonitor::Stop()
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
  {
    thread_.join();
    LOG_DEBUG("rotation monitor stopped");
  }
  running_.store(false, std::memory_order_release);
}

void RotationMonitor::Loop()
{
  using Clock = std::chrono::steady_clock;
  auto next_check = Clock::now() + options_.check_interval;
  auto next_reclaim = Clock::now() + options_.reclaim_interval;

  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_)
  {
    auto wake = std::min(next_check, next_reclaim);
    if (cv_.wait_until(lock, wake, [this] { return stop_requested_; }))
    {
      break;
    }
    lock.unlock();

    auto now = Clock::now();
    if (now >= next_check)
    {
      CheckOnce();
      next_check = now + options_.check_interval;
    }
    if (now >= next_reclaim)
    {
      ReclaimOnce();
      next_reclaim = now + options_.reclaim_interval;
    }
    ticks_.fetch_add(1, std::memory_order_relaxed);

    lock.lock();
  }
}

void RotationMonitor::Tick()
{
  CheckOnce();
  ReclaimOnce();
  ticks_.fetch_add(1, std::memory_order_relaxed);
}

bool RotationMonitor::CheckOnce()
{
  try
  {
    if (writer_.IsSealed())
    {
      return false;
    }

    SegmentInfo info = writer_.CurrentSegmentInfo();
    if (info.active && info.approximate_size < options_.max_segment_bytes)
    {
      return false;
    }

    if (info.active)
    {
      LOG_INFO("segment {} reached {} bytes (limit {}), rotating", info.path,
               info.approximate_size, options_.max_segment_bytes);
    }
    else
    {
      LOG_WARN("no active diagnostics segment, retrying open");
    }

    Status st = writer_.Rotate();
    if (st.ok())
    {
      (info.active ? rotations_ : reopens_).fetch_add(1, std::memory_order_relaxed);
      return true;
    }
    if (st.code() != ErrorCode::Sealed)
    {
      rotation_failures_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  catch (const std::exception& e)
  {
    rotation_failures_.fetch_add(1, std::memory_order_relaxed);
    LOG_ERROR("exception in segment size check: {}", e.what());
  }
  return false;
}

ReclaimResult RotationMonitor::ReclaimOnce()
{
  ReclaimResult result;
  try
  {
    result = writer_.Retired().ReclaimAll();
  }
  catch (const std::exception& e)
  {
    LOG_ERROR("exception while closing retired segments: {}", e.what());
    result.failed = writer_.Retired().Size();
  }
  reclaimed_.fetch_add(result.closed, std::memory_order_relaxed);
  reclaim_failures_.fetch_add(result.failed, std::memory_order_relaxed);
  return result;
}

MonitorStats RotationMonitor::Stats() const
{
  MonitorStats s;
  s.ticks = ticks_.load(std::memory_order_relaxed);
  s.rotations = rotations_.load(std::memory_order_relaxed);
  s.reopens = reopens_.load(std::memory_order_relaxed);
  s.rotation_failures = rotation_failures_.load(std::memory_order_relaxed);
  s.reclaimed = reclaimed_.load(std::memory_order_relaxed);
  s.reclaim_failures = reclaim_failures_.load(std::memory_order_relaxed);
  return s;
}

}  // namespace diag_sink
