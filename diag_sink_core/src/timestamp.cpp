#include "diag_sink/timestamp.hpp"

#include <time.h>

#include <cstdio>

namespace diag_sink
{

namespace
{

uint64_t ReadClock(clockid_t clock)
{
  struct timespec ts{};
  ::clock_gettime(clock, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

struct tm LocalTime(uint64_t wall_ns)
{
  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  struct tm tm_val{};
  ::localtime_r(&sec, &tm_val);
  return tm_val;
}

size_t Clamp(int n, size_t buf_size)
{
  if (n <= 0) return 0;
  return static_cast<size_t>(n) < buf_size ? static_cast<size_t>(n) : buf_size - 1;
}

}  // namespace

uint64_t MonotonicNowNs()
{
#if defined(DIAG_SINK_PLATFORM_LINUX) && defined(CLOCK_MONOTONIC_RAW)
  return ReadClock(CLOCK_MONOTONIC_RAW);
#else
  return ReadClock(CLOCK_MONOTONIC);
#endif
}

uint64_t WallClockNowNs() { return ReadClock(CLOCK_REALTIME); }

size_t FormatDate(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  struct tm t = LocalTime(wall_ns);
  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d", t.tm_year + 1900, t.tm_mon + 1,
                        t.tm_mday);
  return Clamp(n, buf_size);
}

size_t FormatTime(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;
  struct tm t = LocalTime(wall_ns);
  int n = std::snprintf(buf, buf_size, "%02d:%02d:%02d", t.tm_hour, t.tm_min, t.tm_sec);
  return Clamp(n, buf_size);
}

}  // namespace diag_sink
