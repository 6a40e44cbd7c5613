#pragma once
#include <cstddef>
#include <cstdint>

namespace diag_sink
{

uint64_t MonotonicNowNs();
uint64_t WallClockNowNs();
size_t FormatDate(uint64_t wall_ns, char* buf, size_t buf_size);
size_t FormatTime(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace diag_sink
