#pragma once
#include <cstdint>
#include <type_traits>

#include "log_level.hpp"
#include "platform.hpp"

namespace diag_sink
{

// One internal diagnostic line. Fixed size so it can travel through the
// lock-free ring without allocation.
struct LogEntry
{
  uint64_t timestamp_ns;
  uint64_t wall_clock_ns;

  LogLevel level;

  const char* file_name;
  const char* function_name;
  uint32_t line;

  uint32_t thread_id;
  uint64_t sequence_id;

  uint16_t msg_len;
  char msg[DIAG_SINK_LOG_MAX_MSG_LEN];
};

static_assert(std::is_trivially_copyable_v<LogEntry>,
              "LogEntry must be trivially copyable for the ring buffer");

}  // namespace diag_sink
