#pragma once
#include <cstdint>
#include <string_view>

namespace diag_sink
{

enum class LogLevel : uint8_t
{
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Fatal = 5,
  Off = 6
};

constexpr std::string_view ToString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return "TRACE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Fatal:
      return "FATAL";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

constexpr char ToShortChar(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return 'T';
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warn:
      return 'W';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Fatal:
      return 'F';
    case LogLevel::Off:
      return 'O';
  }
  return '?';
}

// Compile-time floor, injected by CMake as -DDIAG_SINK_LOG_ACTIVE_LEVEL=2
#ifndef DIAG_SINK_LOG_ACTIVE_LEVEL
#ifdef NDEBUG
#define DIAG_SINK_LOG_ACTIVE_LEVEL 2  // Info
#else
#define DIAG_SINK_LOG_ACTIVE_LEVEL 0  // Trace
#endif
#endif

}  // namespace diag_sink
