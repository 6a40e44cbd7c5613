#include "diag_sink/sinks/console_sink.hpp"

#include <unistd.h>

#include "diag_sink/formatters/pattern_formatter.hpp"

namespace diag_sink
{

ConsoleLogSink::ConsoleLogSink(std::optional<bool> force_color, LogLevel stderr_level)
    : stdout_color_(force_color.value_or(::isatty(STDOUT_FILENO) != 0)),
      stderr_color_(force_color.value_or(::isatty(STDERR_FILENO) != 0)),
      stderr_level_(stderr_level),
      stdout_default_(
          std::make_unique<PatternFormatter>(PatternFormatter::kDefaultPattern, stdout_color_)),
      stderr_default_(
          std::make_unique<PatternFormatter>(PatternFormatter::kDefaultPattern, stderr_color_))
{
}

size_t ConsoleLogSink::FormatFor(const LogEntry& entry, bool to_stderr)
{
  if (formatter_)
  {
    return DoFormat(entry);
  }
  IFormatter& fallback = to_stderr ? *stderr_default_ : *stdout_default_;
  return fallback.Format(entry, format_buf_, sizeof(format_buf_));
}

void ConsoleLogSink::Write(const LogEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }

  bool to_stderr = entry.level >= stderr_level_;
  size_t len = FormatFor(entry, to_stderr);
  if (len == 0)
  {
    return;
  }

  FILE* target = to_stderr ? stderr : stdout;
  std::fwrite(format_buf_, 1, len, target);
  std::fputc('\n', target);
  if (to_stderr)
  {
    std::fflush(target);
  }
}

void ConsoleLogSink::Flush()
{
  std::fflush(stdout);
  std::fflush(stderr);
}

}  // namespace diag_sink
