#pragma once
#include <cstdio>
#include <memory>
#include <optional>

#include "sink_interface.hpp"

namespace diag_sink
{

// Entries at or above `stderr_level` go to stderr, the rest to stdout.
// Without an explicit formatter each stream gets the default pattern,
// coloured only when that stream is a terminal (or as forced).
class ConsoleLogSink : public ILogSink
{
 public:
  explicit ConsoleLogSink(std::optional<bool> force_color = std::nullopt,
                          LogLevel stderr_level = LogLevel::Warn);

  void Write(const LogEntry& entry) override;
  void Flush() override;

  bool UsesColor() const { return stdout_color_ || stderr_color_; }
  LogLevel StderrLevel() const { return stderr_level_; }

 private:
  size_t FormatFor(const LogEntry& entry, bool to_stderr);

  bool stdout_color_;
  bool stderr_color_;
  LogLevel stderr_level_;
  std::unique_ptr<IFormatter> stdout_default_;
  std::unique_ptr<IFormatter> stderr_default_;
};

}  // namespace diag_sink
