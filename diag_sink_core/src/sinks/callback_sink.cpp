#include "diag_sink/sinks/callback_sink.hpp"

namespace diag_sink
{

CallbackLogSink::CallbackLogSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackLogSink::Write(const LogEntry& entry)
{
  if (!ShouldLog(entry.level))
  {
    return;
  }
  if (callback_)
  {
    callback_(entry);
  }
}

}  // namespace diag_sink
