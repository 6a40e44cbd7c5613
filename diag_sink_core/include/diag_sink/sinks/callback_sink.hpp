#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace diag_sink
{

class CallbackLogSink : public ILogSink
{
 public:
  using Callback = std::function<void(const LogEntry&)>;

  explicit CallbackLogSink(Callback cb);

  void Write(const LogEntry& entry) override;
  void Flush() override {}

 private:
  Callback callback_;
};

}  // namespace diag_sink
