#pragma once
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace diag_sink
{

struct EventField
{
  std::string key;
  std::string value;
};

// A structured event as emitted by the benchmark. The payload is opaque to
// the sink apart from the positions it is told to copy out.
struct EventRecord
{
  std::string source;
  uint32_t event_id = 0;
  std::vector<EventField> payload;

  const std::string* ValueAt(size_t position) const
  {
    return position < payload.size() ? &payload[position].value : nullptr;
  }
};

class IEventListener
{
 public:
  virtual ~IEventListener() = default;

  // Runs on the emitting thread; must not throw.
  virtual void OnEventWritten(const EventRecord& record) = 0;
};

// Fan-out point for benchmark events. Emit() may be called from any number
// of threads; listeners are invoked synchronously on the caller's thread.
// A listener must not (un)subscribe from inside OnEventWritten.
class EventSource
{
 public:
  explicit EventSource(std::string name) : name_(std::move(name)) {}

  EventSource(const EventSource&) = delete;
  EventSource& operator=(const EventSource&) = delete;

  void Subscribe(IEventListener* listener);
  void Unsubscribe(IEventListener* listener);

  void Emit(const EventRecord& record) const;

  const std::string& Name() const { return name_; }
  size_t ListenerCount() const;

 private:
  std::string name_;
  mutable std::shared_mutex mutex_;
  std::vector<IEventListener*> listeners_;
};

}  // namespace diag_sink
