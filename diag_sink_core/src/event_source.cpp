#include "diag_sink/event_source.hpp"

#include <algorithm>
#include <mutex>

namespace diag_sink
{

void EventSource::Subscribe(IEventListener* listener)
{
  if (!listener) return;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
  {
    listeners_.push_back(listener);
  }
}

void EventSource::Unsubscribe(IEventListener* listener)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void EventSource::Emit(const EventRecord& record) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (IEventListener* listener : listeners_)
  {
    listener->OnEventWritten(record);
  }
}

size_t EventSource::ListenerCount() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listeners_.size();
}

}  // namespace diag_sink
