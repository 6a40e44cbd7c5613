#include "diag_sink/retired_writer_set.hpp"

#include <algorithm>

#include "diag_sink/logger.hpp"

namespace diag_sink
{

void RetiredWriterSet::Add(std::shared_ptr<ISegmentWriter> writer)
{
  if (!writer) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(writers_.begin(), writers_.end(), writer) != writers_.end())
  {
    return;
  }
  writers_.push_back(std::move(writer));
}

ReclaimResult RetiredWriterSet::ReclaimAll()
{
  std::lock_guard<std::mutex> lock(mutex_);
  ReclaimResult result;

  auto it = writers_.begin();
  while (it != writers_.end())
  {
    Status st = (*it)->Close();
    if (st.ok())
    {
      LOG_DEBUG("reclaimed segment {}", (*it)->Path());
      it = writers_.erase(it);
      ++result.closed;
    }
    else
    {
      LOG_ERROR("failed to close retired segment {}: {}", (*it)->Path(), st.ToString());
      ++it;
      ++result.failed;
    }
  }
  return result;
}

size_t RetiredWriterSet::Size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return writers_.size();
}

}  // namespace diag_sink
