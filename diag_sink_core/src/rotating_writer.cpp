#include "diag_sink/rotating_writer.hpp"

#include <exception>

#include "diag_sink/logger.hpp"

namespace diag_sink
{

RotatingWriter::RotatingWriter(SegmentLayout layout, SegmentFactory factory)
    : layout_(std::move(layout)), factory_(std::move(factory))
{
  if (!factory_)
  {
    factory_ = DefaultSegmentFactory();
  }

  Status st;
  active_ = OpenSegment(0, &st);
  if (active_)
  {
    next_index_ = 1;
    LOG_INFO("diagnostics segment {} opened ({} bytes)", active_->Path(),
             active_->ApproximateSize());
  }
  else
  {
    LOG_ERROR("cannot open initial diagnostics segment: {}", st.ToString());
  }
}

std::shared_ptr<ISegmentWriter> RotatingWriter::OpenSegment(uint32_t index, Status* status)
{
  std::string path = layout_.PathFor(index);
  try
  {
    auto segment = factory_(path, index, status);
    if (!segment && status->ok())
    {
      *status = Status::Error(ErrorCode::OpenFailed, "factory returned no segment for '" + path + "'");
    }
    return segment;
  }
  catch (const std::exception& e)
  {
    *status = Status::Error(ErrorCode::OpenFailed, "open '" + path + "': " + e.what());
    return nullptr;
  }
}

std::shared_ptr<ISegmentWriter> RotatingWriter::Snapshot() const
{
  std::lock_guard<std::mutex> lock(handle_mutex_);
  return active_;
}

Status RotatingWriter::Append(std::string_view record)
{
  std::shared_ptr<ISegmentWriter> tried;
  for (;;)
  {
    if (sealed_.load(std::memory_order_acquire))
    {
      return Status::Error(ErrorCode::Sealed, "writer is sealed");
    }
    std::shared_ptr<ISegmentWriter> segment = Snapshot();
    if (!segment)
    {
      if (sealed_.load(std::memory_order_acquire))
      {
        return Status::Error(ErrorCode::Sealed, "writer is sealed");
      }
      return Status::Error(ErrorCode::Closed, "no active segment");
    }
    if (segment == tried)
    {
      // Closed while still active: nothing newer to move on to.
      return Status::Error(ErrorCode::Closed, "segment '" + segment->Path() + "' is closed");
    }

    Status st = segment->Append(record);
    if (st.code() != ErrorCode::Closed)
    {
      return st;
    }
    // Retired and reclaimed between the snapshot and the write.
    tried = std::move(segment);
  }
}

Status RotatingWriter::Rotate(SegmentInfo* opened)
{
  std::lock_guard<std::mutex> rotation(rotate_mutex_);
  if (sealed_.load(std::memory_order_acquire))
  {
    return Status::Error(ErrorCode::Sealed, "writer is sealed");
  }

  Status st;
  std::shared_ptr<ISegmentWriter> fresh = OpenSegment(next_index_, &st);
  if (!fresh)
  {
    LOG_ERROR("rotation to segment {} failed, keeping current segment: {}", next_index_,
              st.ToString());
    return st;
  }

  std::shared_ptr<ISegmentWriter> previous;
  {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    previous = std::move(active_);
    active_ = fresh;
  }
  ++next_index_;

  if (previous)
  {
    rotation_count_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("rotated {} ({} bytes) -> {}", previous->Path(), previous->ApproximateSize(),
             fresh->Path());
    retired_.Add(std::move(previous));
  }
  else
  {
    LOG_INFO("opened diagnostics segment {}", fresh->Path());
  }

  if (opened)
  {
    opened->path = fresh->Path();
    opened->approximate_size = fresh->ApproximateSize();
    opened->index = fresh->Index();
    opened->active = true;
  }
  return Status::Ok();
}

SegmentInfo RotatingWriter::CurrentSegmentInfo() const
{
  std::shared_ptr<ISegmentWriter> current = Snapshot();

  SegmentInfo info;
  if (current)
  {
    info.path = current->Path();
    info.approximate_size = current->ApproximateSize();
    info.index = current->Index();
    info.active = true;
  }
  return info;
}

Status RotatingWriter::Seal()
{
  std::lock_guard<std::mutex> rotation(rotate_mutex_);

  std::shared_ptr<ISegmentWriter> last;
  {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    if (sealed_.exchange(true, std::memory_order_acq_rel))
    {
      return Status::Ok();
    }
    last = std::move(active_);
  }

  if (!last)
  {
    return Status::Ok();
  }

  Status st = last->Close();
  if (!st.ok())
  {
    LOG_ERROR("closing active segment {} failed: {}", last->Path(), st.ToString());
    retired_.Add(std::move(last));
    return st;
  }
  LOG_INFO("sealed diagnostics output at {} ({} bytes)", last->Path(), last->ApproximateSize());
  return Status::Ok();
}

bool RotatingWriter::HasActive() const { return Snapshot() != nullptr; }

}  // namespace diag_sink
