#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "retired_writer_set.hpp"
#include "segment.hpp"
#include "segment_layout.hpp"
#include "status.hpp"

namespace diag_sink
{

struct SegmentInfo
{
  std::string path;
  uint64_t approximate_size = 0;
  uint32_t index = 0;
  bool active = false;  // false when no segment could be opened
};

// Owns the active segment handle shared by all producer threads.
//
// The handle lock is held only to copy or swap the shared_ptr; the write
// itself runs under the segment's own mutex. An append that picked up a
// segment just before it was retired finishes there, and one that finds it
// already closed moves on to the current segment. Rotation therefore never
// waits for producers beyond the pointer swap.
class RotatingWriter
{
 public:
  explicit RotatingWriter(SegmentLayout layout, SegmentFactory factory = DefaultSegmentFactory());

  RotatingWriter(const RotatingWriter&) = delete;
  RotatingWriter& operator=(const RotatingWriter&) = delete;

  // Thread-safe. Errors: Closed (no active segment), Sealed, WriteFailed.
  Status Append(std::string_view record);

  // Opens the next segment, publishes it, retires the previous one. On
  // failure the current segment stays active and the index is not consumed.
  // Only a swap that retires a previous segment counts as a rotation.
  Status Rotate(SegmentInfo* opened = nullptr);

  // Size is read without the per-segment append lock and may lag slightly.
  SegmentInfo CurrentSegmentInfo() const;

  // Ends the writing phase: closes the active segment and refuses further
  // appends and rotations. A segment whose close fails is moved to the
  // retired set so a later reclaim retries it.
  Status Seal();

  bool IsSealed() const { return sealed_.load(std::memory_order_acquire); }
  bool HasActive() const;
  uint32_t RotationCount() const { return rotation_count_.load(std::memory_order_relaxed); }

  RetiredWriterSet& Retired() { return retired_; }
  const SegmentLayout& Layout() const { return layout_; }

 private:
  std::shared_ptr<ISegmentWriter> OpenSegment(uint32_t index, Status* status);

  SegmentLayout layout_;
  SegmentFactory factory_;
  RetiredWriterSet retired_;

  std::mutex rotate_mutex_;  // serializes Rotate/Seal
  uint32_t next_index_ = 0;

  std::shared_ptr<ISegmentWriter> Snapshot() const;

  mutable std::mutex handle_mutex_;
  std::shared_ptr<ISegmentWriter> active_;

  std::atomic<bool> sealed_{false};
  std::atomic<uint32_t> rotation_count_{0};
};

}  // namespace diag_sink
