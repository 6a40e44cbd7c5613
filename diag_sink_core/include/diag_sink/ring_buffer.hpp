#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "platform.hpp"

namespace diag_sink
{

// Bounded multi-producer / single-consumer queue. Every slot carries a
// sequence stamp: stamp == pos means free for the producer claiming pos,
// stamp == pos + 1 means filled and ready for the consumer.
template <typename T, size_t Capacity>
class MpscRing
{
  static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");
  static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

 public:
  MpscRing()
  {
    for (uint32_t i = 0; i < Capacity; ++i)
    {
      cells_[i].stamp.store(i, std::memory_order_relaxed);
    }
  }

  MpscRing(const MpscRing&) = delete;
  MpscRing& operator=(const MpscRing&) = delete;

  // Safe from any number of threads. Returns false when the ring is full.
  bool TryPush(const T& item)
  {
    uint32_t pos = head_.load(std::memory_order_relaxed);
    for (;;)
    {
      Cell& cell = cells_[pos & kMask];
      uint32_t stamp = cell.stamp.load(std::memory_order_acquire);
      int32_t diff = static_cast<int32_t>(stamp - pos);
      if (diff == 0)
      {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed,
                                        std::memory_order_relaxed))
        {
          cell.value = item;
          cell.stamp.store(pos + 1, std::memory_order_release);
          return true;
        }
      }
      else if (diff < 0)
      {
        return false;
      }
      else
      {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer thread only.
  bool TryPop(T& out)
  {
    Cell& cell = cells_[tail_ & kMask];
    if (cell.stamp.load(std::memory_order_acquire) != tail_ + 1)
    {
      return false;
    }
    out = cell.value;
    cell.stamp.store(tail_ + static_cast<uint32_t>(Capacity), std::memory_order_release);
    ++tail_;
    return true;
  }

  bool Empty() const
  {
    const Cell& cell = cells_[tail_ & kMask];
    return cell.stamp.load(std::memory_order_acquire) != tail_ + 1;
  }

  static constexpr size_t GetCapacity() { return Capacity; }

 private:
  static constexpr uint32_t kMask = static_cast<uint32_t>(Capacity - 1);

  struct alignas(DIAG_SINK_CACHELINE_SIZE) Cell
  {
    std::atomic<uint32_t> stamp;
    T value;
  };

  Cell cells_[Capacity];
  alignas(DIAG_SINK_CACHELINE_SIZE) std::atomic<uint32_t> head_{0};
  alignas(DIAG_SINK_CACHELINE_SIZE) uint32_t tail_ = 0;
};

}  // namespace diag_sink
