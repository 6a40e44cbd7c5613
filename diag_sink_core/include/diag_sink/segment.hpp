#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "status.hpp"

namespace diag_sink
{

// One append-only segment of the diagnostic output.
class ISegmentWriter
{
 public:
  virtual ~ISegmentWriter() = default;

  // Appends record + '\n' as one unit; concurrent callers are serialized.
  virtual Status Append(std::string_view record) = 0;

  // Flushes and releases the file. Closing a closed writer returns Ok.
  virtual Status Close() = 0;

  virtual bool IsClosed() const = 0;
  virtual const std::string& Path() const = 0;
  virtual uint32_t Index() const = 0;

  // Bytes on disk as last observed; readable without taking the append lock.
  virtual uint64_t ApproximateSize() const = 0;
};

enum class OpenMode : uint8_t
{
  Append,    // keep existing content (segment 0 of a restarted run)
  Truncate,  // start empty (every rotated segment)
};

class SegmentFile : public ISegmentWriter
{
 public:
  // Returns nullptr and fills *status when the file cannot be opened.
  static std::shared_ptr<SegmentFile> Open(const std::string& path, uint32_t index, OpenMode mode,
                                           Status* status);

  ~SegmentFile() override;

  SegmentFile(const SegmentFile&) = delete;
  SegmentFile& operator=(const SegmentFile&) = delete;

  Status Append(std::string_view record) override;
  Status Close() override;

  bool IsClosed() const override { return closed_.load(std::memory_order_acquire); }
  const std::string& Path() const override { return path_; }
  uint32_t Index() const override { return index_; }
  uint64_t ApproximateSize() const override { return size_.load(std::memory_order_relaxed); }

 private:
  SegmentFile(std::string path, uint32_t index, int fd, uint64_t initial_size);

  // Removes the bytes of a record whose write failed part way. Caller holds mutex_.
  void DiscardPartial(uint64_t start);

  std::string path_;
  uint32_t index_;

  std::mutex mutex_;
  int fd_;
  std::string line_buf_;
  std::atomic<uint64_t> size_;
  std::atomic<bool> closed_{false};
};

using SegmentFactory = std::function<std::shared_ptr<ISegmentWriter>(
    const std::string& path, uint32_t index, Status* status)>;

// Opens SegmentFile instances: index 0 in Append mode, later indices in Truncate mode.
SegmentFactory DefaultSegmentFactory();

}  // namespace diag_sink
