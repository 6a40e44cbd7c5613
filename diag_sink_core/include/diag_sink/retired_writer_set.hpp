#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "segment.hpp"

namespace diag_sink
{

struct ReclaimResult
{
  size_t closed = 0;
  size_t failed = 0;
};

// Writers that stopped being active but still hold an open file.
class RetiredWriterSet
{
 public:
  // Ignores null handles and handles already present.
  void Add(std::shared_ptr<ISegmentWriter> writer);

  // One close attempt per handle; closed handles leave the set, failed ones
  // stay for the next pass. The lock is held for the whole pass, so a
  // concurrent caller waits and then sees only what is still pending.
  ReclaimResult ReclaimAll();

  size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ISegmentWriter>> writers_;
};

}  // namespace diag_sink
