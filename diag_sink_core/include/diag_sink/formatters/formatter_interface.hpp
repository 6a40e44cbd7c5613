#pragma once
#include <cstddef>

#include "../log_entry.hpp"

namespace diag_sink
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;

  // Writes at most buf_size - 1 bytes plus a terminating NUL; returns the length.
  virtual size_t Format(const LogEntry& entry, char* buf, size_t buf_size) = 0;
};

}  // namespace diag_sink
