#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "object_store.hpp"
#include "platform.hpp"
#include "status.hpp"

namespace diag_sink
{

struct SinkConfig
{
  // Local segments
  std::string directory = ".";
  std::string base_name = DIAG_SINK_DEFAULT_BASE_NAME;
  uint64_t max_segment_bytes = DIAG_SINK_DEFAULT_MAX_SEGMENT_BYTES;

  // Monitor cadence; reclaim_interval of zero means "same as check_interval"
  std::chrono::milliseconds check_interval{DIAG_SINK_DEFAULT_CHECK_INTERVAL_MS};
  std::chrono::milliseconds reclaim_interval{0};

  // Remote naming
  std::string host_id;  // empty: machine host name
  std::string key_prefix;
  StoreConfig store;

  // Payload positions written as the two columns of each line
  size_t first_column = 2;
  size_t second_column = 3;

  std::chrono::milliseconds EffectiveReclaimInterval() const
  {
    return reclaim_interval.count() > 0 ? reclaim_interval : check_interval;
  }

  Status Validate() const;
};

}  // namespace diag_sink
