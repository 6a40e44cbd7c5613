#include "diag_sink/sink_config.hpp"

namespace diag_sink
{

Status SinkConfig::Validate() const
{
  if (base_name.empty() || base_name.find('/') != std::string::npos)
  {
    return Status::Error(ErrorCode::InvalidArgument, "base_name must be a plain file name");
  }
  if (max_segment_bytes == 0)
  {
    return Status::Error(ErrorCode::InvalidArgument, "max_segment_bytes must be positive");
  }
  if (check_interval.count() <= 0)
  {
    return Status::Error(ErrorCode::InvalidArgument, "check_interval must be positive");
  }
  if (reclaim_interval.count() < 0)
  {
    return Status::Error(ErrorCode::InvalidArgument, "reclaim_interval must not be negative");
  }
  if (first_column == second_column)
  {
    return Status::Error(ErrorCode::InvalidArgument, "payload columns must differ");
  }
  return Status::Ok();
}

}  // namespace diag_sink
