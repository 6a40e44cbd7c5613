#include "diag_sink/status.hpp"

#include <fmt/format.h>

#include <cstring>

namespace diag_sink
{

std::string_view ToString(ErrorCode code)
{
  switch (code)
  {
    case ErrorCode::Ok:
      return "Ok";
    case ErrorCode::OpenFailed:
      return "OpenFailed";
    case ErrorCode::WriteFailed:
      return "WriteFailed";
    case ErrorCode::SyncFailed:
      return "SyncFailed";
    case ErrorCode::CloseFailed:
      return "CloseFailed";
    case ErrorCode::Closed:
      return "Closed";
    case ErrorCode::Sealed:
      return "Sealed";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::StoreUnavailable:
      return "StoreUnavailable";
    case ErrorCode::UploadFailed:
      return "UploadFailed";
    case ErrorCode::StartFailed:
      return "StartFailed";
  }
  return "Unknown";
}

Status::Status(ErrorCode code, int sys_errno, std::string message)
    : code_(code), sys_errno_(sys_errno), message_(std::move(message))
{
}

Status Status::Error(ErrorCode code, std::string message)
{
  return Status(code, 0, std::move(message));
}

Status Status::FromErrno(ErrorCode code, std::string_view context, int err)
{
  return Status(code, err, fmt::format("{}: {}", context, std::strerror(err)));
}

std::string Status::ToString() const
{
  if (ok()) return "Ok";
  return fmt::format("{} ({})", diag_sink::ToString(code_), message_);
}

}  // namespace diag_sink
