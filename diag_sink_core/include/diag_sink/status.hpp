#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace diag_sink
{

enum class ErrorCode : uint8_t
{
  Ok = 0,
  OpenFailed,
  WriteFailed,
  SyncFailed,
  CloseFailed,
  Closed,
  Sealed,
  NotFound,
  AlreadyExists,
  InvalidArgument,
  StoreUnavailable,
  UploadFailed,
  StartFailed
};

std::string_view ToString(ErrorCode code);

// Outcome of one unit of work (an append, a rotation, a close, an upload).
// Failures are values; nothing in the sink throws across these boundaries.
class Status
{
 public:
  Status() = default;

  static Status Ok() { return Status(); }
  static Status Error(ErrorCode code, std::string message);
  // Captures errno (or the given error number) and appends strerror text.
  static Status FromErrno(ErrorCode code, std::string_view context, int err);

  bool ok() const { return code_ == ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  int sys_errno() const { return sys_errno_; }
  const std::string& message() const { return message_; }

  std::string ToString() const;

 private:
  Status(ErrorCode code, int sys_errno, std::string message);

  ErrorCode code_ = ErrorCode::Ok;
  int sys_errno_ = 0;
  std::string message_;
};

}  // namespace diag_sink
