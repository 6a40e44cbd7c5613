#include "diag_sink/segment.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

namespace diag_sink
{

std::shared_ptr<SegmentFile> SegmentFile::Open(const std::string& path, uint32_t index,
                                               OpenMode mode, Status* status)
{
  int flags = O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
  if (mode == OpenMode::Truncate)
  {
    flags |= O_TRUNC;
  }

  int fd = ::open(path.c_str(), flags, 0644);
  if (fd < 0)
  {
    int err = errno;
    if (status) *status = Status::FromErrno(ErrorCode::OpenFailed, "open '" + path + "'", err);
    return nullptr;
  }

  uint64_t initial_size = 0;
  struct stat st{};
  if (::fstat(fd, &st) == 0)
  {
    initial_size = static_cast<uint64_t>(st.st_size);
  }

  if (status) *status = Status::Ok();
  return std::shared_ptr<SegmentFile>(new SegmentFile(path, index, fd, initial_size));
}

SegmentFile::SegmentFile(std::string path, uint32_t index, int fd, uint64_t initial_size)
    : path_(std::move(path)), index_(index), fd_(fd), size_(initial_size)
{
}

SegmentFile::~SegmentFile()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

Status SegmentFile::Append(std::string_view record)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return Status::Error(ErrorCode::Closed, "segment '" + path_ + "' is closed");
  }

  line_buf_.assign(record.data(), record.size());
  line_buf_.push_back('\n');

  const uint64_t start = size_.load(std::memory_order_relaxed);
  const char* p = line_buf_.data();
  size_t remaining = line_buf_.size();
  while (remaining > 0)
  {
    ssize_t n = ::write(fd_, p, remaining);
    if (n < 0)
    {
      int err = errno;
      if (err == EINTR) continue;
      DiscardPartial(start);
      return Status::FromErrno(ErrorCode::WriteFailed, "write '" + path_ + "'", err);
    }
    p += n;
    remaining -= static_cast<size_t>(n);
    size_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
  }
  return Status::Ok();
}

void SegmentFile::DiscardPartial(uint64_t start)
{
  uint64_t now = size_.load(std::memory_order_relaxed);
  if (now == start)
  {
    return;
  }
  if (::ftruncate(fd_, static_cast<off_t>(start)) == 0)
  {
    size_.store(start, std::memory_order_relaxed);
    return;
  }
  // Cannot cut the fragment off; terminate it so the next record starts on
  // its own line.
  if (::write(fd_, "\n", 1) == 1)
  {
    size_.fetch_add(1, std::memory_order_relaxed);
  }
}

Status SegmentFile::Close()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0)
  {
    return Status::Ok();
  }

  if (::fdatasync(fd_) != 0)
  {
    int err = errno;
    if (err != EINVAL)
    {
      // Still open; the next reclaim pass retries.
      return Status::FromErrno(ErrorCode::SyncFailed, "fdatasync '" + path_ + "'", err);
    }
  }

  int rc = ::close(fd_);
  int err = errno;
  fd_ = -1;
  closed_.store(true, std::memory_order_release);
  if (rc != 0 && err != EINTR)
  {
    return Status::FromErrno(ErrorCode::CloseFailed, "close '" + path_ + "'", err);
  }
  return Status::Ok();
}

SegmentFactory DefaultSegmentFactory()
{
  return [](const std::string& path, uint32_t index, Status* status)
  {
    OpenMode mode = (index == 0) ? OpenMode::Append : OpenMode::Truncate;
    return std::shared_ptr<ISegmentWriter>(SegmentFile::Open(path, index, mode, status));
  };
}

}  // namespace diag_sink
