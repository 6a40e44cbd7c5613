#include "diag_sink/directory_object_store.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>

#include <fmt/format.h>

#include "diag_sink/logger.hpp"

namespace diag_sink
{

namespace
{

class Fd
{
 public:
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd()
  {
    if (fd_ >= 0) ::close(fd_);
  }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int get() const { return fd_; }
  int release()
  {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

std::string JoinPath(const std::string& dir, const std::string& name)
{
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

}  // namespace

DirectoryObjectStore::DirectoryObjectStore(std::string root, std::string container)
    : container_dir_(JoinPath(root.empty() ? std::string(".") : root, container))
{
}

std::unique_ptr<DirectoryObjectStore> DirectoryObjectStore::FromConfig(const StoreConfig& config,
                                                                       Status* status)
{
  std::string root = config.connection_string;
  constexpr std::string_view kScheme = "file://";
  if (root.compare(0, kScheme.size(), kScheme) == 0)
  {
    root.erase(0, kScheme.size());
  }
  if (root.empty())
  {
    if (status)
    {
      *status = Status::Error(ErrorCode::StoreUnavailable, "no storage connection configured");
    }
    return nullptr;
  }
  if (config.container.empty() || config.container.find('/') != std::string::npos)
  {
    if (status)
    {
      *status = Status::Error(ErrorCode::InvalidArgument,
                              "invalid container name '" + config.container + "'");
    }
    return nullptr;
  }
  if (status) *status = Status::Ok();
  return std::make_unique<DirectoryObjectStore>(root, config.container);
}

ObjectStoreFactory DirectoryObjectStore::Factory(StoreConfig config)
{
  return [config = std::move(config)](Status* status) -> std::unique_ptr<IObjectStore>
  { return FromConfig(config, status); };
}

Status DirectoryObjectStore::MakeDirs(const std::string& path)
{
  std::string partial;
  for (size_t i = 0; i < path.size(); ++i)
  {
    partial += path[i];
    if (path[i] != '/' && i != path.size() - 1) continue;
    if (partial == "/") continue;
    if (::mkdir(partial.c_str(), 0755) != 0)
    {
      int err = errno;
      if (err == EEXIST) continue;
      return Status::FromErrno(ErrorCode::StoreUnavailable, "mkdir '" + partial + "'", err);
    }
  }
  return Status::Ok();
}

Status DirectoryObjectStore::CreateContainerIfNotExists()
{
  Status st = MakeDirs(container_dir_);
  if (st.ok())
  {
    LOG_DEBUG("object store container ready at {}", container_dir_);
  }
  return st;
}

bool DirectoryObjectStore::ValidName(const std::string& object_name)
{
  if (object_name.empty() || object_name.front() == '/' || object_name.back() == '/')
  {
    return false;
  }
  size_t start = 0;
  while (start <= object_name.size())
  {
    size_t end = object_name.find('/', start);
    if (end == std::string::npos) end = object_name.size();
    std::string part = object_name.substr(start, end - start);
    if (part.empty() || part == "." || part == "..") return false;
    start = end + 1;
  }
  return true;
}

std::string DirectoryObjectStore::ObjectPath(const std::string& object_name) const
{
  return JoinPath(container_dir_, object_name);
}

bool DirectoryObjectStore::Exists(const std::string& object_name) const
{
  struct stat st{};
  return ::stat(ObjectPath(object_name).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Status DirectoryObjectStore::CopyInto(const std::string& src, const std::string& dst)
{
  Fd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0)
  {
    int err = errno;
    ErrorCode code = (err == ENOENT) ? ErrorCode::NotFound : ErrorCode::UploadFailed;
    return Status::FromErrno(code, "open '" + src + "'", err);
  }

  std::string tmp = fmt::format("{}.part-{}-{}", dst, ::getpid(),
                                temp_counter_.fetch_add(1, std::memory_order_relaxed));
  Fd out(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (out.get() < 0)
  {
    int err = errno;
    return Status::FromErrno(ErrorCode::UploadFailed, "create '" + tmp + "'", err);
  }

  auto fail = [&](std::string_view what, int err)
  {
    ::unlink(tmp.c_str());
    return Status::FromErrno(ErrorCode::UploadFailed, what, err);
  };

  char buf[64 * 1024];
  for (;;)
  {
    ssize_t n = ::read(in.get(), buf, sizeof(buf));
    if (n == 0) break;
    if (n < 0)
    {
      int err = errno;
      if (err == EINTR) continue;
      return fail("read '" + src + "'", err);
    }
    const char* p = buf;
    size_t left = static_cast<size_t>(n);
    while (left > 0)
    {
      ssize_t w = ::write(out.get(), p, left);
      if (w < 0)
      {
        int err = errno;
        if (err == EINTR) continue;
        return fail("write '" + tmp + "'", err);
      }
      p += w;
      left -= static_cast<size_t>(w);
    }
  }

  if (::fsync(out.get()) != 0)
  {
    int err = errno;
    return fail("fsync '" + tmp + "'", err);
  }
  if (::close(out.release()) != 0)
  {
    int err = errno;
    return fail("close '" + tmp + "'", err);
  }
  if (::rename(tmp.c_str(), dst.c_str()) != 0)
  {
    int err = errno;
    return fail("rename '" + tmp + "'", err);
  }
  return Status::Ok();
}

Status DirectoryObjectStore::Put(const std::string& object_name, const std::string& local_path,
                                 bool overwrite)
{
  if (!ValidName(object_name))
  {
    return Status::Error(ErrorCode::InvalidArgument, "invalid object name '" + object_name + "'");
  }

  std::string dst = ObjectPath(object_name);
  size_t slash = dst.rfind('/');
  if (slash != std::string::npos && slash > 0)
  {
    Status st = MakeDirs(dst.substr(0, slash));
    if (!st.ok()) return st;
  }

  if (!overwrite && Exists(object_name))
  {
    return Status::Error(ErrorCode::AlreadyExists, "object '" + object_name + "' already exists");
  }

  return CopyInto(local_path, dst);
}

}  // namespace diag_sink
