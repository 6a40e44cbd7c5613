#include "diag_sink/segment_layout.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>

#include <fmt/format.h>

namespace diag_sink
{

SegmentLayout::SegmentLayout(std::string directory, std::string base_name)
    : directory_(directory.empty() ? std::string(".") : std::move(directory)),
      base_name_(std::move(base_name))
{
}

std::string SegmentLayout::FileName(uint32_t index) const
{
  if (index == 0)
  {
    return base_name_;
  }
  return fmt::format("{}-{}", base_name_, index - 1);
}

std::string SegmentLayout::PathFor(uint32_t index) const
{
  std::string result = directory_;
  if (result.back() != '/')
  {
    result += '/';
  }
  result += FileName(index);
  return result;
}

std::optional<uint32_t> SegmentLayout::ParseIndex(std::string_view file_name) const
{
  if (file_name == base_name_)
  {
    return 0u;
  }
  if (file_name.size() <= base_name_.size() + 1 ||
      file_name.compare(0, base_name_.size(), base_name_) != 0 ||
      file_name[base_name_.size()] != '-')
  {
    return std::nullopt;
  }

  std::string_view digits = file_name.substr(base_name_.size() + 1);
  if (digits.size() > 1 && digits[0] == '0')
  {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (char c : digits)
  {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
    if (value >= UINT32_MAX) return std::nullopt;
  }
  return static_cast<uint32_t>(value + 1);
}

std::vector<SegmentPath> SegmentLayout::List(Status* status) const
{
  std::vector<SegmentPath> result;

  DIR* dir = ::opendir(directory_.c_str());
  if (!dir)
  {
    int err = errno;
    if (status) *status = Status::FromErrno(ErrorCode::NotFound, "opendir '" + directory_ + "'", err);
    return result;
  }

  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr)
  {
    auto index = ParseIndex(ent->d_name);
    if (!index)
    {
      continue;
    }
    std::string full_path = PathFor(*index);
    struct stat st{};
    if (::stat(full_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
      continue;
    }
    result.push_back({*index, std::move(full_path)});
  }
  ::closedir(dir);

  std::sort(result.begin(), result.end(),
            [](const SegmentPath& a, const SegmentPath& b) { return a.index < b.index; });
  if (status) *status = Status::Ok();
  return result;
}

std::string MakeRemoteObjectName(std::string_view host_id, std::string_view prefix,
                                 uint32_t index)
{
  while (!prefix.empty() && prefix.back() == '/')
  {
    prefix.remove_suffix(1);
  }
  if (prefix.empty())
  {
    return fmt::format("{}-{}-{}.out", host_id, host_id, index);
  }
  return fmt::format("{}/{}-{}-{}.out", prefix, host_id, host_id, index);
}

std::string LocalHostId()
{
  char name[256] = {};
  if (::gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0')
  {
    return "localhost";
  }
  return name;
}

}  // namespace diag_sink
