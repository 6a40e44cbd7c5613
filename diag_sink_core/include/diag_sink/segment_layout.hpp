#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "status.hpp"

namespace diag_sink
{

struct SegmentPath
{
  uint32_t index;
  std::string path;
};

// Naming rules for local segments:
//   index 0       -> <dir>/<base>
//   index n (n>0) -> <dir>/<base>-<n-1>
class SegmentLayout
{
 public:
  SegmentLayout(std::string directory, std::string base_name);

  std::string FileName(uint32_t index) const;
  std::string PathFor(uint32_t index) const;

  // Inverse of FileName; nullopt for names that are not segments of this layout.
  std::optional<uint32_t> ParseIndex(std::string_view file_name) const;

  // Segment files present in the directory, ascending by index.
  std::vector<SegmentPath> List(Status* status = nullptr) const;

  const std::string& Directory() const { return directory_; }
  const std::string& BaseName() const { return base_name_; }

 private:
  std::string directory_;
  std::string base_name_;
};

// [<prefix>/]<host>-<host>-<index>.out
std::string MakeRemoteObjectName(std::string_view host_id, std::string_view prefix,
                                 uint32_t index);

// Machine host name, "localhost" when it cannot be determined.
std::string LocalHostId();

}  // namespace diag_sink
