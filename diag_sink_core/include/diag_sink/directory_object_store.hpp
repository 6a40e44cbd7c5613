#pragma once
#include <atomic>
#include <memory>
#include <string>

#include "object_store.hpp"

namespace diag_sink
{

// Object store backed by a directory tree: <root>/<container>/<object name>.
// Object names may contain '/', which map to sub-directories.
class DirectoryObjectStore : public IObjectStore
{
 public:
  DirectoryObjectStore(std::string root, std::string container);

  // Accepts "file:///abs/path", "file://rel/path" or a plain path.
  static std::unique_ptr<DirectoryObjectStore> FromConfig(const StoreConfig& config,
                                                          Status* status);
  static ObjectStoreFactory Factory(StoreConfig config);

  Status CreateContainerIfNotExists() override;
  Status Put(const std::string& object_name, const std::string& local_path,
             bool overwrite) override;

  std::string ObjectPath(const std::string& object_name) const;
  bool Exists(const std::string& object_name) const;

 private:
  std::string container_dir_;
  std::atomic<uint64_t> temp_counter_{0};

  static bool ValidName(const std::string& object_name);
  static Status MakeDirs(const std::string& path);
  Status CopyInto(const std::string& src, const std::string& dst);
};

}  // namespace diag_sink
