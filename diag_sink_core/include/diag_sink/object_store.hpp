#pragma once
#include <functional>
#include <memory>
#include <string>

#include "platform.hpp"
#include "status.hpp"

namespace diag_sink
{

struct StoreConfig
{
  std::string connection_string;
  std::string container = DIAG_SINK_DEFAULT_CONTAINER;
};

// Remote destination for finished segments.
class IObjectStore
{
 public:
  virtual ~IObjectStore() = default;

  virtual Status CreateContainerIfNotExists() = 0;

  // Uploads the file at local_path as object_name. With overwrite == true an
  // existing object is replaced, so repeating an upload is harmless.
  virtual Status Put(const std::string& object_name, const std::string& local_path,
                     bool overwrite) = 0;
};

// Builds the store on first use; may return nullptr with *status set.
using ObjectStoreFactory = std::function<std::unique_ptr<IObjectStore>(Status* status)>;

}  // namespace diag_sink
