#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "object_store.hpp"
#include "rotating_writer.hpp"
#include "status.hpp"

namespace diag_sink
{

enum class SinkState : uint8_t
{
  Recording,
  Draining,
  Uploaded
};

std::string_view ToString(SinkState state);

struct UploadFailure
{
  std::string path;
  std::string object_name;
  Status error;
};

struct UploadReport
{
  std::vector<std::string> succeeded;  // object names
  std::vector<UploadFailure> failed;

  bool AllSucceeded() const { return failed.empty(); }
  size_t Attempted() const { return succeeded.size() + failed.size(); }
};

struct UploadOptions
{
  std::string host_id;
  std::string key_prefix;
};

// End-of-run handoff: drains every writer, then ships each local segment to
// the object store. One failed file never stops the rest of the batch.
class UploadCoordinator
{
 public:
  UploadCoordinator(RotatingWriter& writer, ObjectStoreFactory store_factory,
                    UploadOptions options);

  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  // Recording -> Draining. Closes retired writers, then the active one.
  // Returns the first close error, if any; the state changes regardless.
  Status Flush();

  // Draining -> Uploaded. Flushes first (with a warning) when still
  // Recording. May be repeated to retry after a partial failure.
  UploadReport UploadAll();

  SinkState State() const { return state_.load(std::memory_order_acquire); }
  const UploadOptions& Options() const { return options_; }

 private:
  IObjectStore* AcquireStore(Status* status);

  RotatingWriter& writer_;
  ObjectStoreFactory store_factory_;
  UploadOptions options_;

  std::mutex mutex_;  // one Flush/UploadAll at a time
  std::unique_ptr<IObjectStore> store_;
  std::atomic<SinkState> state_{SinkState::Recording};
};

}  // namespace diag_sink
