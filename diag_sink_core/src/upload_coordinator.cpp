#include "diag_sink/upload_coordinator.hpp"

#include <exception>

#include "diag_sink/logger.hpp"
#include "diag_sink/segment_layout.hpp"

namespace diag_sink
{

std::string_view ToString(SinkState state)
{
  switch (state)
  {
    case SinkState::Recording:
      return "Recording";
    case SinkState::Draining:
      return "Draining";
    case SinkState::Uploaded:
      return "Uploaded";
  }
  return "Unknown";
}

UploadCoordinator::UploadCoordinator(RotatingWriter& writer, ObjectStoreFactory store_factory,
                                     UploadOptions options)
    : writer_(writer), store_factory_(std::move(store_factory)), options_(std::move(options))
{
  if (options_.host_id.empty())
  {
    options_.host_id = LocalHostId();
  }
}

Status UploadCoordinator::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (state_.load(std::memory_order_acquire) == SinkState::Recording)
  {
    state_.store(SinkState::Draining, std::memory_order_release);
  }

  Status first_error;
  ReclaimResult before = writer_.Retired().ReclaimAll();
  if (before.failed > 0)
  {
    first_error = Status::Error(ErrorCode::CloseFailed,
                                std::to_string(before.failed) + " retired segment(s) failed to close");
  }

  Status sealed = writer_.Seal();
  if (!sealed.ok())
  {
    // The active segment went to the retired set; give it one more attempt.
    ReclaimResult after = writer_.Retired().ReclaimAll();
    if (after.failed > 0 && first_error.ok())
    {
      first_error = sealed;
    }
  }

  LOG_INFO("diagnostics flushed: {} retired segment(s) closed, {} pending",
           before.closed, writer_.Retired().Size());
  return first_error;
}

IObjectStore* UploadCoordinator::AcquireStore(Status* status)
{
  if (store_)
  {
    *status = Status::Ok();
    return store_.get();
  }
  if (!store_factory_)
  {
    *status = Status::Error(ErrorCode::StoreUnavailable, "no object store configured");
    return nullptr;
  }

  try
  {
    std::unique_ptr<IObjectStore> store = store_factory_(status);
    if (!store)
    {
      if (status->ok())
      {
        *status = Status::Error(ErrorCode::StoreUnavailable, "object store factory returned nothing");
      }
      return nullptr;
    }
    Status created = store->CreateContainerIfNotExists();
    if (!created.ok())
    {
      *status = created;
      return nullptr;
    }
    store_ = std::move(store);
  }
  catch (const std::exception& e)
  {
    *status = Status::Error(ErrorCode::StoreUnavailable, e.what());
    return nullptr;
  }
  *status = Status::Ok();
  return store_.get();
}

UploadReport UploadCoordinator::UploadAll()
{
  if (state_.load(std::memory_order_acquire) == SinkState::Recording)
  {
    LOG_WARN("upload requested while still recording, flushing first");
    Status flushed = Flush();
    LOG_WARN_IF(!flushed.ok(), "flush before upload incomplete: {}", flushed.ToString());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  UploadReport report;

  Status list_status;
  std::vector<SegmentPath> segments = writer_.Layout().List(&list_status);
  if (!list_status.ok())
  {
    LOG_ERROR("cannot enumerate diagnostics segments: {}", list_status.ToString());
  }
  LOG_INFO("uploading {} diagnostics file(s)", segments.size());

  Status store_status;
  IObjectStore* store = AcquireStore(&store_status);
  if (!store)
  {
    LOG_ERROR("object store unavailable: {}", store_status.ToString());
  }

  for (size_t i = 0; i < segments.size(); ++i)
  {
    const SegmentPath& segment = segments[i];
    std::string object_name =
        MakeRemoteObjectName(options_.host_id, options_.key_prefix, segment.index);

    Status st = store_status;
    if (store)
    {
      LOG_INFO("uploading {} of {}: {} -> {}", i + 1, segments.size(), segment.path, object_name);
      try
      {
        st = store->Put(object_name, segment.path, true);
      }
      catch (const std::exception& e)
      {
        st = Status::Error(ErrorCode::UploadFailed, e.what());
      }
    }

    if (st.ok())
    {
      report.succeeded.push_back(std::move(object_name));
    }
    else
    {
      LOG_ERROR("upload of {} failed: {}", segment.path, st.ToString());
      report.failed.push_back({segment.path, std::move(object_name), std::move(st)});
    }
  }

  state_.store(SinkState::Uploaded, std::memory_order_release);
  LOG_INFO("diagnostics upload finished: {} succeeded, {} failed", report.succeeded.size(),
           report.failed.size());
  return report;
}

}  // namespace diag_sink
