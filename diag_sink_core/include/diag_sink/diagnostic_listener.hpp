#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "event_source.hpp"
#include "object_store.hpp"
#include "rotating_writer.hpp"
#include "rotation_monitor.hpp"
#include "segment.hpp"
#include "sink_config.hpp"
#include "status.hpp"
#include "upload_coordinator.hpp"

namespace diag_sink
{

// Captures benchmark latency events into rotating local segments and ships
// them to the object store at the end of the run.
//
//   auto listener = DiagnosticListener::Create(config, store_factory, &status);
//   listener->Attach(source);
//   listener->Start();
//   ... benchmark runs, threads call source.Emit(...) ...
//   UploadReport report = listener->UploadDiagnostics();
class DiagnosticListener : public IEventListener
{
 public:
  // Returns nullptr and sets *status when the configuration is invalid.
  static std::unique_ptr<DiagnosticListener> Create(SinkConfig config,
                                                    ObjectStoreFactory store_factory,
                                                    Status* status,
                                                    SegmentFactory segment_factory = {});

  ~DiagnosticListener() override;

  DiagnosticListener(const DiagnosticListener&) = delete;
  DiagnosticListener& operator=(const DiagnosticListener&) = delete;

  void Attach(EventSource& source);
  void Detach();

  // Starts / cancels the rotation monitor.
  Status Start();
  void Stop();

  // Never throws; a record that cannot be written is counted and dropped.
  void OnEventWritten(const EventRecord& record) override;

  Status Flush();
  UploadReport UploadDiagnostics();

  uint64_t WrittenCount() const { return written_.load(std::memory_order_relaxed); }
  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }
  SinkState State() const { return coordinator_.State(); }

  const SinkConfig& Config() const { return config_; }
  RotatingWriter& Writer() { return writer_; }
  RotationMonitor& Monitor() { return monitor_; }
  UploadCoordinator& Coordinator() { return coordinator_; }

  // "<first> ; <second>" with embedded line breaks flattened to spaces.
  static std::string FormatLine(std::string_view first, std::string_view second);

 private:
  DiagnosticListener(SinkConfig config, ObjectStoreFactory store_factory,
                     SegmentFactory segment_factory);

  SinkConfig config_;
  RotatingWriter writer_;
  RotationMonitor monitor_;
  UploadCoordinator coordinator_;

  EventSource* source_ = nullptr;
  std::atomic<uint64_t> written_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace diag_sink
