#include "diag_sink/diagnostic_listener.hpp"

#include <exception>

#include <fmt/format.h>

#include "diag_sink/logger.hpp"

namespace diag_sink
{

namespace
{

MonitorOptions MonitorOptionsFrom(const SinkConfig& config)
{
  return MonitorOptions{config.max_segment_bytes, config.check_interval,
                        config.EffectiveReclaimInterval()};
}

}  // namespace

std::unique_ptr<DiagnosticListener> DiagnosticListener::Create(SinkConfig config,
                                                               ObjectStoreFactory store_factory,
                                                               Status* status,
                                                               SegmentFactory segment_factory)
{
  Status valid = config.Validate();
  if (!valid.ok())
  {
    LOG_ERROR("invalid diagnostics configuration: {}", valid.ToString());
    if (status) *status = valid;
    return nullptr;
  }
  if (status) *status = Status::Ok();
  return std::unique_ptr<DiagnosticListener>(new DiagnosticListener(
      std::move(config), std::move(store_factory), std::move(segment_factory)));
}

DiagnosticListener::DiagnosticListener(SinkConfig config, ObjectStoreFactory store_factory,
                                       SegmentFactory segment_factory)
    : config_(std::move(config)),
      writer_(SegmentLayout(config_.directory, config_.base_name), std::move(segment_factory)),
      monitor_(writer_, MonitorOptionsFrom(config_)),
      coordinator_(writer_, std::move(store_factory),
                   UploadOptions{config_.host_id, config_.key_prefix})
{
}

DiagnosticListener::~DiagnosticListener()
{
  Detach();
  Stop();
}

void DiagnosticListener::Attach(EventSource& source)
{
  Detach();
  source.Subscribe(this);
  source_ = &source;
  LOG_DEBUG("listening to event source '{}'", source.Name());
}

void DiagnosticListener::Detach()
{
  if (source_)
  {
    source_->Unsubscribe(this);
    source_ = nullptr;
  }
}

Status DiagnosticListener::Start() { return monitor_.Start(); }

void DiagnosticListener::Stop() { monitor_.Stop(); }

std::string DiagnosticListener::FormatLine(std::string_view first, std::string_view second)
{
  std::string line = fmt::format("{} ; {}", first, second);
  for (char& c : line)
  {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return line;
}

void DiagnosticListener::OnEventWritten(const EventRecord& record)
{
  try
  {
    const std::string* first = record.ValueAt(config_.first_column);
    const std::string* second = record.ValueAt(config_.second_column);
    if (!first || !second)
    {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      LOG_EVERY_N(Warn, 1000, "event {} from '{}' has {} payload field(s), need columns {} and {}",
                  record.event_id, record.source, record.payload.size(), config_.first_column,
                  config_.second_column);
      return;
    }

    Status st = writer_.Append(FormatLine(*first, *second));
    if (st.ok())
    {
      written_.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    dropped_.fetch_add(1, std::memory_order_relaxed);
    if (st.code() == ErrorCode::Sealed)
    {
      LOG_ONCE(Debug, "event received after diagnostics were flushed, dropping");
    }
    else
    {
      LOG_EVERY_N(Error, 1000, "failed to write diagnostic record: {}", st.ToString());
    }
  }
  catch (const std::exception& e)
  {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    LOG_EVERY_N(Error, 1000, "exception while writing diagnostic record: {}", e.what());
  }
}

Status DiagnosticListener::Flush() { return coordinator_.Flush(); }

UploadReport DiagnosticListener::UploadDiagnostics()
{
  LOG_INFO("uploading diagnostics");
  Status flushed = coordinator_.Flush();
  LOG_WARN_IF(!flushed.ok(), "diagnostics flush incomplete: {}", flushed.ToString());

  UploadReport report = coordinator_.UploadAll();
  LOG_INFO("diagnostics: {} record(s) written, {} dropped, {} file(s) uploaded, {} failed",
           WrittenCount(), DroppedCount(), report.succeeded.size(), report.failed.size());
  return report;
}

}  // namespace diag_sink
