#include <diag_sink/diagnostic_listener.hpp>
#include <diag_sink/directory_object_store.hpp>
#include <diag_sink/formatters/pattern_formatter.hpp>
#include <diag_sink/logger.hpp>
#include <diag_sink/sinks/console_sink.hpp>

#include <fmt/format.h>

#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

// Simulated storage benchmark: worker threads emit latency events, the
// diagnostic listener captures them into rotating files, and at the end the
// files are uploaded to a directory-backed object store.
//
//   benchmark_listener [work_dir] [store_root]
int main(int argc, char** argv)
{
  std::string work_dir = argc > 1 ? argv[1] : "/tmp/diag_sink_example";
  std::string store_root = argc > 2 ? argv[2] : work_dir + "/store";
  std::string local_dir = work_dir + "/local";

  auto& logger = diag_sink::Logger::Instance();
  auto console = std::make_unique<diag_sink::ConsoleLogSink>();
  console->SetFormatter(
      std::make_unique<diag_sink::PatternFormatter>("[%D %T.%e] [%L] [tid:%t] %m"));
  logger.AddSink(std::move(console));
  logger.SetLevel(diag_sink::LogLevel::Info);
  logger.Start();

  for (const std::string& dir : {work_dir, local_dir})
  {
    if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST)
    {
      int err = errno;
      LOG_FATAL("cannot create {}: {}", dir, std::strerror(err));
      logger.Stop();
      return 1;
    }
  }

  diag_sink::SinkConfig config;
  config.directory = local_dir;
  config.max_segment_bytes = 256 * 1024;
  config.check_interval = std::chrono::milliseconds(50);
  config.key_prefix = "example-run";
  config.store = diag_sink::StoreConfig{"file://" + store_root, DIAG_SINK_DEFAULT_CONTAINER};

  diag_sink::Status status;
  auto listener = diag_sink::DiagnosticListener::Create(
      config, diag_sink::DirectoryObjectStore::Factory(config.store), &status);
  if (!listener)
  {
    LOG_FATAL("cannot create diagnostic listener: {}", status.ToString());
    logger.Stop();
    return 1;
  }

  diag_sink::EventSource source("Storage-Benchmark");
  listener->Attach(source);
  status = listener->Start();
  if (!status.ok())
  {
    LOG_FATAL("cannot start rotation monitor: {}", status.ToString());
    logger.Stop();
    return 1;
  }

  constexpr int kWorkers = 8;
  constexpr int kOpsPerWorker = 20000;
  std::vector<std::thread> workers;
  for (int w = 0; w < kWorkers; ++w)
  {
    workers.emplace_back(
        [&source, w]()
        {
          std::mt19937 rng(static_cast<uint32_t>(w));
          std::lognormal_distribution<double> latency_ms(1.0, 0.6);
          for (int i = 0; i < kOpsPerWorker; ++i)
          {
            diag_sink::EventRecord record;
            record.source = source.Name();
            record.event_id = 1;
            record.payload = {{"worker", std::to_string(w)},
                              {"operation", (i % 4 == 0) ? "upload" : "download"},
                              {"latency_ms", fmt::format("{:.3f}", latency_ms(rng))},
                              {"detail", fmt::format("{{\"blob\":\"blob-{}-{}\",\"size\":4096}}", w, i)}};
            source.Emit(record);
          }
        });
  }
  for (auto& t : workers) t.join();

  diag_sink::UploadReport report = listener->UploadDiagnostics();
  listener->Stop();

  std::printf("records written: %llu, dropped: %llu\n",
              static_cast<unsigned long long>(listener->WrittenCount()),
              static_cast<unsigned long long>(listener->DroppedCount()));
  std::printf("uploaded %zu file(s) to %s/%s:\n", report.succeeded.size(), store_root.c_str(),
              DIAG_SINK_DEFAULT_CONTAINER);
  for (const auto& name : report.succeeded)
  {
    std::printf("  ok      %s\n", name.c_str());
  }
  for (const auto& failure : report.failed)
  {
    std::printf("  FAILED  %s -> %s: %s\n", failure.path.c_str(), failure.object_name.c_str(),
                failure.error.ToString().c_str());
  }

  logger.Stop();
  return report.AllSucceeded() ? 0 : 2;
}
