#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "diag_sink/diagnostic_listener.hpp"
#include "fakes/fake_object_store.hpp"
#include "fakes/fake_segment_writer.hpp"
#include "temp_dir.hpp"

using namespace std::chrono_literals;
using diag_sink::DiagnosticListener;
using diag_sink::ErrorCode;
using diag_sink::EventRecord;
using diag_sink::EventSource;
using diag_sink::SinkConfig;
using diag_sink::SinkState;
using diag_sink::Status;
using diag_sink::UploadReport;
using diag_sink::test::FakeSegmentFactory;
using diag_sink::test::FakeStoreFactory;
using diag_sink::test::FakeStoreState;
using diag_sink::test::ReadLines;
using diag_sink::test::TempDir;

namespace
{

// Positions 2 and 3 carry the values that end up in the output line.
EventRecord LatencyEvent(const std::string& latency, const std::string& detail)
{
  return EventRecord{"bench", 1, {{"thread", "0"}, {"op", "get"}, {"latency", latency}, {"detail", detail}}};
}

}  // namespace

class DiagnosticListenerTest : public ::testing::Test
{
 protected:
  TempDir dir_;
  std::shared_ptr<FakeStoreState> store_ = std::make_shared<FakeStoreState>();

  SinkConfig Config() const
  {
    SinkConfig config;
    config.directory = dir_.Path();
    config.base_name = "BenchmarkDiagnostics.out";
    config.host_id = "vm1";
    return config;
  }

  void SetUp() override { ASSERT_TRUE(dir_.Valid()); }
};

TEST(FormatLine, JoinsColumns)
{
  EXPECT_EQ(DiagnosticListener::FormatLine("a", "b"), "a ; b");
  EXPECT_EQ(DiagnosticListener::FormatLine("", ""), " ; ");
}

TEST(FormatLine, FlattensLineBreaks)
{
  EXPECT_EQ(DiagnosticListener::FormatLine("12\r\n", "x\ny"), "12   ; x y");
}

TEST_F(DiagnosticListenerTest, CreateRejectsInvalidConfig)
{
  SinkConfig config = Config();
  config.max_segment_bytes = 0;
  Status st;
  EXPECT_EQ(DiagnosticListener::Create(config, FakeStoreFactory(store_), &st), nullptr);
  EXPECT_EQ(st.code(), ErrorCode::InvalidArgument);
}

TEST_F(DiagnosticListenerTest, WritesSelectedColumns)
{
  Status st;
  auto listener = DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);
  EventSource source("bench");
  listener->Attach(source);

  source.Emit(LatencyEvent("12.5", "{\"blob\":\"b1\"}"));
  source.Emit(LatencyEvent("3", "ok"));
  ASSERT_TRUE(listener->Flush().ok());

  auto lines = ReadLines(dir_.Join("BenchmarkDiagnostics.out"));
  EXPECT_EQ(lines, (std::vector<std::string>{"12.5 ; {\"blob\":\"b1\"}", "3 ; ok"}));
  EXPECT_EQ(listener->WrittenCount(), 2u);
  EXPECT_EQ(listener->DroppedCount(), 0u);
}

TEST_F(DiagnosticListenerTest, CustomColumns)
{
  SinkConfig config = Config();
  config.first_column = 0;
  config.second_column = 1;
  Status st;
  auto listener = DiagnosticListener::Create(config, FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);

  listener->OnEventWritten(LatencyEvent("1", "2"));
  ASSERT_TRUE(listener->Flush().ok());
  EXPECT_EQ(ReadLines(dir_.Join("BenchmarkDiagnostics.out")), std::vector<std::string>{"0 ; get"});
}

TEST_F(DiagnosticListenerTest, ShortPayloadIsDropped)
{
  Status st;
  auto listener = DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);

  listener->OnEventWritten(EventRecord{"bench", 2, {{"a", "1"}, {"b", "2"}, {"c", "3"}}});
  EXPECT_EQ(listener->WrittenCount(), 0u);
  EXPECT_EQ(listener->DroppedCount(), 1u);
}

TEST_F(DiagnosticListenerTest, EventsAfterFlushAreDropped)
{
  Status st;
  auto listener = DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);

  listener->OnEventWritten(LatencyEvent("1", "before"));
  ASSERT_TRUE(listener->Flush().ok());
  EXPECT_EQ(listener->State(), SinkState::Draining);
  listener->OnEventWritten(LatencyEvent("2", "after"));

  EXPECT_EQ(listener->WrittenCount(), 1u);
  EXPECT_EQ(listener->DroppedCount(), 1u);
  EXPECT_EQ(ReadLines(dir_.Join("BenchmarkDiagnostics.out")),
            std::vector<std::string>{"1 ; before"});
}

TEST_F(DiagnosticListenerTest, WriteFailuresAreCountedNotThrown)
{
  FakeSegmentFactory segments;
  Status st;
  auto listener =
      DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st, segments.AsFactory());
  ASSERT_NE(listener, nullptr);
  segments.At(0)->fail_appends = true;

  EXPECT_NO_THROW(listener->OnEventWritten(LatencyEvent("1", "x")));
  EXPECT_EQ(listener->DroppedCount(), 1u);
}

TEST_F(DiagnosticListenerTest, DetachStopsCapture)
{
  Status st;
  auto listener = DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);
  EventSource source("bench");
  listener->Attach(source);
  EXPECT_EQ(source.ListenerCount(), 1u);
  listener->Detach();
  EXPECT_EQ(source.ListenerCount(), 0u);

  source.Emit(LatencyEvent("1", "x"));
  EXPECT_EQ(listener->WrittenCount(), 0u);
}

TEST_F(DiagnosticListenerTest, DestructionUnsubscribes)
{
  EventSource source("bench");
  {
    Status st;
    auto listener = DiagnosticListener::Create(Config(), FakeStoreFactory(store_), &st);
    ASSERT_NE(listener, nullptr);
    listener->Attach(source);
  }
  EXPECT_EQ(source.ListenerCount(), 0u);
}

TEST_F(DiagnosticListenerTest, EndToEndConcurrentRunWithRotation)
{
  SinkConfig config = Config();
  config.max_segment_bytes = 4096;
  config.check_interval = 2ms;
  Status st;
  auto listener = DiagnosticListener::Create(config, FakeStoreFactory(store_), &st);
  ASSERT_NE(listener, nullptr);
  EventSource source("bench");
  listener->Attach(source);
  ASSERT_TRUE(listener->Start().ok());

  constexpr int kThreads = 8;
  constexpr int kPerThread = 1500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
        [&, t]()
        {
          for (int i = 0; i < kPerThread; ++i)
          {
            source.Emit(LatencyEvent(fmt::format("{}.{}", t, i), "payload-" + std::to_string(t)));
            if (i % 100 == 0) std::this_thread::sleep_for(1ms);
          }
        });
  }
  for (auto& th : threads) th.join();

  UploadReport report = listener->UploadDiagnostics();
  listener->Stop();

  EXPECT_TRUE(report.AllSucceeded());
  EXPECT_GT(report.succeeded.size(), 1u);
  EXPECT_EQ(listener->State(), SinkState::Uploaded);
  EXPECT_EQ(listener->WrittenCount(), static_cast<uint64_t>(kThreads * kPerThread));
  EXPECT_EQ(listener->DroppedCount(), 0u);

  std::multiset<std::string> uploaded;
  for (const auto& name : report.succeeded)
  {
    EXPECT_EQ(name.rfind("vm1-vm1-", 0), 0u) << name;
    const std::string& content = store_->objects[name];
    size_t start = 0;
    while (start < content.size())
    {
      size_t end = content.find('\n', start);
      ASSERT_NE(end, std::string::npos);
      uploaded.insert(content.substr(start, end - start));
      start = end + 1;
    }
  }
  ASSERT_EQ(uploaded.size(), static_cast<size_t>(kThreads * kPerThread));
  for (int t = 0; t < kThreads; ++t)
  {
    for (int i = 0; i < kPerThread; ++i)
    {
      ASSERT_EQ(uploaded.count(fmt::format("{}.{} ; payload-{}", t, i, t)), 1u);
    }
  }
}
