#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "diag_sink/rotating_writer.hpp"
#include "diag_sink/upload_coordinator.hpp"
#include "fakes/fake_object_store.hpp"
#include "temp_dir.hpp"

using diag_sink::ErrorCode;
using diag_sink::IObjectStore;
using diag_sink::ObjectStoreFactory;
using diag_sink::RotatingWriter;
using diag_sink::SegmentLayout;
using diag_sink::SinkState;
using diag_sink::Status;
using diag_sink::UploadCoordinator;
using diag_sink::UploadOptions;
using diag_sink::UploadReport;
using diag_sink::test::FakeStoreFactory;
using diag_sink::test::FakeStoreState;
using diag_sink::test::TempDir;

class UploadCoordinatorTest : public ::testing::Test
{
 protected:
  TempDir dir_;
  std::shared_ptr<FakeStoreState> store_ = std::make_shared<FakeStoreState>();
  std::unique_ptr<RotatingWriter> writer_;

  void SetUp() override
  {
    ASSERT_TRUE(dir_.Valid());
    writer_ = std::make_unique<RotatingWriter>(SegmentLayout(dir_.Path(), "diag"));
  }

  // Three segments: diag, diag-0, diag-1.
  void WriteThreeSegments()
  {
    ASSERT_TRUE(writer_->Append("seg0").ok());
    ASSERT_TRUE(writer_->Rotate().ok());
    ASSERT_TRUE(writer_->Append("seg1").ok());
    ASSERT_TRUE(writer_->Rotate().ok());
    ASSERT_TRUE(writer_->Append("seg2").ok());
  }
};

TEST_F(UploadCoordinatorTest, FlushDrainsAllWriters)
{
  WriteThreeSegments();
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});
  EXPECT_EQ(coordinator.State(), SinkState::Recording);

  ASSERT_TRUE(coordinator.Flush().ok());
  EXPECT_EQ(coordinator.State(), SinkState::Draining);
  EXPECT_TRUE(writer_->IsSealed());
  EXPECT_EQ(writer_->Retired().Size(), 0u);
  EXPECT_EQ(writer_->Append("late").code(), ErrorCode::Sealed);
  EXPECT_TRUE(coordinator.Flush().ok());
}

TEST_F(UploadCoordinatorTest, UploadsEverySegmentWithHostNames)
{
  WriteThreeSegments();
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"bench-01", ""});
  ASSERT_TRUE(coordinator.Flush().ok());

  UploadReport report = coordinator.UploadAll();
  EXPECT_TRUE(report.AllSucceeded());
  EXPECT_EQ(report.Attempted(), 3u);
  EXPECT_EQ(report.succeeded, (std::vector<std::string>{"bench-01-bench-01-0.out",
                                                        "bench-01-bench-01-1.out",
                                                        "bench-01-bench-01-2.out"}));
  EXPECT_EQ(coordinator.State(), SinkState::Uploaded);
  EXPECT_EQ(store_->objects["bench-01-bench-01-0.out"], "seg0\n");
  EXPECT_EQ(store_->objects["bench-01-bench-01-1.out"], "seg1\n");
  EXPECT_EQ(store_->objects["bench-01-bench-01-2.out"], "seg2\n");
}

TEST_F(UploadCoordinatorTest, OneFailureDoesNotStopTheBatch)
{
  WriteThreeSegments();
  store_->failing_paths.insert(dir_.Join("diag-0"));
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});
  ASSERT_TRUE(coordinator.Flush().ok());

  UploadReport report = coordinator.UploadAll();
  EXPECT_FALSE(report.AllSucceeded());
  EXPECT_EQ(report.succeeded, (std::vector<std::string>{"h-h-0.out", "h-h-2.out"}));
  ASSERT_EQ(report.failed.size(), 1u);
  EXPECT_EQ(report.failed[0].path, dir_.Join("diag-0"));
  EXPECT_EQ(report.failed[0].object_name, "h-h-1.out");
  EXPECT_EQ(report.failed[0].error.code(), ErrorCode::UploadFailed);
  EXPECT_EQ(store_->put_calls, 3);
}

TEST_F(UploadCoordinatorTest, RepeatedUploadOverwritesInsteadOfDuplicating)
{
  WriteThreeSegments();
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});
  ASSERT_TRUE(coordinator.Flush().ok());

  EXPECT_TRUE(coordinator.UploadAll().AllSucceeded());
  EXPECT_TRUE(coordinator.UploadAll().AllSucceeded());
  EXPECT_EQ(store_->objects.size(), 3u);
  EXPECT_EQ(store_->put_calls, 6);
}

TEST_F(UploadCoordinatorTest, RetryAfterPartialFailure)
{
  WriteThreeSegments();
  store_->failing_paths.insert(dir_.Join("diag-1"));
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});

  EXPECT_EQ(coordinator.UploadAll().failed.size(), 1u);
  store_->failing_paths.clear();
  UploadReport retry = coordinator.UploadAll();
  EXPECT_TRUE(retry.AllSucceeded());
  EXPECT_EQ(store_->objects.count("h-h-2.out"), 1u);
}

TEST_F(UploadCoordinatorTest, KeyPrefixIsPrepended)
{
  ASSERT_TRUE(writer_->Append("only").ok());
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_),
                                UploadOptions{"h", "nightly/run-7/"});
  ASSERT_TRUE(coordinator.Flush().ok());

  UploadReport report = coordinator.UploadAll();
  EXPECT_EQ(report.succeeded, std::vector<std::string>{"nightly/run-7/h-h-0.out"});
}

TEST_F(UploadCoordinatorTest, EmptyHostFallsBackToMachineName)
{
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{});
  EXPECT_EQ(coordinator.Options().host_id, diag_sink::LocalHostId());
}

TEST_F(UploadCoordinatorTest, UploadWhileRecordingFlushesFirst)
{
  ASSERT_TRUE(writer_->Append("pending").ok());
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});

  UploadReport report = coordinator.UploadAll();
  EXPECT_TRUE(report.AllSucceeded());
  EXPECT_TRUE(writer_->IsSealed());
  EXPECT_EQ(store_->objects["h-h-0.out"], "pending\n");
  EXPECT_EQ(coordinator.State(), SinkState::Uploaded);
}

TEST_F(UploadCoordinatorTest, StoreCreatedLazilyAndOnce)
{
  WriteThreeSegments();
  int factory_calls = 0;
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_, &factory_calls),
                                UploadOptions{"h", ""});
  ASSERT_TRUE(coordinator.Flush().ok());
  EXPECT_EQ(factory_calls, 0);

  coordinator.UploadAll();
  coordinator.UploadAll();
  EXPECT_EQ(factory_calls, 1);
  EXPECT_EQ(store_->create_calls, 1);
}

TEST_F(UploadCoordinatorTest, UnavailableStoreFailsEveryFile)
{
  WriteThreeSegments();
  store_->fail_create = true;
  UploadCoordinator coordinator(*writer_, FakeStoreFactory(store_), UploadOptions{"h", ""});

  UploadReport report = coordinator.UploadAll();
  EXPECT_TRUE(report.succeeded.empty());
  ASSERT_EQ(report.failed.size(), 3u);
  for (const auto& f : report.failed)
  {
    EXPECT_EQ(f.error.code(), ErrorCode::StoreUnavailable);
  }
  EXPECT_EQ(store_->put_calls, 0);

  store_->fail_create = false;
  EXPECT_TRUE(coordinator.UploadAll().AllSucceeded());
}

TEST_F(UploadCoordinatorTest, ThrowingFactoryIsReportedNotPropagated)
{
  ASSERT_TRUE(writer_->Append("x").ok());
  ObjectStoreFactory factory = [](Status*) -> std::unique_ptr<IObjectStore>
  { throw std::runtime_error("credentials expired"); };
  UploadCoordinator coordinator(*writer_, factory, UploadOptions{"h", ""});

  UploadReport report;
  EXPECT_NO_THROW(report = coordinator.UploadAll());
  ASSERT_EQ(report.failed.size(), 1u);
  EXPECT_EQ(report.failed[0].error.code(), ErrorCode::StoreUnavailable);
  EXPECT_NE(report.failed[0].error.message().find("credentials expired"), std::string::npos);
}

TEST_F(UploadCoordinatorTest, MissingFactoryReportsStoreUnavailable)
{
  ASSERT_TRUE(writer_->Append("x").ok());
  UploadCoordinator coordinator(*writer_, ObjectStoreFactory{}, UploadOptions{"h", ""});
  UploadReport report = coordinator.UploadAll();
  ASSERT_EQ(report.failed.size(), 1u);
  EXPECT_EQ(report.failed[0].error.code(), ErrorCode::StoreUnavailable);
}

TEST(UploadCoordinator, NothingToUploadGivesEmptyReport)
{
  TempDir dir;
  ASSERT_TRUE(dir.Valid());
  auto no_segments = [](const std::string&, uint32_t, Status* st)
  {
    *st = Status::Error(ErrorCode::OpenFailed, "read-only volume");
    return std::shared_ptr<diag_sink::ISegmentWriter>();
  };
  RotatingWriter writer(SegmentLayout(dir.Path(), "diag"), no_segments);
  auto store = std::make_shared<FakeStoreState>();
  UploadCoordinator coordinator(writer, FakeStoreFactory(store), UploadOptions{"h", ""});

  UploadReport report = coordinator.UploadAll();
  EXPECT_EQ(report.Attempted(), 0u);
  EXPECT_TRUE(report.AllSucceeded());
  EXPECT_EQ(coordinator.State(), SinkState::Uploaded);
}

TEST(SinkState, Names)
{
  EXPECT_EQ(diag_sink::ToString(SinkState::Recording), "Recording");
  EXPECT_EQ(diag_sink::ToString(SinkState::Draining), "Draining");
  EXPECT_EQ(diag_sink::ToString(SinkState::Uploaded), "Uploaded");
}
