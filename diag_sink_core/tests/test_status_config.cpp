#include <gtest/gtest.h>

#include <cerrno>

#include "diag_sink/sink_config.hpp"
#include "diag_sink/status.hpp"

using diag_sink::ErrorCode;
using diag_sink::SinkConfig;
using diag_sink::Status;

TEST(Status, DefaultIsOk)
{
  Status st;
  EXPECT_TRUE(st.ok());
  EXPECT_EQ(st.code(), ErrorCode::Ok);
  EXPECT_EQ(st.ToString(), "Ok");
}

TEST(Status, ErrorCarriesCodeAndMessage)
{
  Status st = Status::Error(ErrorCode::UploadFailed, "remote said no");
  EXPECT_FALSE(st.ok());
  EXPECT_EQ(st.code(), ErrorCode::UploadFailed);
  EXPECT_EQ(st.sys_errno(), 0);
  EXPECT_EQ(st.ToString(), "UploadFailed (remote said no)");
}

TEST(Status, FromErrnoKeepsErrno)
{
  Status st = Status::FromErrno(ErrorCode::WriteFailed, "write 'x'", ENOSPC);
  EXPECT_EQ(st.code(), ErrorCode::WriteFailed);
  EXPECT_EQ(st.sys_errno(), ENOSPC);
  EXPECT_EQ(st.message().rfind("write 'x': ", 0), 0u);
}

TEST(SinkConfig, DefaultsMatchBenchmarkListener)
{
  SinkConfig config;
  EXPECT_EQ(config.base_name, "BenchmarkDiagnostics.out");
  EXPECT_EQ(config.max_segment_bytes, 100000000ULL);
  EXPECT_EQ(config.check_interval.count(), 5000);
  EXPECT_EQ(config.EffectiveReclaimInterval().count(), 5000);
  EXPECT_EQ(config.store.container, "diagnostics");
  EXPECT_EQ(config.first_column, 2u);
  EXPECT_EQ(config.second_column, 3u);
  EXPECT_TRUE(config.Validate().ok());
}

TEST(SinkConfig, ReclaimIntervalCanBeDecoupled)
{
  SinkConfig config;
  config.reclaim_interval = std::chrono::milliseconds(250);
  EXPECT_EQ(config.EffectiveReclaimInterval().count(), 250);
  EXPECT_TRUE(config.Validate().ok());
}

TEST(SinkConfig, RejectsBadValues)
{
  SinkConfig config;
  config.max_segment_bytes = 0;
  EXPECT_EQ(config.Validate().code(), ErrorCode::InvalidArgument);

  config = SinkConfig{};
  config.check_interval = std::chrono::milliseconds(0);
  EXPECT_EQ(config.Validate().code(), ErrorCode::InvalidArgument);

  config = SinkConfig{};
  config.base_name = "logs/out";
  EXPECT_EQ(config.Validate().code(), ErrorCode::InvalidArgument);

  config = SinkConfig{};
  config.base_name.clear();
  EXPECT_EQ(config.Validate().code(), ErrorCode::InvalidArgument);

  config = SinkConfig{};
  config.second_column = config.first_column;
  EXPECT_EQ(config.Validate().code(), ErrorCode::InvalidArgument);
}
