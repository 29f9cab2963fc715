#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "shspec/trace/coverage.hpp"
#include "shspec/trace/trace_buffer.hpp"
#include "shspec/trace/trace_record.hpp"

namespace shspec::trace {
namespace {

namespace fs = std::filesystem;

class TraceBufferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::weakly_canonical(
        fs::temp_directory_path() /
        ("shspec_trace_buffer_" +
         std::string(
             ::testing::UnitTest::GetInstance()->current_test_info()->name())));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  [[nodiscard]] auto RecordFile() const -> fs::path {
    return dir_ / "0001.cov";
  }

  [[nodiscard]] auto ReadRecords() const -> std::string {
    std::ifstream in(RecordFile());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  fs::path dir_;
};

TEST_F(TraceBufferTest, FlushesEveryFullBatch) {
  TraceBuffer buffer(RecordFile(), dir_, {}, 50);
  for (size_t i = 1; i <= 120; ++i) {
    buffer.OnEvent(TraceRecord{.path = "lib.sh", .line = i});
  }
  EXPECT_EQ(buffer.FlushCount(), 2U);
  EXPECT_EQ(buffer.BufferedCount(), 20U);

  buffer.Finalize();
  EXPECT_EQ(buffer.FlushCount(), 3U);
  EXPECT_EQ(buffer.BufferedCount(), 0U);
  EXPECT_EQ(MergeTraceRecords(dir_).size(), 120U);
}

TEST_F(TraceBufferTest, FinalizeTwiceWritesNothingNew) {
  TraceBuffer buffer(RecordFile(), dir_, {}, 50);
  buffer.OnEvent(TraceRecord{.path = "lib.sh", .line = 3});
  buffer.Finalize();
  auto first = ReadRecords();
  buffer.Finalize();
  EXPECT_EQ(ReadRecords(), first);
  EXPECT_EQ(buffer.FlushCount(), 1U);
}

TEST_F(TraceBufferTest, ResolvesRelativePathsAgainstWorkingDir) {
  {
    TraceBuffer buffer(RecordFile(), dir_, {}, 50);
    buffer.OnEvent(TraceRecord{.path = "./src/../lib.sh", .line = 7});
  }
  EXPECT_EQ(ReadRecords(), (dir_ / "lib.sh").string() + ":7\n");
}

TEST_F(TraceBufferTest, DropsRecordsOfExcludedFiles) {
  {
    TraceBuffer buffer(RecordFile(), dir_, {dir_ / "prelude.sh"}, 50);
    buffer.OnEvent(
        TraceRecord{.path = (dir_ / "prelude.sh").string(), .line = 1});
    buffer.OnEvent(TraceRecord{.path = "lib.sh", .line = 2});
  }
  EXPECT_EQ(ReadRecords(), (dir_ / "lib.sh").string() + ":2\n");
}

TEST_F(TraceBufferTest, FeedJoinsRecordsSplitAcrossChunks) {
  TraceBuffer buffer(RecordFile(), dir_, {}, 50);
  buffer.Feed("/a/lib.sh:1\n/a/li");
  EXPECT_EQ(buffer.BufferedCount(), 1U);
  buffer.Feed("b.sh:2\ngarbage\n/a/lib.sh:3");
  EXPECT_EQ(buffer.BufferedCount(), 2U);
  buffer.Finalize();
  EXPECT_EQ(ReadRecords(), "/a/lib.sh:1\n/a/lib.sh:2\n/a/lib.sh:3\n");
}

TEST(TraceRecordTest, ParseSplitsAtLastColon) {
  auto record = ParseTraceRecord("/tmp/a:b/lib.sh:42");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->path, "/tmp/a:b/lib.sh");
  EXPECT_EQ(record->line, 42U);

  EXPECT_FALSE(ParseTraceRecord("lib.sh").has_value());
  EXPECT_FALSE(ParseTraceRecord("lib.sh:").has_value());
  EXPECT_FALSE(ParseTraceRecord("lib.sh:0").has_value());
  EXPECT_FALSE(ParseTraceRecord("lib.sh:12x").has_value());
}

}  // namespace
}  // namespace shspec::trace
