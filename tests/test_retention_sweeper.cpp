// Component: retention sweeping of chunks, detection outputs and HLS segments

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "fakes/fake_process_launcher.hpp"
#include "live_chunker/event_loop.hpp"
#include "live_chunker/process_supervisor.hpp"
#include "live_chunker/retention_sweeper.hpp"
#include "live_chunker/stream_registry.hpp"

namespace live_chunker {
namespace {

namespace fs = std::filesystem;
using std::chrono::hours;
using std::chrono::milliseconds;
using testing::FakeProcessLauncher;
using testing::make_temp_dir;
using testing::wait_until;

fs::path Touch(const fs::path& path, hours age) {
  fs::create_directories(path.parent_path());
  std::ofstream(path) << "data";
  fs::last_write_time(path, fs::file_time_type::clock::now() - age);
  return path;
}

class RetentionSweeperTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = make_temp_dir("retention");
    opts_.chunk_dir = root_ + "/chunks";
    opts_.extra_dirs = {root_ + "/processed"};
    opts_.retention = hours(24);
    opts_.interval = milliseconds(3600 * 1000);
    opts_.playlist_size = 3;
    loop_.start();
  }

  void TearDown() override { loop_.stop(); }

  std::string root_;
  RetentionOptions opts_;
  EventLoop loop_;
};

// -----------------------------------------------------------------------------
// Expiry
// -----------------------------------------------------------------------------
TEST_F(RetentionSweeperTest, DeletesOnlyFilesPastRetention) {
  fs::path chunks = opts_.chunk_dir;
  auto old_chunk = Touch(chunks / "cam_1-a_0.mp4", hours(48));
  auto old_log = Touch(chunks / "cam_1-b_9.mp4.log", hours(30));
  auto fresh_chunk = Touch(chunks / "cam_2-a_18.mp4", hours(1));
  auto unrelated = Touch(chunks / "notes.txt", hours(72));

  fs::path processed = opts_.extra_dirs[0];
  auto old_video = Touch(processed / "cam" / "processed" / "cam_1-a_0_processed.mp4", hours(25));
  auto old_json = Touch(processed / "cam" / "detections" / "cam_1-a_0_detections.json", hours(25));
  auto fresh_json = Touch(processed / "cam" / "detections" / "cam_2-a_18_detections.json", hours(2));

  RetentionSweeper sweeper(opts_, nullptr, loop_);
  SweepReport report = sweeper.sweep_once();

  EXPECT_EQ(report.chunks_deleted, 2);
  EXPECT_EQ(report.outputs_deleted, 2);
  EXPECT_EQ(report.segments_trimmed, 0);
  EXPECT_EQ(report.errors, 0);

  EXPECT_FALSE(fs::exists(old_chunk));
  EXPECT_FALSE(fs::exists(old_log));
  EXPECT_FALSE(fs::exists(old_video));
  EXPECT_FALSE(fs::exists(old_json));
  EXPECT_TRUE(fs::exists(fresh_chunk));
  EXPECT_TRUE(fs::exists(fresh_json));
  EXPECT_TRUE(fs::exists(unrelated));

  // A second pass finds nothing new
  SweepReport again = sweeper.sweep_once();
  EXPECT_EQ(again.chunks_deleted, 0);
  EXPECT_EQ(again.outputs_deleted, 0);
}

TEST_F(RetentionSweeperTest, MissingDirectoriesAreNotErrors) {
  RetentionSweeper sweeper(opts_, nullptr, loop_);
  SweepReport report = sweeper.sweep_once();
  EXPECT_EQ(report.chunks_deleted, 0);
  EXPECT_EQ(report.errors, 0);
}

// -----------------------------------------------------------------------------
// Segment overflow of running streams
// -----------------------------------------------------------------------------
TEST_F(RetentionSweeperTest, TrimsSegmentOverflowOfRunningStreams) {
  SupervisorOptions sup;
  sup.output_root = root_ + "/streams";
  sup.verify_delay = milliseconds(10);
  sup.stop_grace = milliseconds(100);
  StreamRegistry registry;
  FakeProcessLauncher launcher;
  ProcessSupervisor supervisor(sup, registry, launcher, loop_);

  ASSERT_EQ(supervisor.start(StreamDescriptor{"cam", "Cam", SourceSpec::looped_file("/v.mp4"),
                                              true}),
            StartResult::Started);
  fs::path dir = supervisor.status("cam")->output_dir;
  for (int i = 0; i < 10; ++i) {
    auto p = dir / ("segment_" + std::to_string(i) + ".ts");
    std::ofstream(p) << "ts";
    fs::last_write_time(p, fs::file_time_type::clock::now() - std::chrono::seconds(100 - i));
  }

  RetentionSweeper sweeper(opts_, &supervisor, loop_);
  SweepReport report = sweeper.sweep_once();
  EXPECT_EQ(report.segments_trimmed, 7);
  EXPECT_TRUE(fs::exists(dir / "segment_9.ts"));
  EXPECT_FALSE(fs::exists(dir / "segment_0.ts"));

  // Within twice the window nothing more is removed
  EXPECT_EQ(sweeper.sweep_once().segments_trimmed, 0);
}

TEST_F(RetentionSweeperTest, PeriodicSweepRunsOnTheLoop) {
  opts_.interval = milliseconds(30);
  auto old_chunk = Touch(fs::path(opts_.chunk_dir) / "cam_1-a_0.mp4", hours(48));

  RetentionSweeper sweeper(opts_, nullptr, loop_);
  sweeper.start();
  EXPECT_TRUE(wait_until([&] { return !fs::exists(old_chunk); }));
  sweeper.stop();
}

}  // namespace
}  // namespace live_chunker
