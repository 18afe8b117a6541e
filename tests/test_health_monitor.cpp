// Component: periodic stream health checks and self-healing restarts

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include "fakes/fake_process_launcher.hpp"
#include "live_chunker/event_loop.hpp"
#include "live_chunker/health_monitor.hpp"
#include "live_chunker/process_supervisor.hpp"
#include "live_chunker/stream_catalog.hpp"
#include "live_chunker/stream_registry.hpp"

namespace live_chunker {
namespace {

namespace fs = std::filesystem;
using std::chrono::milliseconds;
using testing::FakeProcessLauncher;
using testing::FakeProcessState;
using testing::make_temp_dir;
using testing::wait_until;

class HealthMonitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sup_opts_.output_root = make_temp_dir("health");
    sup_opts_.max_restarts = 1;
    sup_opts_.verify_delay = milliseconds(20);
    sup_opts_.restart_delay = milliseconds(20);
    sup_opts_.stop_grace = milliseconds(100);

    health_opts_.interval = milliseconds(60000);
    health_opts_.freshness_threshold = milliseconds(10000);
    health_opts_.startup_grace = milliseconds(100);

    catalog_.upsert(StreamDescriptor{"cam", "Cam", SourceSpec::looped_file("/videos/cam.mp4"),
                                     true});
    loop_.start();
    supervisor_ = std::make_unique<ProcessSupervisor>(sup_opts_, registry_, launcher_, loop_);
    monitor_ = std::make_unique<HealthMonitor>(health_opts_, *supervisor_, catalog_, loop_);
  }

  void TearDown() override {
    monitor_->stop();
    monitor_.reset();
    supervisor_.reset();
    loop_.stop();
  }

  StreamSnapshot Snapshot(const std::string& id) { return *supervisor_->status(id); }

  bool WaitForStatus(const std::string& id, StreamStatus status) {
    return wait_until([&] { return Snapshot(id).status == status; });
  }

  void WritePlaylist(const std::string& dir, std::chrono::seconds age) {
    fs::path path = fs::path(dir) / "playlist.m3u8";
    {
      std::ofstream out(path);
      out << "#EXTM3U\n#EXTINF:2.0,\nsegment_000.ts\n#EXTINF:2.0,\nsegment_001.ts\n";
    }
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
  }

  SupervisorOptions sup_opts_;
  HealthOptions health_opts_;
  EventLoop loop_;
  StreamRegistry registry_;
  StreamCatalog catalog_;
  FakeProcessLauncher launcher_;
  std::unique_ptr<ProcessSupervisor> supervisor_;
  std::unique_ptr<HealthMonitor> monitor_;
};

// -----------------------------------------------------------------------------
// Playlist freshness
// -----------------------------------------------------------------------------
TEST_F(HealthMonitorTest, StalePlaylistTriggersExactlyOneRestart) {
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Active));
  std::this_thread::sleep_for(milliseconds(150));  // past startup grace

  WritePlaylist(Snapshot("cam").output_dir, std::chrono::seconds(15));
  EXPECT_EQ(monitor_->check_once(), 1);
  EXPECT_EQ(launcher_.launch_count(), 2);

  // The replacement is inside its startup grace
  EXPECT_EQ(monitor_->check_once(), 0);
  EXPECT_EQ(launcher_.launch_count(), 2);
  EXPECT_EQ(Snapshot("cam").restart_count, 0);
}

TEST_F(HealthMonitorTest, FreshPlaylistIsLeftAlone) {
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Active));
  std::this_thread::sleep_for(milliseconds(150));

  WritePlaylist(Snapshot("cam").output_dir, std::chrono::seconds(1));
  EXPECT_EQ(monitor_->check_once(), 0);
  EXPECT_EQ(launcher_.launch_count(), 1);
  EXPECT_TRUE(monitor_->playlist_health(Snapshot("cam")).healthy);
}

TEST_F(HealthMonitorTest, StartupGraceSkipsFreshlyLaunchedStreams) {
  health_opts_.startup_grace = milliseconds(60000);
  monitor_ = std::make_unique<HealthMonitor>(health_opts_, *supervisor_, catalog_, loop_);

  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Active));
  // No playlist at all, still inside the grace period
  EXPECT_EQ(monitor_->check_once(), 0);
  EXPECT_EQ(launcher_.launch_count(), 1);
}

// -----------------------------------------------------------------------------
// Recovery of streams that should be running
// -----------------------------------------------------------------------------
TEST_F(HealthMonitorTest, DesiredActiveStreamInErrorIsResetAndRestarted) {
  launcher_.set_hook([](FakeProcessState& p) { p.crash(SIGSEGV); });
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(wait_until([&] {
    auto s = Snapshot("cam");
    return s.status == StreamStatus::Error && s.restart_count == 1 &&
           launcher_.launch_count() == 2;
  }));

  launcher_.set_hook({});
  EXPECT_EQ(monitor_->check_once(), 1);
  EXPECT_EQ(launcher_.launch_count(), 3);
  EXPECT_EQ(Snapshot("cam").restart_count, 0);
  EXPECT_TRUE(WaitForStatus("cam", StreamStatus::Active));
}

TEST_F(HealthMonitorTest, StreamNotDesiredActiveStaysDown) {
  ASSERT_TRUE(catalog_.set_desired_active("cam", false));
  launcher_.set_hook([](FakeProcessState& p) { p.crash(SIGSEGV); });
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(wait_until([&] {
    auto s = Snapshot("cam");
    return s.status == StreamStatus::Error && launcher_.launch_count() == 2;
  }));

  EXPECT_EQ(monitor_->check_once(), 0);
  EXPECT_EQ(launcher_.launch_count(), 2);
}

TEST_F(HealthMonitorTest, ManuallyStoppedStreamIsNeverRestarted) {
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(supervisor_->stop("cam"));

  EXPECT_EQ(monitor_->check_once(), 0);
  EXPECT_EQ(launcher_.launch_count(), 1);
  EXPECT_EQ(Snapshot("cam").status, StreamStatus::Stopped);
}

TEST_F(HealthMonitorTest, PeriodicChecksRunOnTheLoop) {
  health_opts_.interval = milliseconds(30);
  monitor_ = std::make_unique<HealthMonitor>(health_opts_, *supervisor_, catalog_, loop_);

  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Active));
  launcher_.last()->exit(0);  // clean exit, stays stopped on its own
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Stopped));

  monitor_->start();
  EXPECT_TRUE(launcher_.wait_for_launches(2, milliseconds(2000)));
  monitor_->stop();
}

TEST_F(HealthMonitorTest, StaleRestartsOnTheLoopKeepOtherTimersOnTime) {
  monitor_.reset();
  sup_opts_.stop_grace = milliseconds(1000);
  supervisor_ = std::make_unique<ProcessSupervisor>(sup_opts_, registry_, launcher_, loop_);
  health_opts_.interval = milliseconds(200);
  monitor_ = std::make_unique<HealthMonitor>(health_opts_, *supervisor_, catalog_, loop_);
  catalog_.upsert(StreamDescriptor{"dock", "Dock", SourceSpec::looped_file("/videos/dock.mp4"),
                                   true});

  launcher_.set_ignore_terminate(true);
  ASSERT_EQ(supervisor_->start(*catalog_.find("cam")), StartResult::Started);
  ASSERT_EQ(supervisor_->start(*catalog_.find("dock")), StartResult::Started);
  ASSERT_TRUE(WaitForStatus("cam", StreamStatus::Active));
  ASSERT_TRUE(WaitForStatus("dock", StreamStatus::Active));
  std::this_thread::sleep_for(milliseconds(150));

  WritePlaylist(Snapshot("cam").output_dir, std::chrono::seconds(15));
  WritePlaylist(Snapshot("dock").output_dir, std::chrono::seconds(15));
  auto first = launcher_.process(0);
  auto second = launcher_.process(1);

  monitor_->start();
  ASSERT_TRUE(wait_until([&] {
    return first->terminate_calls.load() > 0 && second->terminate_calls.load() > 0;
  }));
  // Replacements answer SIGTERM so teardown stays quick
  launcher_.set_ignore_terminate(false);

  // Both old transcoders are inside their stop grace; the loop must stay live
  const auto posted = std::chrono::steady_clock::now();
  std::atomic<long long> late_ms{-1};
  loop_.post_after(milliseconds(10), [&] {
    late_ms = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - posted)
                  .count();
  });
  ASSERT_TRUE(wait_until([&] { return late_ms.load() >= 0; }));
  EXPECT_LT(late_ms.load(), 500);
  EXPECT_FALSE(first->done());

  // The reaper escalates to SIGKILL and the loop relaunches both streams
  EXPECT_TRUE(launcher_.wait_for_launches(4, milliseconds(3000)));
  monitor_->stop();
  EXPECT_EQ(first->kill_calls.load(), 1);
  EXPECT_EQ(second->kill_calls.load(), 1);
  EXPECT_EQ(Snapshot("cam").restart_count, 0);
  EXPECT_EQ(Snapshot("dock").restart_count, 0);
}

}  // namespace
}  // namespace live_chunker
