// Component: priority/retry processing queue in front of the detection service

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fakes/fake_detection_client.hpp"
#include "fakes/fake_process_launcher.hpp"
#include "live_chunker/job_registry.hpp"
#include "live_chunker/metrics_aggregator.hpp"
#include "live_chunker/processing_queue.hpp"

namespace live_chunker {
namespace {

using std::chrono::milliseconds;
using testing::FakeDetectionClient;
using testing::make_temp_dir;
using testing::wait_until;

ChunkDescriptor MakeChunk(const std::string& id, int64_t extracted_at_ms) {
  ChunkDescriptor chunk;
  chunk.id = id;
  chunk.stream_id = "cam";
  chunk.path = "/chunks/cam_" + id + "_0.mp4";
  chunk.status = ChunkStatus::Ready;
  chunk.size_bytes = 1024;
  chunk.extracted_at_ms = extracted_at_ms;
  return chunk;
}

DetectionResult Fail(const ChunkDescriptor&, int) {
  throw DetectionError("detection service returned HTTP 500", 500);
}

class ProcessingQueueTest : public ::testing::Test {
 protected:
  void SetUp() override {
    opts_.concurrency = 1;
    opts_.max_waiting = 100;
    opts_.max_attempts = 3;
    opts_.backoff_base = milliseconds(10);
    opts_.completed_history = 10;
    opts_.failed_history = 25;
  }

  QueueOptions opts_;
  JobRegistry registry_;
  FakeDetectionClient client_;
};

// -----------------------------------------------------------------------------
// Ordering
// -----------------------------------------------------------------------------
TEST_F(ProcessingQueueTest, OldestChunkIsDispatchedFirst) {
  ProcessingQueue queue(opts_, registry_, client_);
  ASSERT_TRUE(queue.enqueue(MakeChunk("c300", 300)).accepted());
  ASSERT_TRUE(queue.enqueue(MakeChunk("c100", 100)).accepted());
  ASSERT_TRUE(queue.enqueue(MakeChunk("c200", 200)).accepted());
  ASSERT_TRUE(queue.enqueue(MakeChunk("c100b", 100)).accepted());

  queue.start();
  ASSERT_TRUE(queue.wait_idle(milliseconds(2000)));
  EXPECT_EQ(client_.calls(), (std::vector<std::string>{"c100", "c100b", "c200", "c300"}));
  EXPECT_EQ(queue.stats().completed_total, 4u);
}

TEST_F(ProcessingQueueTest, BackedOffJobDoesNotBlockOthers) {
  opts_.backoff_base = milliseconds(200);
  client_.set_behavior([](const ChunkDescriptor& chunk, int call) {
    if (chunk.id == "old" && call == 1) throw DetectionError("timeout");
    return DetectionResult{};
  });
  ProcessingQueue queue(opts_, registry_, client_);
  queue.start();

  ASSERT_TRUE(queue.enqueue(MakeChunk("old", 100)).accepted());
  ASSERT_TRUE(wait_until([&] { return queue.stats().delayed == 1; }));
  ASSERT_TRUE(queue.enqueue(MakeChunk("new", 500)).accepted());

  ASSERT_TRUE(queue.wait_idle(milliseconds(3000)));
  EXPECT_EQ(client_.calls(), (std::vector<std::string>{"old", "new", "old"}));
  EXPECT_EQ(queue.stats().retried_total, 1u);
}

// -----------------------------------------------------------------------------
// Bounded waiting set
// -----------------------------------------------------------------------------
TEST_F(ProcessingQueueTest, FullQueueRejectsNewerAndEvictsForOlder) {
  opts_.max_waiting = 2;
  ProcessingQueue queue(opts_, registry_, client_);  // not started, nothing drains

  EnqueueResult a = queue.enqueue(MakeChunk("a", 100));
  EnqueueResult b = queue.enqueue(MakeChunk("b", 200));
  ASSERT_EQ(a.outcome, EnqueueOutcome::Accepted);
  ASSERT_EQ(b.outcome, EnqueueOutcome::Accepted);

  EnqueueResult newer = queue.enqueue(MakeChunk("c", 300));
  EXPECT_EQ(newer.outcome, EnqueueOutcome::Rejected);
  EXPECT_FALSE(newer.accepted());
  EnqueueResult same = queue.enqueue(MakeChunk("d", 200));
  EXPECT_EQ(same.outcome, EnqueueOutcome::Rejected);

  EnqueueResult older = queue.enqueue(MakeChunk("e", 50));
  EXPECT_EQ(older.outcome, EnqueueOutcome::AcceptedWithEviction);
  EXPECT_EQ(older.evicted_job_id, b.job_id);

  QueueStats stats = queue.stats();
  EXPECT_EQ(stats.waiting, 2u);
  EXPECT_EQ(stats.rejected_total, 2u);
  EXPECT_EQ(stats.evicted_total, 1u);

  auto waiting = queue.waiting_jobs();
  ASSERT_EQ(waiting.size(), 2u);
  EXPECT_EQ(waiting[0].chunk.id, "e");
  EXPECT_EQ(waiting[1].chunk.id, "a");

  auto failed = queue.recent_failed();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].id, b.job_id);
  EXPECT_NE(failed[0].error.find("evicted"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Retries
// -----------------------------------------------------------------------------
TEST_F(ProcessingQueueTest, FailsForGoodAtExactlyMaxAttempts) {
  const std::string dir = make_temp_dir("queue_journal");
  opts_.failed_journal = dir + "/failed_jobs.jsonl";
  client_.set_behavior(Fail);
  ProcessingQueue queue(opts_, registry_, client_);
  queue.start();

  EnqueueResult r = queue.enqueue(MakeChunk("doomed", 100));
  ASSERT_TRUE(r.accepted());
  ASSERT_TRUE(queue.wait_idle(milliseconds(3000)));

  EXPECT_EQ(client_.call_count(), 3);
  QueueStats stats = queue.stats();
  EXPECT_EQ(stats.failed_total, 1u);
  EXPECT_EQ(stats.retried_total, 2u);
  EXPECT_EQ(stats.completed_total, 0u);

  auto failed = queue.recent_failed();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].id, r.job_id);
  EXPECT_EQ(failed[0].status, JobStatus::Failed);
  EXPECT_EQ(failed[0].attempts, 3);
  EXPECT_NE(failed[0].error.find("HTTP 500"), std::string::npos);

  auto job = queue.job(r.job_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::Failed);

  std::ifstream journal(opts_.failed_journal);
  std::string line;
  ASSERT_TRUE(std::getline(journal, line));
  auto entry = nlohmann::json::parse(line);
  EXPECT_EQ(entry["job_id"], r.job_id);
  EXPECT_EQ(entry["chunk_id"], "doomed");
  EXPECT_EQ(entry["attempts"], 3);
  EXPECT_FALSE(std::getline(journal, line));
}

TEST_F(ProcessingQueueTest, TransientFailureCompletesOnRetry) {
  client_.set_behavior([](const ChunkDescriptor&, int call) {
    if (call == 1) throw DetectionError("connection refused");
    DetectionResult result;
    result.detection_count = 4;
    result.processing_time_ms = 12.5;
    return result;
  });
  ProcessingQueue queue(opts_, registry_, client_);
  queue.start();

  EnqueueResult r = queue.enqueue(MakeChunk("flaky", 100));
  ASSERT_TRUE(queue.wait_idle(milliseconds(2000)));

  auto done = queue.recent_completed();
  ASSERT_EQ(done.size(), 1u);
  EXPECT_EQ(done[0].id, r.job_id);
  EXPECT_EQ(done[0].attempts, 2);
  ASSERT_TRUE(done[0].result.has_value());
  EXPECT_EQ(done[0].result->detection_count, 4);
  EXPECT_TRUE(done[0].error.empty());
  EXPECT_TRUE(queue.recent_failed().empty());
}

TEST(ProcessingQueueBackoffTest, DoublesPerAttempt) {
  EXPECT_EQ(ProcessingQueue::backoff_delay(milliseconds(2000), 1), milliseconds(2000));
  EXPECT_EQ(ProcessingQueue::backoff_delay(milliseconds(2000), 2), milliseconds(4000));
  EXPECT_EQ(ProcessingQueue::backoff_delay(milliseconds(2000), 3), milliseconds(8000));
}

// -----------------------------------------------------------------------------
// History, observers, lifecycle
// -----------------------------------------------------------------------------
TEST_F(ProcessingQueueTest, HistoryIsBoundedNewestFirst) {
  opts_.completed_history = 2;
  ProcessingQueue queue(opts_, registry_, client_);
  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(queue.enqueue(MakeChunk("c" + std::to_string(i), i * 100)).accepted());
  }
  queue.start();
  ASSERT_TRUE(queue.wait_idle(milliseconds(2000)));

  auto done = queue.recent_completed();
  ASSERT_EQ(done.size(), 2u);
  EXPECT_EQ(done[0].chunk.id, "c4");
  EXPECT_EQ(done[1].chunk.id, "c3");
}

TEST_F(ProcessingQueueTest, ObserverFeedsMetrics) {
  client_.set_behavior([](const ChunkDescriptor& chunk, int) {
    if (chunk.id == "bad") throw DetectionError("bad chunk");
    return DetectionResult{};
  });
  opts_.max_attempts = 1;
  MetricsAggregator metrics;
  ProcessingQueue queue(opts_, registry_, client_);
  queue.set_observer([&](const ProcessingJob& job) { metrics.record_job(job); });
  queue.start();

  queue.enqueue(MakeChunk("good", 100));
  queue.enqueue(MakeChunk("bad", 200));
  ASSERT_TRUE(queue.wait_idle(milliseconds(2000)));

  ASSERT_TRUE(wait_until([&] {
    PipelineMetrics m = metrics.snapshot(queue.stats(), 0);
    return m.chunks_processed == 1 && m.jobs_failed == 1;
  }));
}

TEST_F(ProcessingQueueTest, ShutdownClosesQueue) {
  ProcessingQueue queue(opts_, registry_, client_);
  queue.start();
  EXPECT_EQ(queue.worker_count(), 1);
  queue.shutdown();
  EnqueueResult r = queue.enqueue(MakeChunk("late", 100));
  EXPECT_EQ(r.outcome, EnqueueOutcome::Closed);
  EXPECT_FALSE(r.accepted());
}

}  // namespace
}  // namespace live_chunker
