// Component: detection service requests and responses

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "fakes/fake_process_launcher.hpp"
#include "live_chunker/detection_client.hpp"

namespace live_chunker {
namespace {

namespace fs = std::filesystem;
using testing::make_temp_dir;

ChunkDescriptor Chunk() {
  ChunkDescriptor chunk;
  chunk.id = "1700000000000-ab12cd34";
  chunk.stream_id = "cam";
  chunk.start_offset = 18.0;
  chunk.duration = 10.0;
  chunk.path = "/chunks/cam_1700000000000-ab12cd34_18.mp4";
  chunk.status = ChunkStatus::Ready;
  return chunk;
}

// Local stand-in for the detection pipeline
class StubPipeline {
 public:
  explicit StubPipeline(int status, std::string body)
      : status_(status), body_(std::move(body)) {
    server_.Post("/api/process-chunk", [this](const httplib::Request& req, httplib::Response& res) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        received_ = req.body;
      }
      res.status = status_;
      res.set_content(body_, "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    while (!server_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  ~StubPipeline() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::string received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

 private:
  int status_;
  std::string body_;
  httplib::Server server_;
  int port_ = 0;
  std::thread thread_;
  std::mutex mutex_;
  std::string received_;
};

// -----------------------------------------------------------------------------
// Request and response mapping
// -----------------------------------------------------------------------------
TEST(DetectionRequestTest, OutputPathsFollowStreamLayout) {
  DetectionClientOptions opts;
  opts.processed_root = "/data/processed";
  opts.frame_interval = 5;
  DetectionRequest req = build_detection_request(Chunk(), opts);

  EXPECT_EQ(req.chunk_id, "1700000000000-ab12cd34");
  EXPECT_EQ(req.stream_id, "cam");
  EXPECT_EQ(req.output_video_path,
            "/data/processed/cam/processed/cam_1700000000000-ab12cd34_18_processed.mp4");
  EXPECT_EQ(req.output_json_path,
            "/data/processed/cam/detections/cam_1700000000000-ab12cd34_18_detections.json");
  EXPECT_EQ(req.frame_interval, 5);
  EXPECT_DOUBLE_EQ(req.start_time, 18.0);

  auto body = nlohmann::json::parse(detection_request_body(req));
  EXPECT_EQ(body["chunk_path"], Chunk().path);
  EXPECT_EQ(body["frame_interval"], 5);
  EXPECT_EQ(body["start_time"], 18.0);
}

TEST(DetectionResponseTest, ReadsCountFromEitherField) {
  DetectionRequest req = build_detection_request(Chunk(), DetectionClientOptions{});

  DetectionResult counted =
      parse_detection_response(R"({"detection_count": 7, "processing_time_ms": 812.5})", req);
  EXPECT_EQ(counted.detection_count, 7);
  EXPECT_DOUBLE_EQ(counted.processing_time_ms, 812.5);
  EXPECT_EQ(counted.output_video_path, req.output_video_path);

  DetectionResult listed = parse_detection_response(R"({"detections": [{}, {}, {}]})", req);
  EXPECT_EQ(listed.detection_count, 3);

  EXPECT_EQ(parse_detection_response("", req).detection_count, 0);
  EXPECT_THROW(parse_detection_response("[1,2]", req), DetectionError);
  EXPECT_THROW(parse_detection_response("<html>", req), DetectionError);
}

// -----------------------------------------------------------------------------
// HTTP client
// -----------------------------------------------------------------------------
TEST(HttpDetectionClientTest, PostsChunkAndParsesReply) {
  StubPipeline pipeline(200, R"({"detection_count": 2})");
  DetectionClientOptions opts;
  opts.base_url = pipeline.url();
  opts.processed_root = make_temp_dir("detection_ok");
  HttpDetectionClient client(opts);

  DetectionResult result = client.process(Chunk());
  EXPECT_EQ(result.detection_count, 2);
  EXPECT_TRUE(fs::is_directory(fs::path(opts.processed_root) / "cam" / "processed"));
  EXPECT_TRUE(fs::is_directory(fs::path(opts.processed_root) / "cam" / "detections"));

  auto sent = nlohmann::json::parse(pipeline.received());
  EXPECT_EQ(sent["chunk_id"], Chunk().id);
  EXPECT_EQ(sent["stream_id"], "cam");
}

TEST(HttpDetectionClientTest, ErrorStatusThrowsWithCode) {
  StubPipeline pipeline(500, R"({"error": "model not loaded"})");
  DetectionClientOptions opts;
  opts.base_url = pipeline.url();
  opts.processed_root = make_temp_dir("detection_500");
  HttpDetectionClient client(opts);

  try {
    client.process(Chunk());
    FAIL() << "expected DetectionError";
  } catch (const DetectionError& e) {
    EXPECT_EQ(e.http_status(), 500);
  }
}

TEST(HttpDetectionClientTest, UnreachableServiceThrows) {
  DetectionClientOptions opts;
  opts.base_url = "http://127.0.0.1:1";
  opts.processed_root = make_temp_dir("detection_down");
  opts.connect_timeout = std::chrono::seconds(1);
  HttpDetectionClient client(opts);

  try {
    client.process(Chunk());
    FAIL() << "expected DetectionError";
  } catch (const DetectionError& e) {
    EXPECT_EQ(e.http_status(), 0);
  }
}

}  // namespace
}  // namespace live_chunker
