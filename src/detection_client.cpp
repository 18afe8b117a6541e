/**
 * @file detection_client.cpp
 * @brief HTTP detection pipeline client
 */

#include "live_chunker/detection_client.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"

namespace fs = std::filesystem;

namespace live_chunker {

namespace {

constexpr const char *PROCESS_ENDPOINT = "/api/process-chunk";

} // anonymous namespace

DetectionClientOptions DetectionClientOptions::from_env() {
  DetectionClientOptions opts;
  opts.base_url = Config::ml_service_url();
  opts.processed_root = Config::processed_output_path();
  opts.frame_interval = Config::frame_interval();
  opts.read_timeout = std::chrono::seconds(Config::ml_request_timeout_sec());
  return opts;
}

DetectionRequest build_detection_request(const ChunkDescriptor &chunk,
                                         const DetectionClientOptions &opts) {
  const std::string base = fs::path(chunk.path).stem().string();
  const fs::path stream_root = fs::path(opts.processed_root) / chunk.stream_id;

  DetectionRequest request;
  request.chunk_id = chunk.id;
  request.chunk_path = chunk.path;
  request.stream_id = chunk.stream_id;
  request.output_video_path =
      (stream_root / "processed" / (base + "_processed.mp4")).string();
  request.output_json_path =
      (stream_root / "detections" / (base + "_detections.json")).string();
  request.frame_interval = opts.frame_interval;
  request.start_time = chunk.start_offset;
  return request;
}

std::string detection_request_body(const DetectionRequest &request) {
  nlohmann::json body = {{"chunk_id", request.chunk_id},
                         {"chunk_path", request.chunk_path},
                         {"stream_id", request.stream_id},
                         {"output_video_path", request.output_video_path},
                         {"output_json_path", request.output_json_path},
                         {"frame_interval", request.frame_interval},
                         {"start_time", request.start_time}};
  return body.dump();
}

DetectionResult parse_detection_response(const std::string &body,
                                         const DetectionRequest &request) {
  DetectionResult result;
  result.output_video_path = request.output_video_path;
  result.output_json_path = request.output_json_path;
  result.body = body;

  if (body.empty())
    return result;

  nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw DetectionError("detection service returned a non-object body");

  if (doc.contains("detection_count") && doc["detection_count"].is_number()) {
    result.detection_count = doc["detection_count"].get<int>();
  } else if (doc.contains("detections") && doc["detections"].is_array()) {
    result.detection_count = static_cast<int>(doc["detections"].size());
  }
  if (doc.contains("processing_time_ms") &&
      doc["processing_time_ms"].is_number()) {
    result.processing_time_ms = doc["processing_time_ms"].get<double>();
  }
  return result;
}

// **----- HttpDetectionClient -----**

HttpDetectionClient::HttpDetectionClient(DetectionClientOptions opts)
    : opts_(std::move(opts)) {}

DetectionResult HttpDetectionClient::process(const ChunkDescriptor &chunk) {
  DetectionRequest request = build_detection_request(chunk, opts_);

  for (const auto &target : {request.output_video_path, request.output_json_path}) {
    std::error_code ec;
    fs::create_directories(fs::path(target).parent_path(), ec);
    if (ec) {
      throw DetectionError(fmt::format("cannot create output directory for {}: {}",
                                       target, ec.message()));
    }
  }

  httplib::Client cli(opts_.base_url);
  cli.set_connection_timeout(static_cast<time_t>(opts_.connect_timeout.count()), 0);
  cli.set_read_timeout(static_cast<time_t>(opts_.read_timeout.count()), 0);

  LOG_DEBUG("[Detection] POST {}{} chunk={}", opts_.base_url, PROCESS_ENDPOINT,
            chunk.id);
  auto res = cli.Post(PROCESS_ENDPOINT, detection_request_body(request),
                      "application/json");
  if (!res) {
    throw DetectionError(fmt::format("detection service unreachable: {}",
                                     httplib::to_string(res.error())));
  }
  if (res->status < 200 || res->status >= 300) {
    throw DetectionError(
        fmt::format("detection service responded with status {}", res->status),
        res->status);
  }
  return parse_detection_response(res->body, request);
}

} // namespace live_chunker
