/**
 * @file detection_client.hpp
 * @brief Hand-off of ready chunks to the external detection pipeline
 *
 * @details The pipeline is reached with
 *          POST <ML_SERVICE_URL>/api/process-chunk carrying
 *          {chunk_id, chunk_path, stream_id, output_video_path,
 *           output_json_path, frame_interval, start_time}.
 *
 *          Any transport error or non-2xx answer raises DetectionError, which
 *          the processing queue turns into a retry.
 */

#ifndef LIVE_CHUNKER_DETECTION_CLIENT_HPP
#define LIVE_CHUNKER_DETECTION_CLIENT_HPP

#include <chrono>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace live_chunker {

class DetectionError : public std::runtime_error {
public:
  explicit DetectionError(const std::string &what, int http_status = 0)
      : std::runtime_error(what), http_status_(http_status) {}

  /// 0 for transport failures
  int http_status() const { return http_status_; }

private:
  int http_status_;
};

struct DetectionClientOptions {
  std::string base_url = "http://localhost:8002";
  std::string processed_root = "/tmp/live_chunker/processed";
  int frame_interval = 1;
  std::chrono::seconds connect_timeout{5};
  std::chrono::seconds read_timeout{60};

  static DetectionClientOptions from_env();
};

/**
 * @struct DetectionRequest
 * @brief Body of one process-chunk call.
 */
struct DetectionRequest {
  std::string chunk_id;
  std::string chunk_path;
  std::string stream_id;
  std::string output_video_path; //< <root>/<stream>/processed/<base>_processed.mp4
  std::string output_json_path;  //< <root>/<stream>/detections/<base>_detections.json
  int frame_interval = 1;
  double start_time = 0.0;
};

DetectionRequest build_detection_request(const ChunkDescriptor &chunk,
                                         const DetectionClientOptions &opts);

/// JSON body for a request
std::string detection_request_body(const DetectionRequest &request);

/**
 * @brief Read the pipeline's answer.
 * @note Accepts "detection_count" or a "detections" array, and
 *       "processing_time_ms"; missing fields default to zero.
 * @throws DetectionError if the body is not a JSON object
 */
DetectionResult parse_detection_response(const std::string &body,
                                         const DetectionRequest &request);

/**
 * @class DetectionClient
 * @brief Seam between the queue and the pipeline.
 */
class DetectionClient {
public:
  virtual ~DetectionClient() = default;

  /**
   * @brief Process one chunk.
   * @throws DetectionError (or any std::exception) on failure
   */
  virtual DetectionResult process(const ChunkDescriptor &chunk) = 0;
};

/**
 * @class HttpDetectionClient
 * @brief cpp-httplib implementation.
 *
 * @note A client is created per call; calls from different queue workers
 *       share nothing.
 */
class HttpDetectionClient : public DetectionClient {
public:
  explicit HttpDetectionClient(DetectionClientOptions opts);

  DetectionResult process(const ChunkDescriptor &chunk) override;

private:
  DetectionClientOptions opts_;
};

} // namespace live_chunker

#endif // LIVE_CHUNKER_DETECTION_CLIENT_HPP
