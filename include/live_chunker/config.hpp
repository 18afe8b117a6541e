/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/live_chunker.env for detailed documentation of each
 *          parameter.
 *
 * @note Malformed numeric values raise std::invalid_argument (from std::stoi
 *       and friends) on first access, which happens during startup when the
 *       component options are built.
 */

#ifndef LIVE_CHUNKER_CONFIG_HPP
#define LIVE_CHUNKER_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace live_chunker {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a 64-bit integer value from environment variable.
 */
inline long long get_env_long(const char *name, long long default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoll(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Raw value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : default_val;
}

// **----- Paths -----**

/// Transcoder binary used for both HLS publishing and chunk extraction
inline const std::string &ffmpeg_binary() {
  static std::string val = get_env_string("FFMPEG_BINARY", "ffmpeg");
  return val;
}

/// Root under which each stream gets <root>/<stream_id>/playlist.m3u8
inline const std::string &output_path() {
  static std::string val =
      get_env_string("OUTPUT_PATH", "/tmp/live_chunker/streams");
  return val;
}

/// Directory for extracted chunk files
inline const std::string &chunk_output_path() {
  static std::string val =
      get_env_string("CHUNK_OUTPUT_PATH", "/tmp/live_chunker/chunks");
  return val;
}

/// Directory for detection outputs (processed video + detections json)
inline const std::string &processed_output_path() {
  static std::string val =
      get_env_string("PROCESSED_OUTPUT_PATH", "/tmp/live_chunker/processed");
  return val;
}

/// Stream catalog file
inline const std::string &streams_file() {
  static std::string val = get_env_string("STREAMS_FILE", "streams.json");
  return val;
}

// **----- HLS Publishing -----**

/// HLS segment length in seconds
inline int segment_duration() {
  static int val = get_env_int("SEGMENT_DURATION", 2);
  return val;
}

/// Segments kept in the live playlist window
inline int playlist_size() {
  static int val = get_env_int("PLAYLIST_SIZE", 6);
  return val;
}

/// Max video bitrate passed to -maxrate
inline const std::string &bitrate() {
  static std::string val = get_env_string("BITRATE", "2M");
  return val;
}

// **----- Supervision -----**

/// Concurrent supervised streams
inline int max_streams() {
  static int val = get_env_int("MAX_STREAMS", 10);
  return val;
}

/// Delay before a starting process is declared active
inline int start_verify_ms() {
  static int val = get_env_int("START_VERIFY_MS", 2000);
  return val;
}

/// Delay before a crashed process is relaunched
inline int restart_delay_ms() {
  static int val = get_env_int("RESTART_DELAY_MS", 5000);
  return val;
}

/// Spontaneous restart cap
inline int max_restarts() {
  static int val = get_env_int("MAX_RESTARTS", 3);
  return val;
}

/// SIGTERM grace before SIGKILL
inline int stop_grace_ms() {
  static int val = get_env_int("STOP_GRACE_MS", 2000);
  return val;
}

/// Network feed connect timeout in microseconds (ffmpeg -timeout)
inline long long rtsp_timeout_us() {
  static long long val = get_env_long("RTSP_TIMEOUT_US", 10000000LL);
  return val;
}

// **----- Health -----**

inline int health_check_interval_ms() {
  static int val = get_env_int("HEALTH_CHECK_INTERVAL_MS", 30000);
  return val;
}

/// Playlist older than this is stale
inline int freshness_threshold_ms() {
  static int val = get_env_int("FRESHNESS_THRESHOLD_MS", 10000);
  return val;
}

/// New streams are exempt from the freshness check for this long
inline int health_startup_grace_ms() {
  static int val = get_env_int("HEALTH_STARTUP_GRACE_MS", 15000);
  return val;
}

// **----- Chunking -----**

inline double chunk_duration() {
  static double val = get_env_double("CHUNK_DURATION", 10.0);
  return val;
}

inline double chunk_overlap() {
  static double val = get_env_double("CHUNK_OVERLAP", 1.0);
  return val;
}

/// Seconds before a stream's first chunk tick
inline double processing_delay() {
  static double val = get_env_double("PROCESSING_DELAY", 20.0);
  return val;
}

inline int extraction_timeout_ms() {
  static int val = get_env_int("EXTRACTION_TIMEOUT_MS", 30000);
  return val;
}

/// Concurrent chunk extractions
inline int extraction_workers() {
  static int val = get_env_int("EXTRACTION_WORKERS", 4);
  return val;
}

/// Open each extracted chunk with libavformat before handing it off
inline bool probe_chunks() {
  static bool val = get_env_int("PROBE_CHUNKS", 0) != 0;
  return val;
}

// **----- Retention -----**

inline double chunk_retention_hours() {
  static double val = get_env_double("CHUNK_RETENTION_HOURS", 24.0);
  return val;
}

inline int retention_interval_ms() {
  static int val = get_env_int("RETENTION_INTERVAL_MS", 3600000);
  return val;
}

// **----- Processing Queue -----**

/// Detection workers; 0 means one per available CPU
inline int queue_concurrency() {
  static int val = get_env_int("QUEUE_CONCURRENCY", 3);
  return val;
}

inline int max_queue_size() {
  static int val = get_env_int("MAX_QUEUE_SIZE", 1000);
  return val;
}

inline int max_attempts() {
  static int val = get_env_int("MAX_ATTEMPTS", 3);
  return val;
}

/// Exponential backoff base between attempts
inline int retry_backoff_ms() {
  static int val = get_env_int("RETRY_BACKOFF_MS", 2000);
  return val;
}

inline int completed_history() {
  static int val = get_env_int("COMPLETED_HISTORY", 10);
  return val;
}

inline int failed_history() {
  static int val = get_env_int("FAILED_HISTORY", 25);
  return val;
}

/// JSONL journal of terminally failed jobs (empty disables)
inline const std::string &failed_jobs_file() {
  static std::string val = get_env_string("FAILED_JOBS_FILE", "");
  return val;
}

// **----- Detection Service -----**

inline const std::string &ml_service_url() {
  static std::string val =
      get_env_string("ML_SERVICE_URL", "http://localhost:8002");
  return val;
}

inline int ml_request_timeout_sec() {
  static int val = get_env_int("ML_REQUEST_TIMEOUT_SEC", 60);
  return val;
}

inline int frame_interval() {
  static int val = get_env_int("FRAME_INTERVAL", 1);
  return val;
}

// **----- Aggregate Health -----**

inline int degraded_queue_depth() {
  static int val = get_env_int("DEGRADED_QUEUE_DEPTH", 500);
  return val;
}

inline int degraded_extractions() {
  static int val = get_env_int("DEGRADED_EXTRACTIONS", 10);
  return val;
}

// **----- Daemon -----**

inline int control_port() {
  static int val = get_env_int("CONTROL_PORT", 8001);
  return val;
}

inline const std::string &log_level() {
  static std::string val = get_env_string("LOG_LEVEL", "info");
  return val;
}

} // namespace Config
} // namespace live_chunker

#endif // LIVE_CHUNKER_CONFIG_HPP
