/**
 * @file segment_publisher.hpp
 * @brief HLS output layout, playlist inspection and segment trimming
 *
 * @details Each supervised stream owns <output_root>/<stream_id>/ holding
 *          playlist.m3u8 and segment_%03d.ts. This module builds the ffmpeg
 *          output section for that layout and answers the questions the
 *          health monitor and retention sweeper ask about it.
 */

#ifndef LIVE_CHUNKER_SEGMENT_PUBLISHER_HPP
#define LIVE_CHUNKER_SEGMENT_PUBLISHER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace live_chunker {

constexpr const char *PLAYLIST_NAME = "playlist.m3u8";
constexpr const char *SEGMENT_PATTERN = "segment_%03d.ts";

struct PublisherOptions {
  int segment_duration = 2; //< -hls_time
  int playlist_size = 6;    //< -hls_list_size
  std::string bitrate = "2M";

  static PublisherOptions from_env();
};

/**
 * @struct PlaylistHealth
 * @brief Result of inspecting a stream's playlist.
 */
struct PlaylistHealth {
  bool playlist_exists = false;
  int segment_count = 0;           //< Lines ending in ".ts"
  int64_t last_write_age_ms = -1;  //< -1 when the playlist is missing
  bool healthy = false;            //< segments > 0 and age < threshold
};

/// <output_root>/<stream_id>
std::string stream_output_dir(const std::string &output_root,
                              const std::string &stream_id);

/// <dir>/playlist.m3u8
std::string playlist_path(const std::string &dir);

/**
 * @brief Public locator the playback side serves the playlist under.
 * @note "stream_NNN" ids use the legacy /stream<last char>/ layout.
 */
std::string playlist_locator(const std::string &stream_id);

/**
 * @brief Encoding and HLS muxer arguments writing into @p dir.
 */
std::vector<std::string> hls_output_args(const std::string &dir,
                                         const PublisherOptions &opts);

/**
 * @brief Check playlist freshness.
 * @param dir Stream output directory
 * @param freshness Maximum allowed age of the last playlist write
 */
PlaylistHealth inspect_playlist(const std::string &dir,
                                std::chrono::milliseconds freshness);

/**
 * @brief Create the stream's output directory.
 * @return false (and logs) when it cannot be created
 */
bool prepare_output_dir(const std::string &dir);

/// Remove the output directory and everything in it
void release_output_dir(const std::string &dir);

/**
 * @brief Delete the oldest .ts files when a directory has accumulated more
 *        than twice @p keep of them, leaving the newest @p keep.
 * @return Number of files deleted
 */
int trim_segments(const std::string &dir, int keep);

} // namespace live_chunker

#endif // LIVE_CHUNKER_SEGMENT_PUBLISHER_HPP
