/**
 * @file segment_publisher.cpp
 * @brief HLS layout and playlist inspection implementation
 */

#include "live_chunker/segment_publisher.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fmt/core.h>

#include "live_chunker/config.hpp"
#include "live_chunker/logging.hpp"

namespace fs = std::filesystem;

namespace live_chunker {

PublisherOptions PublisherOptions::from_env() {
  PublisherOptions opts;
  opts.segment_duration = Config::segment_duration();
  opts.playlist_size = Config::playlist_size();
  opts.bitrate = Config::bitrate();
  return opts;
}

std::string stream_output_dir(const std::string &output_root,
                              const std::string &stream_id) {
  return (fs::path(output_root) / stream_id).string();
}

std::string playlist_path(const std::string &dir) {
  return (fs::path(dir) / PLAYLIST_NAME).string();
}

std::string playlist_locator(const std::string &stream_id) {
  if (stream_id.rfind("stream_", 0) == 0 && stream_id.size() > 7) {
    return fmt::format("/stream{}/{}", stream_id.back(), PLAYLIST_NAME);
  }
  return fmt::format("/streams/{}/{}", stream_id, PLAYLIST_NAME);
}

std::vector<std::string> hls_output_args(const std::string &dir,
                                         const PublisherOptions &opts) {
  return {"-c:v",
          "libx264",
          "-preset",
          "veryfast",
          "-crf",
          "23",
          "-maxrate",
          opts.bitrate,
          "-bufsize",
          "2M",
          "-c:a",
          "aac",
          "-b:a",
          "128k",
          "-f",
          "hls",
          "-hls_time",
          std::to_string(opts.segment_duration),
          "-hls_list_size",
          std::to_string(opts.playlist_size),
          "-hls_flags",
          "delete_segments",
          "-hls_segment_filename",
          (fs::path(dir) / SEGMENT_PATTERN).string(),
          playlist_path(dir)};
}

PlaylistHealth inspect_playlist(const std::string &dir,
                                std::chrono::milliseconds freshness) {
  PlaylistHealth health;
  const fs::path path = playlist_path(dir);

  std::error_code ec;
  auto mtime = fs::last_write_time(path, ec);
  if (ec)
    return health;

  std::ifstream in(path);
  if (!in)
    return health;
  health.playlist_exists = true;

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.size() >= 3 && line.compare(line.size() - 3, 3, ".ts") == 0)
      ++health.segment_count;
  }

  auto age = fs::file_time_type::clock::now() - mtime;
  health.last_write_age_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
  health.healthy = health.segment_count > 0 &&
                   health.last_write_age_ms < freshness.count();
  return health;
}

bool prepare_output_dir(const std::string &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Failed to create output directory {}: {}", dir, ec.message());
    return false;
  }
  return true;
}

void release_output_dir(const std::string &dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    LOG_WARN("Failed to remove output directory {}: {}", dir, ec.message());
  }
}

int trim_segments(const std::string &dir, int keep) {
  std::error_code ec;
  std::vector<std::pair<fs::file_time_type, fs::path>> segments;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() != ".ts")
      continue;
    std::error_code stat_ec;
    auto mtime = fs::last_write_time(it->path(), stat_ec);
    if (!stat_ec)
      segments.emplace_back(mtime, it->path());
  }

  if (keep < 0 || segments.size() <= static_cast<size_t>(keep) * 2)
    return 0;

  std::sort(segments.begin(), segments.end(),
            [](const auto &a, const auto &b) {
              if (a.first != b.first)
                return a.first < b.first;
              return a.second < b.second;
            });

  int removed = 0;
  size_t excess = segments.size() - static_cast<size_t>(keep);
  for (size_t i = 0; i < excess; ++i) {
    std::error_code rm_ec;
    if (fs::remove(segments[i].second, rm_ec))
      ++removed;
  }
  LOG_DEBUG("[Retention] Trimmed {} segments in {}", removed, dir);
  return removed;
}

} // namespace live_chunker
