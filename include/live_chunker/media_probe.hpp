/**
 * @file media_probe.hpp
 * @brief libavformat/libavcodec verification of extracted chunks
 *
 * @details A chunk can come out of `ffmpeg -c copy` with a valid size yet no
 *          decodable video (cut before the first keyframe, truncated moov).
 *          MediaProbe opens the file, locates the video stream and decodes
 *          frames until the first picture comes out.
 *
 * @attention THREAD MODEL:
 *            - Each extraction creates its own MediaProbe instance.
 *
 *            - FFmpeg decoder state is not shared between threads.
 */

#ifndef LIVE_CHUNKER_MEDIA_PROBE_HPP
#define LIVE_CHUNKER_MEDIA_PROBE_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <string>

namespace live_chunker {

/**
 * @struct ProbeResult
 * @brief What the probe learned about a media file.
 */
struct ProbeResult {
  bool ok = false;
  double duration = 0.0; //< Container duration in seconds
  int width = 0;
  int height = 0;
  std::string codec;
  std::string error;     //< Set when ok is false
};

/**
 * @class MediaProbe
 * @brief Opens one media file and decodes its first video frame.
 */
class MediaProbe {
public:
  explicit MediaProbe(std::string path);
  ~MediaProbe();

  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open, find the video stream and decode one frame.
   * @return Populated result; never throws
   */
  ProbeResult run();

private:
  bool open(ProbeResult &result);
  bool decode_first_frame(ProbeResult &result);

  std::string path;
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;
};

/// Convenience wrapper: MediaProbe(path).run()
ProbeResult probe_media(const std::string &path);

} // namespace live_chunker

#endif // LIVE_CHUNKER_MEDIA_PROBE_HPP
