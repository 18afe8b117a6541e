/**
 * @file media_probe.cpp
 * @brief Chunk verification with libavformat/libavcodec
 */

#include "live_chunker/media_probe.hpp"

#include <utility>

extern "C" {
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "live_chunker/logging.hpp"

namespace live_chunker {

namespace {

/// Upper bound on packets read while looking for the first picture
constexpr int MAX_PROBE_PACKETS = 512;

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

MediaProbe::MediaProbe(std::string path) : path(std::move(path)) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
}

MediaProbe::~MediaProbe() {
  /// Free decoder context first
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_frame_free(&frame);
  av_packet_free(&pkt);
}

ProbeResult MediaProbe::run() {
  ProbeResult result;
  if (!frame || !pkt) {
    result.error = "out of memory";
    return result;
  }
  if (!open(result))
    return result;
  if (!decode_first_frame(result))
    return result;
  result.ok = true;
  return result;
}

bool MediaProbe::open(ProbeResult &result) {
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    result.error = fmt::format("avformat_open_input: {}", av_error_string(ret));
    return false;
  }

  /// Find stream info (reads some packets to determine streams)
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    result.error =
        fmt::format("avformat_find_stream_info: {}", av_error_string(ret));
    return false;
  }

  result.duration = (fmt_ctx->duration != AV_NOPTS_VALUE)
                        ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
                        : 0.0;

  /// Find the best video stream
  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    result.error = "no video stream";
    return false;
  }

  /// Discard non-video streams
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  result.width = param->width;
  result.height = param->height;
  result.codec = avcodec_get_name(param->codec_id);

  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    result.error = fmt::format("no decoder for {}", result.codec);
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    result.error = "failed to allocate decoder context";
    return false;
  }
  ret = avcodec_parameters_to_context(dec_ctx, param);
  if (ret < 0) {
    result.error =
        fmt::format("avcodec_parameters_to_context: {}", av_error_string(ret));
    return false;
  }

  /// Single-threaded; probes run inside extraction workers already
  dec_ctx->thread_count = 1;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0) {
    result.error = fmt::format("avcodec_open2: {}", av_error_string(ret));
    return false;
  }
  return true;
}

bool MediaProbe::decode_first_frame(ProbeResult &result) {
  int packets = 0;
  while (packets < MAX_PROBE_PACKETS && av_read_frame(fmt_ctx, pkt) >= 0) {
    if (pkt->stream_index != video_stream_idx) {
      av_packet_unref(pkt);
      continue;
    }
    ++packets;

    int send_ret = avcodec_send_packet(dec_ctx, pkt);
    av_packet_unref(pkt);
    if (send_ret < 0 && send_ret != AVERROR(EAGAIN))
      continue;

    if (avcodec_receive_frame(dec_ctx, frame) == 0) {
      av_frame_unref(frame);
      return true;
    }
  }

  /// Drain: a short chunk may only yield its picture on flush
  avcodec_send_packet(dec_ctx, nullptr);
  if (avcodec_receive_frame(dec_ctx, frame) == 0) {
    av_frame_unref(frame);
    return true;
  }

  result.error = fmt::format("no decodable frame in {} packets", packets);
  return false;
}

ProbeResult probe_media(const std::string &path) {
  MediaProbe probe(path);
  ProbeResult result = probe.run();
  if (!result.ok) {
    LOG_DEBUG("[Probe] {}: {}", path, result.error);
  }
  return result;
}

} // namespace live_chunker
