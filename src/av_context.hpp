/**
 * @file av_context.hpp
 * @brief Internal RAII owners for libavformat contexts
 *
 * @note Private to the library sources; public headers never include FFmpeg.
 */

#ifndef MEDIA_RELAY_AV_CONTEXT_HPP
#define MEDIA_RELAY_AV_CONTEXT_HPP

#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

namespace media_relay {
namespace av {

/// av_strerror as a std::string
inline std::string error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

/**
 * @class InputContext
 * @brief Owns an opened demuxer; closed on destruction.
 */
class InputContext {
  AVFormatContext *ctx_ = nullptr;

public:
  InputContext() = default;
  ~InputContext() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  InputContext(const InputContext &) = delete;
  InputContext &operator=(const InputContext &) = delete;

  /**
   * @brief Open a file and read its stream table.
   * @param options Demuxer options (consumed)
   * @return libav error code, >= 0 on success
   */
  int open(const std::string &path, AVDictionary **options = nullptr) {
    int ret = avformat_open_input(&ctx_, path.c_str(), nullptr, options);
    if (ret < 0)
      return ret;
    return avformat_find_stream_info(ctx_, nullptr);
  }

  AVFormatContext *get() const { return ctx_; }
  AVFormatContext *operator->() const { return ctx_; }
};

/**
 * @class OutputContext
 * @brief Owns a muxer and its AVIO handle.
 */
class OutputContext {
  AVFormatContext *ctx_ = nullptr;

public:
  OutputContext() = default;
  ~OutputContext() { close(); }

  OutputContext(const OutputContext &) = delete;
  OutputContext &operator=(const OutputContext &) = delete;

  /**
   * @brief Allocate a muxer.
   * @param format_hint_path Path whose extension selects the muxer
   * @param format_name Explicit muxer name (nullptr = guess from path)
   */
  int allocate(const std::string &format_hint_path,
               const char *format_name = nullptr) {
    return avformat_alloc_output_context2(&ctx_, nullptr, format_name,
                                          format_hint_path.c_str());
  }

  /// Open the byte sink at write_path (may differ from the hint path)
  int open_file(const std::string &write_path) {
    if (ctx_->oformat->flags & AVFMT_NOFILE)
      return 0;
    return avio_open(&ctx_->pb, write_path.c_str(), AVIO_FLAG_WRITE);
  }

  void close() {
    if (!ctx_)
      return;
    if (!(ctx_->oformat->flags & AVFMT_NOFILE) && ctx_->pb)
      avio_closep(&ctx_->pb);
    avformat_free_context(ctx_);
    ctx_ = nullptr;
  }

  AVFormatContext *get() const { return ctx_; }
  AVFormatContext *operator->() const { return ctx_; }
};

/**
 * @class Packet
 * @brief Owns an AVPacket.
 */
class Packet {
  AVPacket *pkt_;

public:
  Packet() : pkt_(av_packet_alloc()) {}
  ~Packet() { av_packet_free(&pkt_); }

  Packet(const Packet &) = delete;
  Packet &operator=(const Packet &) = delete;

  AVPacket *get() const { return pkt_; }
  AVPacket *operator->() const { return pkt_; }
};

} // namespace av
} // namespace media_relay

#endif // MEDIA_RELAY_AV_CONTEXT_HPP
