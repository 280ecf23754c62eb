/**
 * @file container_inspector.cpp
 * @brief libavformat-based container inspection
 *
 * @details Opening a container with avformat_open_input reads the header
 *          (EBML/Matroska segment info, MP4 moov, ...). Stream analysis is
 *          capped with the probesize/analyzeduration demuxer options so
 *          nothing close to the full payload is read.
 */

#include "media_relay/container_inspector.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <fmt/core.h>

#include "av_context.hpp"
#include "media_relay/checksum.hpp"
#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

std::string dict_value(AVDictionary *dict, const char *key) {
  AVDictionaryEntry *e = av_dict_get(dict, key, nullptr, 0);
  return e && e->value ? e->value : "";
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

TrackType track_type(AVMediaType type) {
  switch (type) {
  case AVMEDIA_TYPE_VIDEO:
    return TrackType::Video;
  case AVMEDIA_TYPE_AUDIO:
    return TrackType::Audio;
  case AVMEDIA_TYPE_SUBTITLE:
    return TrackType::Subtitle;
  default:
    return TrackType::Other;
  }
}

} // namespace

std::string resolution_label(int width, int height) {
  if (width <= 0 || height <= 0)
    return "";
  if (height >= 2160)
    return "4K";
  if (height >= 1440)
    return "2K";
  if (height >= 1080)
    return "1080p";
  if (height >= 720)
    return "720p";
  if (height >= 480)
    return "480p";
  return fmt::format("{}x{}", width, height);
}

std::string codec_label(const std::string &codec) {
  std::string c = lower(codec);
  if (c == "h264" || c == "avc" || c == "libx264")
    return "H.264";
  if (c == "hevc" || c == "h265" || c == "libx265")
    return "H.265";
  return codec;
}

ContainerInspector::ContainerInspector(int64_t probe_bytes, int64_t analyze_us)
    : probe_bytes_(probe_bytes), analyze_us_(analyze_us) {}

ErrorKind ContainerInspector::inspect(const std::string &path,
                                      MediaInfo &info) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    LOG_WARN("Inspector: not found: {}", path);
    return ErrorKind::NotFound;
  }

  AVDictionary *options = nullptr;
  av_dict_set_int(&options, "probesize", probe_bytes_, 0);
  av_dict_set_int(&options, "analyzeduration", analyze_us_, 0);

  av::InputContext input;
  int ret = input.open(path, &options);
  av_dict_free(&options);
  if (ret < 0) {
    LOG_WARN("Inspector: cannot read {}: {}", path, av::error_string(ret));
    return ErrorKind::UnreadableContainer;
  }

  info = MediaInfo{};
  info.format_name = input->iformat ? input->iformat->name : "";
  if (input->duration != AV_NOPTS_VALUE && input->duration > 0) {
    info.duration_sec = static_cast<double>(input->duration) / AV_TIME_BASE;
  }

  for (unsigned int i = 0; i < input->nb_streams; ++i) {
    const AVStream *st = input->streams[i];
    const AVCodecParameters *par = st->codecpar;

    Track t;
    t.index = static_cast<int>(i);
    t.type = track_type(par->codec_type);
    t.language = lower(dict_value(st->metadata, "language"));
    t.title = dict_value(st->metadata, "title");
    t.codec = avcodec_get_name(par->codec_id);
    t.is_default = (st->disposition & AV_DISPOSITION_DEFAULT) != 0;

    if (t.type == TrackType::Video) {
      /// Cover art is stored as a video stream; it is not the movie
      if (st->disposition & AV_DISPOSITION_ATTACHED_PIC)
        t.type = TrackType::Other;
      t.width = par->width;
      t.height = par->height;
    } else if (t.type == TrackType::Audio) {
      t.channels = par->ch_layout.nb_channels;
    }

    if (t.type == TrackType::Video && info.video_codec.empty()) {
      info.video_codec = t.codec;
      info.video_width = t.width;
      info.video_height = t.height;
    }
    info.tracks.push_back(std::move(t));
  }

  return ErrorKind::None;
}

ErrorKind ContainerInspector::stream_digest(const std::string &path,
                                            int stream_index, std::string &hex,
                                            long &packets) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return ErrorKind::NotFound;

  av::InputContext input;
  if (input.open(path) < 0)
    return ErrorKind::UnreadableContainer;
  if (stream_index < 0 ||
      stream_index >= static_cast<int>(input->nb_streams))
    return ErrorKind::UnreadableContainer;

  Sha256 sha;
  packets = 0;
  av::Packet pkt;
  while (av_read_frame(input.get(), pkt.get()) >= 0) {
    if (pkt->stream_index == stream_index) {
      sha.update(pkt->data, static_cast<size_t>(pkt->size));
      ++packets;
    }
    av_packet_unref(pkt.get());
  }
  hex = sha.hex_digest();
  return ErrorKind::None;
}

} // namespace media_relay
