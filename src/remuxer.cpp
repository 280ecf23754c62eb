/**
 * @file remuxer.cpp
 * @brief Track selection and libavformat stream copy
 */

#include "media_relay/remuxer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <fmt/core.h>

#include "av_context.hpp"
#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Remove a partial output, logging (not failing) if that fails too
void discard_partial(const std::string &partial) {
  std::error_code ec;
  fs::remove(partial, ec);
  if (ec)
    LOG_WARN("Remux: could not remove {}: {}", partial, ec.message());
}

} // namespace

// **----- TRACK SELECTION -----**

bool language_matches(const std::string &tag,
                      const std::vector<std::string> &wanted) {
  if (is_untagged(tag))
    return false;

  Language bucket = language_bucket(tag);
  std::string lower = to_lower(tag);
  for (const auto &w : wanted) {
    Language want = language_bucket(w);
    if (want != Language::Other) {
      if (bucket == want)
        return true;
    } else if (lower == to_lower(w)) {
      return true;
    }
  }
  return false;
}

TrackSelection select_tracks(const MediaFile &file,
                             const LanguagePolicy &policy) {
  TrackSelection sel;

  for (const auto &t : file.tracks) {
    switch (t.type) {
    case TrackType::Video:
      sel.keep.push_back(t.index);
      break;
    case TrackType::Audio:
      if (language_matches(t.language, policy.audio_languages)) {
        sel.keep.push_back(t.index);
        ++sel.matched_audio;
      } else {
        ++sel.dropped_audio;
      }
      break;
    case TrackType::Subtitle:
      if (policy.subtitle_languages.empty() ||
          language_matches(t.language, policy.subtitle_languages)) {
        sel.keep.push_back(t.index);
      } else {
        ++sel.dropped_subtitles;
      }
      break;
    case TrackType::Other:
      ++sel.dropped_other;
      break;
    }
  }

  /// Never produce a file without audio: no match means keep the original
  sel.needs_remux = policy.enabled && sel.matched_audio > 0 &&
                    (sel.dropped_audio > 0 || sel.dropped_subtitles > 0);
  return sel;
}

std::string remux_path_for(const std::string &temp_dir,
                           const std::string &source_path, int64_t record_id) {
  fs::path src(source_path);
  std::string name = fmt::format("{}.{}.remux{}", src.stem().string(),
                                 record_id, src.extension().string());
  return (fs::path(temp_dir) / name).string();
}

int mapped_stream_index(const std::vector<int> &stream_map, int input_index) {
  /// MPEG-TS may announce streams after the header was read
  if (input_index < 0 || input_index >= static_cast<int>(stream_map.size()))
    return -1;
  return stream_map[input_index];
}

// **----- REMUX -----**

ErrorKind Remuxer::remux(const std::string &source_path,
                         const TrackSelection &selection,
                         const std::string &output_path,
                         const CancellationToken *cancel) {
  std::error_code ec;
  if (!fs::is_regular_file(source_path, ec))
    return ErrorKind::NotFound;

  const std::string partial = output_path + ".partial";
  fs::create_directories(fs::path(output_path).parent_path(), ec);
  discard_partial(partial);

  ErrorKind result = ErrorKind::RemuxFailed;
  {
    av::InputContext input;
    int ret = input.open(source_path);
    if (ret < 0) {
      LOG_ERROR("Remux: cannot open {}: {}", source_path, av::error_string(ret));
      return ErrorKind::RemuxFailed;
    }

    av::OutputContext output;
    ret = output.allocate(output_path);
    if (ret < 0 || !output.get()) {
      LOG_ERROR("Remux: no muxer for {}: {}", output_path,
                av::error_string(ret));
      return ErrorKind::RemuxFailed;
    }

    /// Input stream index -> output stream index, -1 = dropped
    std::vector<int> stream_map(input->nb_streams, -1);
    bool default_audio_kept = false;
    int first_audio_out = -1;

    for (int src_index : selection.keep) {
      if (src_index < 0 || src_index >= static_cast<int>(input->nb_streams)) {
        LOG_ERROR("Remux: stream {} not in {}", src_index, source_path);
        return ErrorKind::RemuxFailed;
      }
      AVStream *in_st = input->streams[src_index];
      AVStream *out_st = avformat_new_stream(output.get(), nullptr);
      if (!out_st)
        return ErrorKind::RemuxFailed;

      if (avcodec_parameters_copy(out_st->codecpar, in_st->codecpar) < 0)
        return ErrorKind::RemuxFailed;
      out_st->codecpar->codec_tag = 0; //< Let the muxer choose
      out_st->time_base = in_st->time_base;
      out_st->disposition = in_st->disposition;
      av_dict_copy(&out_st->metadata, in_st->metadata, 0);

      stream_map[src_index] = out_st->index;
      if (in_st->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
        if (first_audio_out < 0)
          first_audio_out = out_st->index;
        if (in_st->disposition & AV_DISPOSITION_DEFAULT)
          default_audio_kept = true;
      }
    }

    /// The dropped track may have been the default one
    if (!default_audio_kept && first_audio_out >= 0) {
      output->streams[first_audio_out]->disposition |= AV_DISPOSITION_DEFAULT;
    }

    av_dict_copy(&output->metadata, input->metadata, 0);

    ret = output.open_file(partial);
    if (ret < 0) {
      LOG_ERROR("Remux: cannot create {}: {}", partial, av::error_string(ret));
      return ErrorKind::RemuxFailed;
    }

    ret = avformat_write_header(output.get(), nullptr);
    if (ret < 0) {
      LOG_ERROR("Remux: header rejected for {}: {}", output_path,
                av::error_string(ret));
      output.close();
      discard_partial(partial);
      return ErrorKind::RemuxFailed;
    }

    av::Packet pkt;
    result = ErrorKind::None;
    while (true) {
      if (cancel && cancel->requested()) {
        result = ErrorKind::Cancelled;
        break;
      }

      ret = av_read_frame(input.get(), pkt.get());
      if (ret == AVERROR_EOF)
        break;
      if (ret < 0) {
        LOG_ERROR("Remux: read error in {}: {}", source_path,
                  av::error_string(ret));
        result = ErrorKind::RemuxFailed;
        break;
      }

      int out_index = mapped_stream_index(stream_map, pkt->stream_index);
      if (out_index < 0) {
        av_packet_unref(pkt.get());
        continue;
      }

      AVStream *in_st = input->streams[pkt->stream_index];
      AVStream *out_st = output->streams[out_index];
      pkt->stream_index = out_index;
      av_packet_rescale_ts(pkt.get(), in_st->time_base, out_st->time_base);
      pkt->pos = -1;

      ret = av_interleaved_write_frame(output.get(), pkt.get());
      av_packet_unref(pkt.get());
      if (ret < 0) {
        LOG_ERROR("Remux: write error in {}: {}", partial,
                  av::error_string(ret));
        result = ErrorKind::RemuxFailed;
        break;
      }
    }

    if (result == ErrorKind::None) {
      ret = av_write_trailer(output.get());
      if (ret < 0) {
        LOG_ERROR("Remux: trailer failed for {}: {}", partial,
                  av::error_string(ret));
        result = ErrorKind::RemuxFailed;
      }
    }
    output.close();
  }

  if (result != ErrorKind::None) {
    discard_partial(partial);
    return result;
  }

  fs::rename(partial, output_path, ec);
  if (ec) {
    LOG_ERROR("Remux: rename {} -> {} failed: {}", partial, output_path,
              ec.message());
    discard_partial(partial);
    return ErrorKind::RemuxFailed;
  }

  LOG_INFO("Remuxed {} -> {} ({} streams kept)", source_path, output_path,
           selection.keep.size());
  return ErrorKind::None;
}

} // namespace media_relay
