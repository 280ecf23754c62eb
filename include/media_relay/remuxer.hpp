/**
 * @file remuxer.hpp
 * @brief Track selection and stream-copy remuxing
 *
 * @details Produces a new container holding every video stream plus the
 *          audio/subtitle streams that match a LanguagePolicy. Packets are
 *          copied as-is (no decode, no encode), so the video is bit-for-bit
 *          identical to the source.
 *
 * @attention ALL-OR-NOTHING:
 *
 *   - Output is written to "<output>.partial" and renamed on success
 *
 *   - The partial file is deleted on every failure path
 */

#ifndef MEDIA_RELAY_REMUXER_HPP
#define MEDIA_RELAY_REMUXER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @struct LanguagePolicy
 * @brief Which audio and subtitle languages survive a remux.
 * @note Entries are language tags or names ("mal", "english", "tam").
 */
struct LanguagePolicy {
  bool enabled = true;
  std::vector<std::string> audio_languages{"mal"};
  std::vector<std::string> subtitle_languages; //< Empty = keep all subtitles

  /// Transfer the original file when the remux fails
  bool fallback_to_original = true;
};

/**
 * @brief Does a track's language tag match any wanted entry?
 * @note English and Malayalam compare by bucket ("en" matches "english");
 *       other languages compare by tag. Untagged tracks never match.
 */
bool language_matches(const std::string &tag,
                      const std::vector<std::string> &wanted);

/**
 * @struct TrackSelection
 * @brief Result of applying a LanguagePolicy to a track table.
 */
struct TrackSelection {
  std::vector<int> keep; //< Source stream indices, in source order
  int matched_audio = 0;
  int dropped_audio = 0;
  int dropped_subtitles = 0;
  int dropped_other = 0;

  /// At least one audio matched and some audio/subtitle is dropped
  bool needs_remux = false;
};

TrackSelection select_tracks(const MediaFile &file, const LanguagePolicy &policy);

/// temp_dir/<stem>.<record_id>.remux<ext>; same-named sources never collide
std::string remux_path_for(const std::string &temp_dir,
                           const std::string &source_path, int64_t record_id);

/// Output stream of an input packet, or -1 when it is dropped or unknown
int mapped_stream_index(const std::vector<int> &stream_map, int input_index);

/**
 * @class Remuxer
 * @brief Stream-copy remux through libavformat.
 */
class Remuxer {
public:
  /**
   * @brief Write a container holding only the selected streams.
   * @param source_path Input container
   * @param selection Streams to keep
   * @param output_path Final output path; the muxer is chosen from its
   *                    extension
   * @param cancel Optional cancellation token, checked between packets
   * @return None, RemuxFailed, NotFound or Cancelled
   */
  static ErrorKind remux(const std::string &source_path,
                         const TrackSelection &selection,
                         const std::string &output_path,
                         const CancellationToken *cancel = nullptr);
};

} // namespace media_relay

#endif // MEDIA_RELAY_REMUXER_HPP
