/**
 * @file classifier.hpp
 * @brief Semantic classification of media files
 *
 * @details Derives kind (movie / episode), canonical title, season/episode
 *          numbers and a language bucket from the file name, using the
 *          container inspector's track table as the second source of truth.
 *
 * @attention LANGUAGE PRIORITY:
 *
 *   1. Language tokens in the file name (malayalam, mal, english, eng,
 *      tamil, hindi, ...). More than one language named -> Mixed.
 *
 *   2. Dominant audio language (plurality of tagged audio tracks; ties go
 *      to the bucket whose first track comes first).
 *
 *   3. Other.
 */

#ifndef MEDIA_RELAY_CLASSIFIER_HPP
#define MEDIA_RELAY_CLASSIFIER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace media_relay {

/**
 * @struct EpisodeMarker
 * @brief Position and numbers of a season/episode marker in a name.
 */
struct EpisodeMarker {
  int season = -1;
  int episode = -1;
  size_t position = 0; //< Offset of the marker in the searched string
};

/**
 * @brief Find a season/episode marker.
 * @note Recognized forms: S01E02, Season 1 Episode 2, 1x02, Ep 02 /
 *       Episode 02 (season defaults to 1).
 * @return false when the name carries no marker
 */
bool find_episode_marker(const std::string &name, EpisodeMarker &marker);

/**
 * @brief Language buckets named by whole tokens of a file name.
 * @return Distinct buckets in order of first appearance
 */
std::vector<Language> filename_languages(const std::string &name);

/**
 * @brief Plurality bucket of the tagged audio tracks.
 * @note Untagged ("", "und") tracks do not vote. No tagged audio -> Other.
 */
Language dominant_audio_language(const std::vector<Track> &tracks);

/**
 * @brief Human readable title of a release name.
 * @param stem File name without extension
 * @param year Output: release year, -1 if none
 */
std::string canonical_title(const std::string &stem, int &year);

/**
 * @class Classifier
 * @brief Stateless classification of one inspected file.
 */
class Classifier {
public:
  /**
   * @brief Classify a file.
   * @param path Source path (only the file name is interpreted)
   * @param size File size in bytes
   * @param info Inspector output, nullptr if inspection failed
   * @return Populated MediaFile; kind is Unknown when no rule decides
   */
  static MediaFile classify(const std::string &path, uint64_t size,
                            const MediaInfo *info);
};

} // namespace media_relay

#endif // MEDIA_RELAY_CLASSIFIER_HPP
