/**
 * @file path_builder.hpp
 * @brief Destination path mapping on the share
 *
 * @details Maps (kind, language) to one of four configured prefixes:
 *
 *          |            | English / Other    | Malayalam           |
 *          |------------|--------------------|---------------------|
 *          | Movie      | english_movies     | malayalam_movies    |
 *          | Episode    | english_tv         | malayalam_tv        |
 *
 *          Mixed files use the row of their dominant audio language.
 */

#ifndef MEDIA_RELAY_PATH_BUILDER_HPP
#define MEDIA_RELAY_PATH_BUILDER_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @struct DestinationTemplate
 * @brief Relative destination prefixes on the share.
 */
struct DestinationTemplate {
  std::string english_movies = "movies";
  std::string english_tv = "tv-shows";
  std::string malayalam_movies = "malayalam-movies";
  std::string malayalam_tv = "malayalam-tv-shows";

  /// Place episodes under <prefix>/<Title>/Season NN/
  bool organize_episodes = false;

  /**
   * @brief Check that the four prefixes are usable.
   * @param problems Output: one message per violation
   * @return true when every prefix is non-empty, relative, and no prefix
   *         equals or contains another
   */
  bool validate(std::vector<std::string> &problems) const;
};

/// Replace characters SMB rejects (\ : * ? " < > |) with '_'
std::string sanitize_component(const std::string &name);

/// Collapse duplicate and surrounding slashes of a relative prefix
std::string normalize_prefix(const std::string &prefix);

/**
 * @brief Language that decides the destination row.
 * @note Other -> English; Mixed -> dominant audio language (Other -> English).
 */
Language routing_language(const MediaFile &file);

/**
 * @brief Build the relative destination of a classified file.
 * @param file Classified media; the remuxed file keeps the source name
 * @param tmpl Destination prefixes
 * @param out Output: relative path using '/' separators
 * @return None, or UnclassifiedMedia when kind is Unknown
 */
ErrorKind build_destination(const MediaFile &file,
                            const DestinationTemplate &tmpl, std::string &out);

} // namespace media_relay

#endif // MEDIA_RELAY_PATH_BUILDER_HPP
