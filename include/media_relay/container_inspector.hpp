/**
 * @file container_inspector.hpp
 * @brief Structural metadata extraction from media containers
 *
 * @details Uses libavformat to open a container and read its stream table
 *          (type, language tag, codec, resolution, duration). Only headers
 *          and index structures are read: probing is bounded by
 *          probe_bytes / analyze_us so that multi-GB files cost the same
 *          as small ones.
 */

#ifndef MEDIA_RELAY_CONTAINER_INSPECTOR_HPP
#define MEDIA_RELAY_CONTAINER_INSPECTOR_HPP

#include <cstdint>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace media_relay {

/**
 * @brief Map a frame height to the usual resolution label.
 * @return "4K", "2K", "1080p", "720p", "480p" or "WxH" below 480 lines;
 *         empty when the size is unknown
 */
std::string resolution_label(int width, int height);

/// Normalize codec short names (h264 -> H.264, hevc -> H.265)
std::string codec_label(const std::string &codec);

/**
 * @class ContainerInspector
 * @brief Read-only probe of a media container.
 */
class ContainerInspector {
  int64_t probe_bytes_;
  int64_t analyze_us_;

public:
  /**
   * @param probe_bytes Maximum bytes read while probing (libavformat probesize)
   * @param analyze_us Maximum stream analysis span in microseconds
   */
  explicit ContainerInspector(int64_t probe_bytes = 5 * 1024 * 1024,
                              int64_t analyze_us = 5 * 1000000LL);

  /**
   * @brief Inspect a container.
   * @param path Local file path
   * @param info Output: stream table in source order
   * @return None, NotFound, or UnreadableContainer
   */
  ErrorKind inspect(const std::string &path, MediaInfo &info) const;

  /**
   * @brief SHA-256 over every packet payload of one stream.
   * @note Reads the whole file. Used to check that a remux copied a stream
   *       bit-for-bit; not part of inspection.
   * @param path Local file path
   * @param stream_index Stream to hash
   * @param hex Output: digest
   * @param packets Output: number of packets hashed
   */
  static ErrorKind stream_digest(const std::string &path, int stream_index,
                                 std::string &hex, long &packets);
};

} // namespace media_relay

#endif // MEDIA_RELAY_CONTAINER_INSPECTOR_HPP
