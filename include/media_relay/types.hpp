/**
 * @file types.hpp
 * @brief Core data types shared by every pipeline stage
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - MediaKind / Language tagged variants
 *
 *          - Track and MediaInfo (container inspector output)
 *
 *          - MediaFile (classified media)
 *
 *          - PipelineState and PipelineRecord (ledger entity)
 */

#ifndef MEDIA_RELAY_TYPES_HPP
#define MEDIA_RELAY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace media_relay {

// **----- CONSTANTS -----**

/**
 * @brief Default chunk size for remote writes.
 * @note 4MB keeps the number of SMB round trips low on multi-GB files while
 *       bounding the amount of data re-sent after a failed chunk.
 */
constexpr size_t TRANSFER_CHUNK_SIZE = 4 * 1024 * 1024; //< 4MB

/// Suffix of remote files that are still being written
constexpr const char *PARTIAL_SUFFIX = ".part";

// **----- CLASSIFICATION -----**

enum class MediaKind { Movie, Episode, Unknown };

/**
 * @brief Language bucket of a media file.
 * @note Mixed means the file name names more than one language; such files
 *       are routed by their dominant audio language.
 */
enum class Language { English, Malayalam, Other, Mixed };

enum class TrackType { Video, Audio, Subtitle, Other };

const char *to_string(MediaKind kind);
const char *to_string(Language language);
const char *to_string(TrackType type);

bool parse_media_kind(const std::string &text, MediaKind &out);
bool parse_language_name(const std::string &text, Language &out);

/**
 * @brief Map a language tag (ISO 639 code or English name) to a bucket.
 * @note "mal", "ml", "malayalam" -> Malayalam; "eng", "en", "english" ->
 *       English; anything else -> Other. Case-insensitive.
 */
Language language_bucket(const std::string &tag);

/// True for empty and "und" tags
bool is_untagged(const std::string &tag);

// **----- CONTAINER METADATA -----**

/**
 * @struct Track
 * @brief One elementary stream of a container.
 * @note index is the stream index in the source container.
 */
struct Track {
  int index = 0;
  TrackType type = TrackType::Other;
  std::string language; //< Lower-cased language tag, may be empty
  std::string codec;    //< Codec short name (h264, aac, subrip, ...)
  std::string title;
  int width = 0;
  int height = 0;
  int channels = 0;
  bool is_default = false;
};

/**
 * @struct MediaInfo
 * @brief Structural metadata of a container, read from headers only.
 */
struct MediaInfo {
  std::string format_name;
  double duration_sec = 0;
  std::vector<Track> tracks; //< Ordered as in the source container

  int video_width = 0;
  int video_height = 0;
  std::string video_codec;

  size_t count(TrackType type) const;
};

/**
 * @struct MediaFile
 * @brief A source file together with everything the classifier derived.
 */
struct MediaFile {
  std::string source_path;
  uint64_t size = 0;
  std::string content_hash; //< Empty unless dedup is enabled

  MediaKind kind = MediaKind::Unknown;
  Language language = Language::Other;
  Language audio_language = Language::Other; //< Dominant audio bucket

  std::string title;
  int season = -1;
  int episode = -1;
  int year = -1; //< Release year found in the name, movies only

  std::string container;
  double duration_sec = 0;
  std::string resolution; //< 4K, 1080p, ... or WxH
  std::string video_codec;
  std::vector<Track> tracks;

  /// File name component of source_path
  std::string file_name() const;
};

// **----- LEDGER -----**

/**
 * @brief Per-file pipeline state.
 * @note Terminal states: CleanedUp, CleanedUpPartial, Failed, Skipped.
 */
enum class PipelineState {
  Discovered,
  Classified,
  Remuxing,
  Transferring,
  Verified,
  CleanedUp,
  CleanedUpPartial,
  Failed,
  Skipped
};

const char *to_string(PipelineState state);
bool parse_state(const std::string &text, PipelineState &out);
bool is_terminal(PipelineState state);

/// Terminal state that means the file reached the share
bool is_terminal_success(PipelineState state);

/**
 * @struct PipelineRecord
 * @brief One ledger row: one attempt at moving one source file.
 */
struct PipelineRecord {
  int64_t id = 0;
  std::string record_key; //< Source path, or sha256:<hex> with dedup
  std::string source_path;
  PipelineState state = PipelineState::Discovered;
  std::string reason; //< Error kind name for Failed/Skipped/CleanedUpPartial
  std::string destination_path;
  std::string remux_path;
  std::string checksum;
  std::string kind;
  std::string language;
  int attempt_count = 0;
  std::string last_error;
  uint64_t file_size = 0;
  uint64_t bytes_transferred = 0;
  bool cancel_requested = false;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

/**
 * @struct HistoryEntry
 * @brief Append-only audit row written with every committed transition.
 */
struct HistoryEntry {
  int64_t record_id = 0;
  std::string source_path;
  std::string from_state;
  std::string to_state;
  std::string detail;
  int64_t at = 0;
};

} // namespace media_relay

#endif // MEDIA_RELAY_TYPES_HPP
