/**
 * @file types.cpp
 * @brief String conversions and helpers for the core data types
 */

#include "media_relay/types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace media_relay {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

const char *to_string(MediaKind kind) {
  switch (kind) {
  case MediaKind::Movie:
    return "movie";
  case MediaKind::Episode:
    return "episode";
  case MediaKind::Unknown:
    break;
  }
  return "unknown";
}

const char *to_string(Language language) {
  switch (language) {
  case Language::English:
    return "english";
  case Language::Malayalam:
    return "malayalam";
  case Language::Mixed:
    return "mixed";
  case Language::Other:
    break;
  }
  return "other";
}

const char *to_string(TrackType type) {
  switch (type) {
  case TrackType::Video:
    return "video";
  case TrackType::Audio:
    return "audio";
  case TrackType::Subtitle:
    return "subtitle";
  case TrackType::Other:
    break;
  }
  return "other";
}

bool parse_media_kind(const std::string &text, MediaKind &out) {
  std::string t = to_lower(text);
  if (t == "movie") {
    out = MediaKind::Movie;
  } else if (t == "episode" || t == "tvshow") {
    out = MediaKind::Episode;
  } else if (t == "unknown") {
    out = MediaKind::Unknown;
  } else {
    return false;
  }
  return true;
}

bool parse_language_name(const std::string &text, Language &out) {
  std::string t = to_lower(text);
  if (t == "english") {
    out = Language::English;
  } else if (t == "malayalam") {
    out = Language::Malayalam;
  } else if (t == "mixed") {
    out = Language::Mixed;
  } else if (t == "other") {
    out = Language::Other;
  } else {
    return false;
  }
  return true;
}

Language language_bucket(const std::string &tag) {
  std::string t = to_lower(tag);
  if (t == "mal" || t == "ml" || t == "malayalam")
    return Language::Malayalam;
  if (t == "eng" || t == "en" || t == "english")
    return Language::English;
  return Language::Other;
}

bool is_untagged(const std::string &tag) {
  return tag.empty() || to_lower(tag) == "und";
}

size_t MediaInfo::count(TrackType type) const {
  return static_cast<size_t>(
      std::count_if(tracks.begin(), tracks.end(),
                    [type](const Track &t) { return t.type == type; }));
}

std::string MediaFile::file_name() const {
  return std::filesystem::path(source_path).filename().string();
}

// **----- PIPELINE STATE -----**

namespace {

struct StateName {
  PipelineState state;
  const char *name;
};

constexpr StateName STATE_NAMES[] = {
    {PipelineState::Discovered, "DISCOVERED"},
    {PipelineState::Classified, "CLASSIFIED"},
    {PipelineState::Remuxing, "REMUXING"},
    {PipelineState::Transferring, "TRANSFERRING"},
    {PipelineState::Verified, "VERIFIED"},
    {PipelineState::CleanedUp, "CLEANED_UP"},
    {PipelineState::CleanedUpPartial, "CLEANED_UP_PARTIAL"},
    {PipelineState::Failed, "FAILED"},
    {PipelineState::Skipped, "SKIPPED"},
};

} // namespace

const char *to_string(PipelineState state) {
  for (const auto &entry : STATE_NAMES) {
    if (entry.state == state)
      return entry.name;
  }
  return "UNKNOWN";
}

bool parse_state(const std::string &text, PipelineState &out) {
  for (const auto &entry : STATE_NAMES) {
    if (text == entry.name) {
      out = entry.state;
      return true;
    }
  }
  return false;
}

bool is_terminal(PipelineState state) {
  return state == PipelineState::CleanedUp ||
         state == PipelineState::CleanedUpPartial ||
         state == PipelineState::Failed || state == PipelineState::Skipped;
}

bool is_terminal_success(PipelineState state) {
  return state == PipelineState::CleanedUp ||
         state == PipelineState::CleanedUpPartial;
}

} // namespace media_relay
