/**
 * @file classifier.cpp
 * @brief File name heuristics and track-based language detection
 */

#include "media_relay/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

#include "media_relay/container_inspector.hpp"
#include "media_relay/logging.hpp"

namespace media_relay {

namespace {

const auto ICASE = std::regex::ECMAScript | std::regex::icase;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const char *ws = " \t-";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

/// Filename tokens that name a language
struct LanguageToken {
  const char *token;
  Language bucket;
};

constexpr LanguageToken LANGUAGE_TOKENS[] = {
    {"malayalam", Language::Malayalam}, {"mal", Language::Malayalam},
    {"english", Language::English},     {"eng", Language::English},
    {"tamil", Language::Other},         {"tam", Language::Other},
    {"hindi", Language::Other},         {"hin", Language::Other},
    {"telugu", Language::Other},        {"tel", Language::Other},
    {"kannada", Language::Other},       {"kan", Language::Other},
};

/// Release-site prefixes found on downloaded files
const std::regex &prefix_pattern() {
  static const std::regex re(
      R"(^(?:www[\s.]*\d*\s*tamilmv[\s.]*\w*\s*-\s*|www\.\w+\.\w+\s*-\s*|tamilmv\s*-\s*|sanet[\s._]*st[\s._-]*|softarchive[\s._]*is[\s._-]*|\[[^\]]*\]\s*-?\s*))",
      ICASE);
  return re;
}

const std::regex &quality_pattern() {
  static const std::regex re(
      R"((?:^|[\s._\-\[(])(?:2160p|1080p|720p|480p|4k|uhd|web-?dl|webrip|bluray|blu-ray|brrip|bdrip|hdrip|dvdrip|hdtv|x264|x265|h264|h265|hevc)(?![A-Za-z0-9]))",
      ICASE);
  return re;
}

} // namespace

// **----- NAME HEURISTICS -----**

bool find_episode_marker(const std::string &name, EpisodeMarker &marker) {
  static const std::regex sxe(R"(S(\d{1,2})[\s._-]?E(\d{1,3}))", ICASE);
  static const std::regex season_episode(
      R"(Season[\s._-]*(\d{1,2})[\s._-]*(?:-[\s._-]*)?Episode[\s._-]*(\d{1,3}))",
      ICASE);
  static const std::regex nxnn(R"((?:^|[^0-9A-Za-z])(\d{1,2})x(\d{2})(?![0-9]))",
                               ICASE);
  static const std::regex ep(
      R"((?:^|[^0-9A-Za-z])Ep(?:isode)?[\s._-]?(\d{1,3})(?![0-9]))", ICASE);

  std::smatch m;
  if (std::regex_search(name, m, sxe) ||
      std::regex_search(name, m, season_episode) ||
      std::regex_search(name, m, nxnn)) {
    marker.season = std::stoi(m[1].str());
    marker.episode = std::stoi(m[2].str());
    marker.position = static_cast<size_t>(m.position(0));
    return true;
  }
  if (std::regex_search(name, m, ep)) {
    marker.season = 1;
    marker.episode = std::stoi(m[1].str());
    marker.position = static_cast<size_t>(m.position(0));
    return true;
  }
  return false;
}

std::vector<Language> filename_languages(const std::string &name) {
  std::vector<Language> found;
  std::string token;

  auto flush = [&]() {
    if (token.empty())
      return;
    std::string t = to_lower(token);
    token.clear();
    for (const auto &entry : LANGUAGE_TOKENS) {
      if (t == entry.token &&
          std::find(found.begin(), found.end(), entry.bucket) == found.end()) {
        found.push_back(entry.bucket);
      }
    }
  };

  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      token += c;
    } else {
      flush();
    }
  }
  flush();
  return found;
}

Language dominant_audio_language(const std::vector<Track> &tracks) {
  struct Vote {
    Language bucket;
    int count;
  };
  /// Ordered by first appearance so that ties resolve to the earlier track
  std::vector<Vote> votes;

  for (const auto &t : tracks) {
    if (t.type != TrackType::Audio || is_untagged(t.language))
      continue;
    Language bucket = language_bucket(t.language);
    auto it = std::find_if(votes.begin(), votes.end(),
                           [bucket](const Vote &v) { return v.bucket == bucket; });
    if (it == votes.end()) {
      votes.push_back({bucket, 1});
    } else {
      ++it->count;
    }
  }

  if (votes.empty())
    return Language::Other;

  const Vote *best = &votes.front();
  for (const auto &v : votes) {
    if (v.count > best->count)
      best = &v;
  }
  return best->bucket;
}

std::string canonical_title(const std::string &stem, int &year) {
  year = -1;
  std::string name = stem;

  /// Prefixes can be stacked ("[Mal] www.site.xx - ")
  for (int i = 0; i < 3; ++i) {
    std::string stripped = std::regex_replace(name, prefix_pattern(), "");
    if (stripped == name)
      break;
    name = stripped;
  }

  /// Bracketed language lists and release tags
  static const std::regex brackets(R"(\[[^\]]*\]?)");
  name = std::regex_replace(name, brackets, " ");

  size_t cut = name.size();

  EpisodeMarker marker;
  if (find_episode_marker(name, marker)) {
    cut = marker.position;
  } else {
    static const std::regex year_re(R"((?:^|[^0-9])((?:19|20)\d{2})(?![0-9]))");
    for (auto it = std::sregex_iterator(name.begin(), name.end(), year_re);
         it != std::sregex_iterator(); ++it) {
      size_t pos = static_cast<size_t>(it->position(1));
      /// A year at the very start is the title ("2012.mkv")
      if (pos == 0)
        continue;
      year = std::stoi((*it)[1].str());
      cut = static_cast<size_t>(it->position(0));
      break;
    }
  }

  std::smatch q;
  if (std::regex_search(name, q, quality_pattern())) {
    cut = std::min(cut, static_cast<size_t>(q.position(0)));
  }

  std::string title = name.substr(0, cut);
  for (char &c : title) {
    if (c == '.' || c == '_' || c == '(' || c == ')')
      c = ' ';
  }
  static const std::regex spaces(R"(\s+)");
  title = trim(std::regex_replace(title, spaces, " "));

  if (title.empty()) {
    title = stem;
    std::replace(title.begin(), title.end(), '.', ' ');
    std::replace(title.begin(), title.end(), '_', ' ');
    title = trim(title);
  }
  return title;
}

// **----- CLASSIFIER -----**

MediaFile Classifier::classify(const std::string &path, uint64_t size,
                               const MediaInfo *info) {
  namespace fs = std::filesystem;

  MediaFile mf;
  mf.source_path = path;
  mf.size = size;

  std::string stem = fs::path(path).stem().string();

  if (info) {
    mf.container = info->format_name;
    mf.duration_sec = info->duration_sec;
    mf.resolution = resolution_label(info->video_width, info->video_height);
    mf.video_codec = codec_label(info->video_codec);
    mf.tracks = info->tracks;
  }

  /// Kind
  EpisodeMarker marker;
  if (trim(stem).empty()) {
    mf.kind = MediaKind::Unknown;
  } else if (info && info->count(TrackType::Video) == 0) {
    mf.kind = MediaKind::Unknown;
  } else if (find_episode_marker(stem, marker)) {
    mf.kind = MediaKind::Episode;
    mf.season = marker.season;
    mf.episode = marker.episode;
  } else {
    mf.kind = MediaKind::Movie;
  }

  /// Language
  mf.audio_language = dominant_audio_language(mf.tracks);
  std::vector<Language> named = filename_languages(stem);
  if (named.size() > 1) {
    mf.language = Language::Mixed;
  } else if (named.size() == 1) {
    mf.language = named.front();
  } else {
    mf.language = mf.audio_language;
  }

  if (!trim(stem).empty()) {
    int year = -1;
    mf.title = canonical_title(stem, year);
    if (mf.kind == MediaKind::Movie)
      mf.year = year;
  }

  LOG_INFO("Classified {} -> {}/{} (audio {}, {} tracks)", mf.file_name(),
           to_string(mf.kind), to_string(mf.language),
           to_string(mf.audio_language), mf.tracks.size());
  return mf;
}

} // namespace media_relay
