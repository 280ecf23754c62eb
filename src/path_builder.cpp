/**
 * @file path_builder.cpp
 * @brief Destination path mapping implementation
 */

#include "media_relay/path_builder.hpp"

#include <fmt/core.h>

namespace media_relay {

namespace {

bool is_inside(const std::string &outer, const std::string &inner) {
  return inner.size() > outer.size() && inner.compare(0, outer.size(), outer) == 0 &&
         inner[outer.size()] == '/';
}

} // namespace

std::string sanitize_component(const std::string &name) {
  std::string out = name;
  for (char &c : out) {
    switch (c) {
    case '\\':
    case '/':
    case ':':
    case '*':
    case '?':
    case '"':
    case '<':
    case '>':
    case '|':
      c = '_';
      break;
    default:
      break;
    }
  }
  /// Windows servers drop trailing dots and spaces silently
  while (!out.empty() && (out.back() == '.' || out.back() == ' '))
    out.pop_back();
  return out;
}

std::string normalize_prefix(const std::string &prefix) {
  std::string out;
  for (char c : prefix) {
    char ch = (c == '\\') ? '/' : c;
    if (ch == '/' && (out.empty() || out.back() == '/'))
      continue;
    out += ch;
  }
  while (!out.empty() && out.back() == '/')
    out.pop_back();
  return out;
}

bool DestinationTemplate::validate(std::vector<std::string> &problems) const {
  struct Slot {
    const char *name;
    std::string prefix;
  };
  const Slot slots[] = {
      {"ENGLISH_MOVIE_PATH", normalize_prefix(english_movies)},
      {"ENGLISH_TV_PATH", normalize_prefix(english_tv)},
      {"MALAYALAM_MOVIE_PATH", normalize_prefix(malayalam_movies)},
      {"MALAYALAM_TV_PATH", normalize_prefix(malayalam_tv)},
  };

  size_t before = problems.size();
  for (const auto &s : slots) {
    if (s.prefix.empty()) {
      problems.push_back(fmt::format("{} is empty", s.name));
    } else if (s.prefix.find("..") != std::string::npos) {
      problems.push_back(fmt::format("{} must not contain '..'", s.name));
    }
  }

  for (size_t i = 0; i < 4; ++i) {
    for (size_t j = i + 1; j < 4; ++j) {
      const auto &a = slots[i];
      const auto &b = slots[j];
      if (a.prefix.empty() || b.prefix.empty())
        continue;
      if (a.prefix == b.prefix) {
        problems.push_back(
            fmt::format("{} and {} are both '{}'", a.name, b.name, a.prefix));
      } else if (is_inside(a.prefix, b.prefix) || is_inside(b.prefix, a.prefix)) {
        problems.push_back(fmt::format("{} ('{}') and {} ('{}') overlap", a.name,
                                       a.prefix, b.name, b.prefix));
      }
    }
  }
  return problems.size() == before;
}

Language routing_language(const MediaFile &file) {
  Language lang = file.language;
  if (lang == Language::Mixed)
    lang = file.audio_language;
  return lang == Language::Malayalam ? Language::Malayalam : Language::English;
}

ErrorKind build_destination(const MediaFile &file,
                            const DestinationTemplate &tmpl, std::string &out) {
  if (file.kind == MediaKind::Unknown)
    return ErrorKind::UnclassifiedMedia;

  bool malayalam = routing_language(file) == Language::Malayalam;
  std::string prefix;
  if (file.kind == MediaKind::Movie) {
    prefix = malayalam ? tmpl.malayalam_movies : tmpl.english_movies;
  } else {
    prefix = malayalam ? tmpl.malayalam_tv : tmpl.english_tv;
  }
  prefix = normalize_prefix(prefix);

  std::string name = sanitize_component(file.file_name());
  if (name.empty())
    return ErrorKind::UnclassifiedMedia;

  if (file.kind == MediaKind::Episode && tmpl.organize_episodes &&
      !file.title.empty()) {
    out = fmt::format("{}/{}/Season {:02d}/{}", prefix,
                      sanitize_component(file.title),
                      file.season > 0 ? file.season : 1, name);
  } else {
    out = prefix + "/" + name;
  }
  return ErrorKind::None;
}

} // namespace media_relay
