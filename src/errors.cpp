/**
 * @file errors.cpp
 * @brief Error names and the static retry table
 */

#include "media_relay/errors.hpp"

namespace media_relay {

namespace {

struct ErrorEntry {
  ErrorKind kind;
  const char *name;
  RetryPolicy policy;
};

// clang-format off
constexpr ErrorEntry ERROR_TABLE[] = {
    {ErrorKind::None,                 "None",                 {false, 1}},
    {ErrorKind::NotFound,             "NotFound",             {false, 1}},
    {ErrorKind::UnreadableContainer,  "UnreadableContainer",  {false, 1}},
    {ErrorKind::UnclassifiedMedia,    "UnclassifiedMedia",    {false, 1}},
    {ErrorKind::RemuxFailed,          "RemuxFailed",          {false, 1}},
    {ErrorKind::ConnectionFailed,     "ConnectionFailed",     {true,  5}},
    {ErrorKind::AuthenticationFailed, "AuthenticationFailed", {false, 1}},
    {ErrorKind::RemoteWriteFailed,    "RemoteWriteFailed",    {true,  5}},
    {ErrorKind::ChecksumMismatch,     "ChecksumMismatch",     {false, 1}},
    {ErrorKind::CleanupPartial,       "CleanupPartial",       {false, 1}},
    {ErrorKind::Cancelled,            "Cancelled",            {false, 1}},
};
// clang-format on

} // namespace

const char *error_name(ErrorKind kind) {
  for (const auto &e : ERROR_TABLE) {
    if (e.kind == kind)
      return e.name;
  }
  return "Unknown";
}

bool parse_error_name(const std::string &text, ErrorKind &out) {
  for (const auto &e : ERROR_TABLE) {
    if (text == e.name) {
      out = e.kind;
      return true;
    }
  }
  return false;
}

RetryPolicy retry_policy_for(ErrorKind kind) {
  for (const auto &e : ERROR_TABLE) {
    if (e.kind == kind)
      return e.policy;
  }
  return {false, 1};
}

} // namespace media_relay
