/**
 * @file share_client.cpp
 * @brief Share backend factory
 */

#include "media_relay/share_client.hpp"

#include "media_relay/local_share_client.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/smb_share_client.hpp"

namespace media_relay {

std::unique_ptr<ShareClient> make_share_client(const ShareSettings &settings) {
  if (settings.backend == "smb")
    return std::make_unique<SmbShareClient>(settings);
  if (settings.backend == "local")
    return std::make_unique<LocalShareClient>(settings.local_root,
                                              settings.base_path);
  LOG_ERROR("Unknown SHARE_BACKEND '{}' (expected smb or local)",
            settings.backend);
  return nullptr;
}

std::string remote_parent(const std::string &path) {
  size_t slash = path.rfind('/');
  return slash == std::string::npos ? "" : path.substr(0, slash);
}

} // namespace media_relay
