/**
 * @file track.h
 * @brief Track identity as observed from the music service
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tastemix::store {

/**
 * @brief A track, immutable once observed
 */
struct Track {
  std::string id;                     ///< Stable track identifier
  std::string title;                  ///< Display title
  std::vector<std::string> artists;   ///< Artist names, primary artist first
  std::string link;                   ///< Canonical link to the track
  std::optional<uint64_t> followers;  ///< Follower count of the primary artist, when known

  /**
   * @brief First listed artist, or an empty string
   */
  const std::string& PrimaryArtist() const {
    static const std::string kEmpty;
    return artists.empty() ? kEmpty : artists.front();
  }
};

}  // namespace tastemix::store
