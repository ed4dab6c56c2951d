/**
 * @file listener_profile.h
 * @brief Listener profile, catalog files and lottery weight derivation
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "config/config.h"
#include "recommend/lottery_selector.h"
#include "store/track.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::profile {

/**
 * @brief Artist names seen in recent listening history
 */
struct ListeningSignal {
  std::vector<std::string> recent;       ///< Recently played (one entry per play)
  std::vector<std::string> short_term;   ///< Short-term top artists
  std::vector<std::string> medium_term;  ///< Medium-term top artists
};

/**
 * @brief A listener's liked tracks and listening signal
 *
 * JSON layout:
 * @code
 * {
 *   "liked_tracks": [{"id": "...", "title": "...", "artists": ["..."], "link": "...", "followers": 123}],
 *   "listening": {"recent": ["..."], "short_term": ["..."], "medium_term": ["..."]},
 *   "existing_tracks": [{"id": "...", "artists": ["..."]}]
 * }
 * @endcode
 *
 * existing_tracks is optional and lists tracks already on the target
 * playlist. Their artists are never recommended.
 */
struct ListenerProfile {
  std::vector<store::Track> liked_tracks;
  ListeningSignal listening;
  std::vector<store::Track> existing_tracks;

  /**
   * @brief Normalized names of every artist on a liked track
   */
  std::set<std::string> LikedArtists() const;

  /**
   * @brief Artists a run must not recommend: liked artists plus artists on existing_tracks
   */
  std::set<std::string> ExcludedArtists() const;

  /**
   * @brief Liked tracks listing the artist (case-insensitive), in profile order
   */
  std::vector<store::Track> TracksByArtist(const std::string& artist) const;
};

/**
 * @brief Parse a profile document
 * @return Profile, or kProfileParseError
 */
utils::Expected<ListenerProfile, utils::Error> ParseListenerProfile(const std::string& json_text);

/**
 * @brief Read and parse a profile file
 */
utils::Expected<ListenerProfile, utils::Error> LoadListenerProfile(const std::string& path);

/**
 * @brief Parse a track list: either a JSON array or {"tracks": [...]}
 */
utils::Expected<std::vector<store::Track>, utils::Error> ParseTracks(const std::string& json_text);

/**
 * @brief Read and parse a catalog file for bulk ingestion
 */
utils::Expected<std::vector<store::Track>, utils::Error> LoadCatalog(const std::string& path);

/**
 * @brief Derive lottery weights from a profile
 *
 * Liked-track count per artist maps to liked_once / liked_twice /
 * liked_thrice / liked_more. Artists present in the listening signal get
 * their weight multiplied by listening_boost. Names are grouped
 * case-insensitively and keyed by the first spelling seen.
 */
recommend::ArtistWeights BuildArtistWeights(const ListenerProfile& profile, const config::LotteryConfig& config);

/**
 * @brief Listening score per normalized artist
 *
 * recent plays add recent_weight, short-term entries short_term_weight and
 * medium-term entries medium_term_weight.
 */
std::map<std::string, double> ListeningScores(const ListeningSignal& signal, const config::LotteryConfig& config);

}  // namespace tastemix::profile
