/**
 * @file listener_profile.cpp
 * @brief Listener profile parsing and weight derivation
 */

#include "profile/listener_profile.h"

#include <fstream>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/string_utils.h"

namespace tastemix::profile {

namespace {

utils::Unexpected<utils::Error> ParseError(const std::string& message, const std::string& context = "") {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kProfileParseError, message, context));
}

utils::Expected<std::string, utils::Error> ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "Cannot open file", path));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

store::Track TrackFromJson(const nlohmann::json& obj) {
  store::Track track;
  track.id = obj.at("id").get<std::string>();
  track.title = obj.value("title", std::string());
  track.artists = obj.at("artists").get<std::vector<std::string>>();
  track.link = obj.value("link", std::string());
  if (obj.contains("followers") && !obj["followers"].is_null()) {
    track.followers = obj["followers"].get<uint64_t>();
  }
  return track;
}

std::vector<std::string> StringList(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return {};
  }
  return obj[key].get<std::vector<std::string>>();
}

utils::Expected<std::vector<store::Track>, utils::Error> TracksFromJson(const nlohmann::json& items,
                                                                       const char* what) {
  if (!items.is_array()) {
    return ParseError(std::string(what) + " must be an array");
  }
  std::vector<store::Track> tracks;
  tracks.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    if (!items[i].is_object()) {
      return ParseError(std::string(what) + " entry is not an object", std::to_string(i));
    }
    auto track = TrackFromJson(items[i]);
    if (track.id.empty() || track.artists.empty()) {
      return ParseError(std::string(what) + " entry needs an id and at least one artist", std::to_string(i));
    }
    tracks.push_back(std::move(track));
  }
  return tracks;
}

}  // namespace

std::set<std::string> ListenerProfile::LikedArtists() const {
  std::set<std::string> artists;
  for (const auto& track : liked_tracks) {
    for (const auto& artist : track.artists) {
      artists.insert(utils::NormalizeName(artist));
    }
  }
  return artists;
}

std::set<std::string> ListenerProfile::ExcludedArtists() const {
  std::set<std::string> artists = LikedArtists();
  for (const auto& track : existing_tracks) {
    for (const auto& artist : track.artists) {
      artists.insert(utils::NormalizeName(artist));
    }
  }
  return artists;
}

std::vector<store::Track> ListenerProfile::TracksByArtist(const std::string& artist) const {
  const std::string wanted = utils::NormalizeName(artist);
  std::vector<store::Track> tracks;
  for (const auto& track : liked_tracks) {
    for (const auto& name : track.artists) {
      if (utils::NormalizeName(name) == wanted) {
        tracks.push_back(track);
        break;
      }
    }
  }
  return tracks;
}

utils::Expected<ListenerProfile, utils::Error> ParseListenerProfile(const std::string& json_text) {
  try {
    auto doc = nlohmann::json::parse(json_text);
    if (!doc.is_object()) {
      return ParseError("Profile must be a JSON object");
    }

    ListenerProfile profile;
    if (doc.contains("liked_tracks")) {
      auto tracks = TracksFromJson(doc["liked_tracks"], "liked_tracks");
      if (!tracks) {
        return utils::MakeUnexpected(tracks.error());
      }
      profile.liked_tracks = std::move(*tracks);
    }
    if (doc.contains("existing_tracks") && !doc["existing_tracks"].is_null()) {
      auto tracks = TracksFromJson(doc["existing_tracks"], "existing_tracks");
      if (!tracks) {
        return utils::MakeUnexpected(tracks.error());
      }
      profile.existing_tracks = std::move(*tracks);
    }
    if (doc.contains("listening") && doc["listening"].is_object()) {
      const auto& listening = doc["listening"];
      profile.listening.recent = StringList(listening, "recent");
      profile.listening.short_term = StringList(listening, "short_term");
      profile.listening.medium_term = StringList(listening, "medium_term");
    }
    return profile;
  } catch (const nlohmann::json::exception& e) {
    return ParseError(std::string("Invalid profile JSON: ") + e.what());
  }
}

utils::Expected<ListenerProfile, utils::Error> LoadListenerProfile(const std::string& path) {
  auto text = ReadFile(path);
  if (!text) {
    return utils::MakeUnexpected(text.error());
  }
  auto profile = ParseListenerProfile(*text);
  if (!profile) {
    return utils::MakeUnexpected(utils::MakeError(profile.error().code(), profile.error().message(), path));
  }
  return profile;
}

utils::Expected<std::vector<store::Track>, utils::Error> ParseTracks(const std::string& json_text) {
  try {
    auto doc = nlohmann::json::parse(json_text);
    if (doc.is_object() && doc.contains("tracks")) {
      return TracksFromJson(doc["tracks"], "tracks");
    }
    return TracksFromJson(doc, "catalog");
  } catch (const nlohmann::json::exception& e) {
    return ParseError(std::string("Invalid catalog JSON: ") + e.what());
  }
}

utils::Expected<std::vector<store::Track>, utils::Error> LoadCatalog(const std::string& path) {
  auto text = ReadFile(path);
  if (!text) {
    return utils::MakeUnexpected(text.error());
  }
  auto tracks = ParseTracks(*text);
  if (!tracks) {
    return utils::MakeUnexpected(utils::MakeError(tracks.error().code(), tracks.error().message(), path));
  }
  return tracks;
}

std::map<std::string, double> ListeningScores(const ListeningSignal& signal, const config::LotteryConfig& config) {
  std::map<std::string, double> scores;
  auto accumulate = [&scores](const std::vector<std::string>& artists, double weight) {
    for (const auto& artist : artists) {
      auto key = utils::NormalizeName(artist);
      if (!key.empty()) {
        scores[key] += weight;
      }
    }
  };
  accumulate(signal.recent, config.recent_weight);
  accumulate(signal.short_term, config.short_term_weight);
  accumulate(signal.medium_term, config.medium_term_weight);
  return scores;
}

recommend::ArtistWeights BuildArtistWeights(const ListenerProfile& profile, const config::LotteryConfig& config) {
  // normalized name -> (display name, liked track count)
  std::unordered_map<std::string, std::pair<std::string, size_t>> liked;
  std::vector<std::string> order;
  for (const auto& track : profile.liked_tracks) {
    std::set<std::string> seen_on_track;
    for (const auto& artist : track.artists) {
      auto key = utils::NormalizeName(artist);
      if (key.empty() || !seen_on_track.insert(key).second) {
        continue;
      }
      auto it = liked.find(key);
      if (it == liked.end()) {
        liked.emplace(key, std::make_pair(utils::Trim(artist), 1));
        order.push_back(key);
      } else {
        ++it->second.second;
      }
    }
  }

  const auto scores = ListeningScores(profile.listening, config);

  recommend::ArtistWeights weights;
  for (const auto& key : order) {
    const auto& [display, count] = liked.at(key);
    double weight = config.liked_more;
    if (count == 1) {
      weight = config.liked_once;
    } else if (count == 2) {
      weight = config.liked_twice;
    } else if (count == 3) {
      weight = config.liked_thrice;
    }
    auto score = scores.find(key);
    if (score != scores.end() && score->second > 0.0) {
      weight *= config.listening_boost;
    }
    weights[display] = weight;
  }
  return weights;
}

}  // namespace tastemix::profile
