/**
 * @file http_genre_source.cpp
 * @brief HTTP genre source implementation
 */

#include "genres/http_genre_source.h"

#include <httplib.h>

#include <ctime>
#include <limits>

#include <nlohmann/json.hpp>

#include "version.h"

namespace tastemix::genres {

namespace {

constexpr size_t kLastFmMaxTags = 10;
constexpr int kLastFmArtistNotFound = 6;

utils::Expected<store::GenreSet, utils::Error> InvalidResponse(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGenreSourceInvalidResponse, message));
}

/**
 * @brief Collect string values of `key` from an array of objects
 */
std::vector<std::string> CollectNames(const nlohmann::json& items, const char* key, size_t limit) {
  std::vector<std::string> names;
  if (!items.is_array()) {
    return names;
  }
  for (const auto& item : items) {
    if (names.size() >= limit) {
      break;
    }
    if (item.is_object() && item.contains(key) && item[key].is_string()) {
      names.push_back(item[key].get<std::string>());
    }
  }
  return names;
}

utils::Expected<store::GenreSet, utils::Error> ParseSpotify(const nlohmann::json& doc) {
  if (!doc.contains("artists") || !doc["artists"].is_object()) {
    return InvalidResponse("spotify: missing artists object");
  }
  const auto& items = doc["artists"].value("items", nlohmann::json::array());
  if (!items.is_array() || items.empty()) {
    return store::GenreSet{};
  }
  const auto& genres = items[0].value("genres", nlohmann::json::array());
  std::vector<std::string> tags;
  for (const auto& genre : genres) {
    if (genre.is_string()) {
      tags.push_back(genre.get<std::string>());
    }
  }
  return store::MakeGenreSet(tags);
}

utils::Expected<store::GenreSet, utils::Error> ParseLastFm(const nlohmann::json& doc) {
  if (doc.contains("error")) {
    if (doc["error"].is_number_integer() && doc["error"].get<int>() == kLastFmArtistNotFound) {
      return store::GenreSet{};
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGenreSourceFailed,
                                                  "lastfm: " + doc.value("message", std::string("error"))));
  }
  if (!doc.contains("toptags") || !doc["toptags"].is_object()) {
    return InvalidResponse("lastfm: missing toptags object");
  }
  const auto& tags = doc["toptags"].value("tag", nlohmann::json::array());
  // A single tag is sometimes returned as an object instead of an array
  if (tags.is_object()) {
    return store::MakeGenreSet(CollectNames(nlohmann::json::array({tags}), "name", kLastFmMaxTags));
  }
  return store::MakeGenreSet(CollectNames(tags, "name", kLastFmMaxTags));
}

utils::Expected<store::GenreSet, utils::Error> ParseMusicBrainz(const nlohmann::json& doc) {
  if (!doc.contains("artists") || !doc["artists"].is_array()) {
    return InvalidResponse("musicbrainz: missing artists array");
  }
  const auto& artists = doc["artists"];
  if (artists.empty()) {
    return store::GenreSet{};
  }
  const auto& tags = artists[0].value("tags", nlohmann::json::array());
  return store::MakeGenreSet(CollectNames(tags, "name", std::numeric_limits<size_t>::max()));
}

utils::Expected<store::GenreSet, utils::Error> ParseAudioDb(const nlohmann::json& doc) {
  if (!doc.contains("artists")) {
    return InvalidResponse("audiodb: missing artists field");
  }
  const auto& artists = doc["artists"];
  // Unknown artists come back as {"artists": null}
  if (artists.is_null() || (artists.is_array() && artists.empty())) {
    return store::GenreSet{};
  }
  if (!artists.is_array() || !artists[0].is_object()) {
    return InvalidResponse("audiodb: artists is not an array of objects");
  }
  std::vector<std::string> tags;
  const auto& artist = artists[0];
  for (const char* key : {"strGenre", "strStyle"}) {
    if (artist.contains(key) && artist[key].is_string()) {
      tags.push_back(artist[key].get<std::string>());
    }
  }
  return store::MakeGenreSet(tags);
}

}  // namespace

std::optional<GenreProviderKind> ParseProviderKind(const std::string& name) {
  if (name == "spotify") {
    return GenreProviderKind::kSpotify;
  }
  if (name == "lastfm") {
    return GenreProviderKind::kLastFm;
  }
  if (name == "musicbrainz") {
    return GenreProviderKind::kMusicBrainz;
  }
  if (name == "audiodb") {
    return GenreProviderKind::kAudioDb;
  }
  return std::nullopt;
}

const char* ProviderKindToString(GenreProviderKind kind) {
  switch (kind) {
    case GenreProviderKind::kSpotify:
      return "spotify";
    case GenreProviderKind::kLastFm:
      return "lastfm";
    case GenreProviderKind::kMusicBrainz:
      return "musicbrainz";
    case GenreProviderKind::kAudioDb:
      return "audiodb";
  }
  return "unknown";
}

utils::Expected<store::GenreSet, utils::Error> ParseGenreResponse(GenreProviderKind kind, const std::string& body) {
  nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return InvalidResponse(std::string(ProviderKindToString(kind)) + ": response is not a JSON object");
  }

  try {
    switch (kind) {
      case GenreProviderKind::kSpotify:
        return ParseSpotify(doc);
      case GenreProviderKind::kLastFm:
        return ParseLastFm(doc);
      case GenreProviderKind::kMusicBrainz:
        return ParseMusicBrainz(doc);
      case GenreProviderKind::kAudioDb:
        return ParseAudioDb(doc);
    }
  } catch (const nlohmann::json::exception& e) {
    return InvalidResponse(std::string(ProviderKindToString(kind)) + ": " + e.what());
  }
  return InvalidResponse("unknown provider kind");
}

HttpGenreSource::HttpGenreSource(GenreProviderKind kind, config::GenreSourceConfig config)
    : kind_(kind), config_(std::move(config)) {}

utils::Expected<store::GenreSet, utils::Error> HttpGenreSource::Lookup(const std::string& artist) {
  httplib::Client client(config_.url);
  const time_t timeout_sec = static_cast<time_t>(config_.timeout_ms / 1000);
  const time_t timeout_usec = static_cast<time_t>((config_.timeout_ms % 1000) * 1000);
  client.set_connection_timeout(timeout_sec, timeout_usec);
  client.set_read_timeout(timeout_sec, timeout_usec);

  std::string path;
  httplib::Params params;
  httplib::Headers headers = {{"Accept", "application/json"},
                              {"User-Agent", "tastemix/" + Version::String()}};

  switch (kind_) {
    case GenreProviderKind::kSpotify:
      path = "/v1/search";
      params = {{"q", "artist:" + artist}, {"type", "artist"}, {"limit", "1"}};
      if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
      }
      break;
    case GenreProviderKind::kLastFm:
      path = "/2.0/";
      params = {{"method", "artist.gettoptags"}, {"artist", artist}, {"api_key", config_.api_key}, {"format", "json"}};
      break;
    case GenreProviderKind::kMusicBrainz:
      path = "/ws/2/artist/";
      params = {{"query", "artist:\"" + artist + "\""}, {"fmt", "json"}, {"limit", "1"}};
      break;
    case GenreProviderKind::kAudioDb:
      path = "/api/v1/json/" + (config_.api_key.empty() ? std::string("2") : config_.api_key) + "/search.php";
      params = {{"s", artist}};
      break;
  }

  auto res = client.Get(path, params, headers);
  if (!res) {
    auto http_error = res.error();
    auto code = http_error == httplib::Error::Read ? utils::ErrorCode::kTimeout : utils::ErrorCode::kGenreSourceFailed;
    return utils::MakeUnexpected(
        utils::MakeError(code, config_.name + ": request failed: " + httplib::to_string(http_error), artist));
  }
  if (res->status == 404) {
    return store::GenreSet{};
  }
  if (res->status != 200) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kGenreSourceFailed,
                                                  config_.name + ": HTTP " + std::to_string(res->status), artist));
  }

  return ParseGenreResponse(kind_, res->body);
}

utils::Expected<std::vector<std::unique_ptr<GenreSource>>, utils::Error> BuildGenreSources(
    const std::vector<config::GenreSourceConfig>& configs) {
  std::vector<std::unique_ptr<GenreSource>> sources;
  for (const auto& source_config : configs) {
    auto kind = ParseProviderKind(source_config.kind);
    if (!kind) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "Unknown genre source kind: " + source_config.kind));
    }
    sources.push_back(std::make_unique<HttpGenreSource>(*kind, source_config));
  }
  return sources;
}

}  // namespace tastemix::genres
