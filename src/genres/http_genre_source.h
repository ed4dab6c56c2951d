/**
 * @file http_genre_source.h
 * @brief Genre source backed by a metadata provider's HTTP API
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.h"
#include "genres/genre_source.h"

namespace tastemix::genres {

/**
 * @brief Supported metadata providers
 */
enum class GenreProviderKind : std::uint8_t {
  kSpotify,      // GET /v1/search, artists.items[0].genres
  kLastFm,       // GET /2.0/?method=artist.gettoptags, toptags.tag[].name
  kMusicBrainz,  // GET /ws/2/artist/?query=..., artists[0].tags[].name
  kAudioDb,      // GET /api/v1/json/{key}/search.php, artists[0].strGenre / strStyle
};

/**
 * @brief Parse a provider kind from its config name
 * @return Kind, or nullopt for an unknown name
 */
std::optional<GenreProviderKind> ParseProviderKind(const std::string& name);

const char* ProviderKindToString(GenreProviderKind kind);

/**
 * @brief Extract genre tags from a provider response body
 *
 * An artist the provider does not know yields an empty set. A body that is
 * not valid JSON or lacks the expected structure yields
 * kGenreSourceInvalidResponse.
 */
utils::Expected<store::GenreSet, utils::Error> ParseGenreResponse(GenreProviderKind kind, const std::string& body);

/**
 * @brief HTTP genre source (cpp-httplib client)
 *
 * Each Lookup() issues one GET request with connect and read timeouts taken
 * from the source configuration.
 */
class HttpGenreSource : public GenreSource {
 public:
  HttpGenreSource(GenreProviderKind kind, config::GenreSourceConfig config);

  const std::string& Name() const override { return config_.name; }

  utils::Expected<store::GenreSet, utils::Error> Lookup(const std::string& artist) override;

  GenreProviderKind Kind() const { return kind_; }

 private:
  GenreProviderKind kind_;
  config::GenreSourceConfig config_;
};

/**
 * @brief Build the ordered source chain from configuration
 *
 * @return Sources in configuration order, or kConfigInvalidValue for an
 *         unknown provider kind
 */
utils::Expected<std::vector<std::unique_ptr<GenreSource>>, utils::Error> BuildGenreSources(
    const std::vector<config::GenreSourceConfig>& configs);

}  // namespace tastemix::genres
