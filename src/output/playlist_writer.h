/**
 * @file playlist_writer.h
 * @brief Sink for the ordered results of a run
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "recommend/similarity_matcher.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::output {

/**
 * @brief Receives accepted results in the order they were produced
 */
class PlaylistWriter {
 public:
  virtual ~PlaylistWriter() = default;

  virtual utils::Expected<void, utils::Error> Write(const std::vector<recommend::CandidateResult>& results) = 0;
};

/**
 * @brief Render results as a JSON array
 *
 * Each entry: track_id, title, artists, link, seed_artist, overlap,
 * distance (null outside the distance phase), phase, genres.
 */
nlohmann::json ResultsToJson(const std::vector<recommend::CandidateResult>& results);

/**
 * @brief Writes results as pretty-printed JSON to a file, or stdout for "-"
 */
class JsonPlaylistWriter : public PlaylistWriter {
 public:
  explicit JsonPlaylistWriter(std::string path);

  utils::Expected<void, utils::Error> Write(const std::vector<recommend::CandidateResult>& results) override;

 private:
  std::string path_;
};

}  // namespace tastemix::output
