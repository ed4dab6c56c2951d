/**
 * @file playlist_writer.cpp
 * @brief JSON playlist writer
 */

#include "output/playlist_writer.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace tastemix::output {

nlohmann::json ResultsToJson(const std::vector<recommend::CandidateResult>& results) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& result : results) {
    nlohmann::json entry;
    entry["track_id"] = result.track.id;
    entry["title"] = result.track.title;
    entry["artists"] = result.track.artists;
    entry["link"] = result.track.link;
    entry["seed_artist"] = result.seed_artist;
    entry["overlap"] = result.overlap;
    entry["distance"] = result.distance ? nlohmann::json(*result.distance) : nlohmann::json(nullptr);
    entry["phase"] = recommend::MatchPhaseToString(result.phase);
    entry["genres"] = result.genres;
    entries.push_back(std::move(entry));
  }
  return entries;
}

JsonPlaylistWriter::JsonPlaylistWriter(std::string path) : path_(std::move(path)) {}

utils::Expected<void, utils::Error> JsonPlaylistWriter::Write(const std::vector<recommend::CandidateResult>& results) {
  const std::string text = ResultsToJson(results).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  if (path_ == "-") {
    std::cout << text << '\n';
    std::cout.flush();
    if (!std::cout) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kPlaylistWriteError, "Failed to write playlist to stdout"));
    }
    return {};
  }

  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kPlaylistWriteError,
                                                    "Failed to create output directory: " + ec.message(), path_));
    }
  }

  std::ofstream file(path_, std::ios::trunc);
  if (!file) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kPlaylistWriteError, "Failed to open output file", path_));
  }
  file << text << '\n';
  file.close();
  if (!file) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kPlaylistWriteError, "Failed to write output file", path_));
  }
  return {};
}

}  // namespace tastemix::output
