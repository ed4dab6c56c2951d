/**
 * @file playlist_writer_test.cpp
 * @brief Tests for JSON playlist rendering and file output
 */

#include "output/playlist_writer.h"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "fakes/fake_collaborators.h"
#include "utils/structured_log.h"

namespace fs = std::filesystem;

namespace tastemix::output {

using test_support::MakeTrack;

namespace {

std::vector<recommend::CandidateResult> SampleResults() {
  recommend::CandidateResult genre_match;
  genre_match.seed_artist = "Seed One";
  genre_match.track = MakeTrack("m1", "Match One", "First Song");
  genre_match.overlap = 3;
  genre_match.genres = {"indie", "rock", "shoegaze"};
  genre_match.phase = recommend::MatchPhase::kStrict;

  recommend::CandidateResult distance_match;
  distance_match.seed_artist = "Seed Two";
  distance_match.track = MakeTrack("m2", "Match Two", "Second Song");
  distance_match.distance = 1.5;
  distance_match.phase = recommend::MatchPhase::kDistance;

  return {genre_match, distance_match};
}

}  // namespace

TEST(ResultsToJsonTest, RendersEntriesInOrder) {
  auto json = ResultsToJson(SampleResults());
  ASSERT_TRUE(json.is_array());
  ASSERT_EQ(json.size(), 2U);

  const auto& first = json[0];
  EXPECT_EQ(first["track_id"], "m1");
  EXPECT_EQ(first["title"], "First Song");
  EXPECT_EQ(first["artists"][0], "Match One");
  EXPECT_EQ(first["link"], "https://music.example/track/m1");
  EXPECT_EQ(first["seed_artist"], "Seed One");
  EXPECT_EQ(first["overlap"], 3);
  EXPECT_TRUE(first["distance"].is_null());
  EXPECT_EQ(first["phase"], "strict");
  EXPECT_EQ(first["genres"].size(), 3U);

  const auto& second = json[1];
  EXPECT_EQ(second["track_id"], "m2");
  EXPECT_DOUBLE_EQ(second["distance"].get<double>(), 1.5);
  EXPECT_EQ(second["phase"], "distance");
  EXPECT_TRUE(second["genres"].empty());
}

TEST(ResultsToJsonTest, EmptyResultsGiveEmptyArray) {
  auto json = ResultsToJson({});
  EXPECT_TRUE(json.is_array());
  EXPECT_TRUE(json.empty());
}

class JsonPlaylistWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("tastemix_playlist_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  static std::string ReadAll(const fs::path& path) {
    std::ifstream file(path);
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  fs::path dir_;
};

TEST_F(JsonPlaylistWriterTest, WritesFileCreatingDirectories) {
  auto path = dir_ / "nested" / "playlist.json";
  JsonPlaylistWriter writer(path.string());

  auto written = writer.Write(SampleResults());
  ASSERT_TRUE(written) << written.error().to_string();
  ASSERT_TRUE(fs::exists(path));

  auto parsed = nlohmann::json::parse(ReadAll(path));
  ASSERT_EQ(parsed.size(), 2U);
  EXPECT_EQ(parsed[1]["seed_artist"], "Seed Two");
}

TEST_F(JsonPlaylistWriterTest, OverwritesExistingFile) {
  fs::create_directories(dir_);
  auto path = dir_ / "playlist.json";
  {
    std::ofstream file(path);
    file << "stale content that is longer than an empty array";
  }

  JsonPlaylistWriter writer(path.string());
  ASSERT_TRUE(writer.Write({}));
  EXPECT_TRUE(nlohmann::json::parse(ReadAll(path)).empty());
}

TEST_F(JsonPlaylistWriterTest, UnwritablePathFails) {
  fs::create_directories(dir_);
  auto blocker = dir_ / "file";
  {
    std::ofstream file(blocker);
    file << "x";
  }

  JsonPlaylistWriter writer((blocker / "playlist.json").string());
  auto written = writer.Write(SampleResults());
  ASSERT_FALSE(written);
  EXPECT_EQ(written.error().code(), utils::ErrorCode::kPlaylistWriteError);
}

TEST_F(JsonPlaylistWriterTest, DashWritesToStdout) {
  JsonPlaylistWriter writer("-");
  ::testing::internal::CaptureStdout();
  auto written = writer.Write(SampleResults());
  std::string output = ::testing::internal::GetCapturedStdout();
  ASSERT_TRUE(written);
  EXPECT_NE(output.find("\"track_id\": \"m1\""), std::string::npos);
}

TEST_F(JsonPlaylistWriterTest, LogLinesStayOffStdout) {
  ASSERT_TRUE(utils::SetupLogging("info", true, ""));

  ::testing::internal::CaptureStdout();
  spdlog::info("tastemix starting (run)");
  utils::StructuredLog().Event("run_complete").Field("results", static_cast<uint64_t>(2)).Info();
  auto written = JsonPlaylistWriter("-").Write(SampleResults());
  spdlog::default_logger()->flush();
  std::string output = ::testing::internal::GetCapturedStdout();

  ASSERT_TRUE(written);
  auto parsed = nlohmann::json::parse(output, nullptr, false);
  ASSERT_FALSE(parsed.is_discarded()) << output;
  ASSERT_TRUE(parsed.is_array());
  EXPECT_EQ(parsed.size(), 2U);
  EXPECT_EQ(output.find("run_complete"), std::string::npos);
}

}  // namespace tastemix::output
