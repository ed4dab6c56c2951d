/**
 * @file listener_profile_test.cpp
 * @brief Tests for profile parsing, catalog files and lottery weights
 */

#include "profile/listener_profile.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace tastemix::profile {

namespace {

constexpr const char* kProfileJson = R"({
  "liked_tracks": [
    {"id": "t1", "title": "One", "artists": ["Boards of Canada"], "link": "https://music.example/t1"},
    {"id": "t2", "title": "Two", "artists": ["boards of canada "], "followers": 900000},
    {"id": "t3", "title": "Three", "artists": ["Aphex Twin", "Boards of Canada"]},
    {"id": "t4", "title": "Four", "artists": ["Autechre"]}
  ],
  "listening": {"recent": ["Autechre", "Autechre"], "short_term": ["Aphex Twin"], "medium_term": null}
})";

}  // namespace

TEST(ListenerProfileTest, ParsesTracksAndSignal) {
  auto profile = ParseListenerProfile(kProfileJson);
  ASSERT_TRUE(profile) << profile.error().to_string();
  ASSERT_EQ(profile->liked_tracks.size(), 4U);
  EXPECT_EQ(profile->liked_tracks[0].link, "https://music.example/t1");
  ASSERT_TRUE(profile->liked_tracks[1].followers.has_value());
  EXPECT_EQ(*profile->liked_tracks[1].followers, 900000U);
  EXPECT_FALSE(profile->liked_tracks[0].followers.has_value());
  EXPECT_EQ(profile->listening.recent.size(), 2U);
  EXPECT_TRUE(profile->listening.medium_term.empty());
}

TEST(ListenerProfileTest, LikedArtistsAreNormalized) {
  auto profile = ParseListenerProfile(kProfileJson);
  ASSERT_TRUE(profile);
  std::set<std::string> expected = {"aphex twin", "autechre", "boards of canada"};
  EXPECT_EQ(profile->LikedArtists(), expected);
}

TEST(ListenerProfileTest, TracksByArtistMatchesAnyListedArtist) {
  auto profile = ParseListenerProfile(kProfileJson);
  ASSERT_TRUE(profile);
  auto tracks = profile->TracksByArtist("BOARDS OF CANADA");
  ASSERT_EQ(tracks.size(), 3U);
  EXPECT_EQ(tracks[0].id, "t1");
  EXPECT_EQ(tracks[2].id, "t3");
  EXPECT_TRUE(profile->TracksByArtist("Nobody").empty());
}

TEST(ListenerProfileTest, ExistingTracksJoinExcludedArtists) {
  auto profile = ParseListenerProfile(R"({
    "liked_tracks": [{"id": "t1", "artists": ["Autechre"]}],
    "existing_tracks": [{"id": "p1", "artists": ["Burial", " Four Tet"]}]
  })");
  ASSERT_TRUE(profile) << profile.error().to_string();
  ASSERT_EQ(profile->existing_tracks.size(), 1U);
  std::set<std::string> liked = {"autechre"};
  EXPECT_EQ(profile->LikedArtists(), liked);
  std::set<std::string> excluded = {"autechre", "burial", "four tet"};
  EXPECT_EQ(profile->ExcludedArtists(), excluded);
  // Existing tracks are not seeds
  EXPECT_TRUE(profile->TracksByArtist("Burial").empty());

  EXPECT_EQ(ParseListenerProfile(R"({"existing_tracks": [{"id": "p1"}]})").error().code(),
            utils::ErrorCode::kProfileParseError);
}

TEST(ListenerProfileTest, EmptyObjectIsEmptyProfile) {
  auto profile = ParseListenerProfile("{}");
  ASSERT_TRUE(profile);
  EXPECT_TRUE(profile->liked_tracks.empty());
  EXPECT_TRUE(profile->existing_tracks.empty());
}

TEST(ListenerProfileTest, RejectsMalformedInput) {
  EXPECT_EQ(ParseListenerProfile("{not json").error().code(), utils::ErrorCode::kProfileParseError);
  EXPECT_EQ(ParseListenerProfile("[]").error().code(), utils::ErrorCode::kProfileParseError);
  EXPECT_EQ(ParseListenerProfile(R"({"liked_tracks": {}})").error().code(), utils::ErrorCode::kProfileParseError);
  EXPECT_EQ(ParseListenerProfile(R"({"liked_tracks": [{"title": "no id", "artists": ["A"]}]})").error().code(),
            utils::ErrorCode::kProfileParseError);
  EXPECT_EQ(ParseListenerProfile(R"({"liked_tracks": [{"id": "x", "artists": []}]})").error().code(),
            utils::ErrorCode::kProfileParseError);
}

TEST(ParseTracksTest, AcceptsArrayOrTracksObject) {
  auto array = ParseTracks(R"([{"id": "a", "artists": ["A"]}, {"id": "b", "artists": ["B"]}])");
  ASSERT_TRUE(array);
  EXPECT_EQ(array->size(), 2U);

  auto wrapped = ParseTracks(R"({"tracks": [{"id": "c", "artists": ["C"], "title": "Sea"}]})");
  ASSERT_TRUE(wrapped);
  ASSERT_EQ(wrapped->size(), 1U);
  EXPECT_EQ((*wrapped)[0].title, "Sea");

  EXPECT_FALSE(ParseTracks(R"({"items": []})"));
}

TEST(LoadFileTest, MissingFileIsNotFound) {
  auto profile = LoadListenerProfile("/nonexistent/tastemix/profile.json");
  ASSERT_FALSE(profile);
  EXPECT_EQ(profile.error().code(), utils::ErrorCode::kNotFound);

  auto catalog = LoadCatalog("/nonexistent/tastemix/catalog.json");
  ASSERT_FALSE(catalog);
  EXPECT_EQ(catalog.error().code(), utils::ErrorCode::kNotFound);
}

TEST(LoadFileTest, LoadsProfileFromDisk) {
  auto path = fs::temp_directory_path() / "tastemix_profile_test.json";
  {
    std::ofstream file(path);
    file << kProfileJson;
  }
  auto profile = LoadListenerProfile(path.string());
  fs::remove(path);
  ASSERT_TRUE(profile) << profile.error().to_string();
  EXPECT_EQ(profile->liked_tracks.size(), 4U);
}

TEST(ListeningScoresTest, SumsWeightedSignals) {
  ListeningSignal signal;
  signal.recent = {"Autechre", "autechre"};
  signal.short_term = {"Autechre", "Aphex Twin"};
  signal.medium_term = {"Aphex Twin", ""};

  config::LotteryConfig lottery;
  auto scores = ListeningScores(signal, lottery);
  EXPECT_DOUBLE_EQ(scores["autechre"], 2 * lottery.recent_weight + lottery.short_term_weight);
  EXPECT_DOUBLE_EQ(scores["aphex twin"], lottery.short_term_weight + lottery.medium_term_weight);
  EXPECT_EQ(scores.count(""), 0U);
}

TEST(ArtistWeightsTest, LikedCountTiersAndBoost) {
  auto profile = ParseListenerProfile(kProfileJson);
  ASSERT_TRUE(profile);
  config::LotteryConfig lottery;

  auto weights = BuildArtistWeights(*profile, lottery);
  ASSERT_EQ(weights.size(), 3U);
  // Keyed by the first spelling seen
  ASSERT_EQ(weights.count("Boards of Canada"), 1U);
  EXPECT_DOUBLE_EQ(weights["Boards of Canada"], lottery.liked_thrice);
  EXPECT_DOUBLE_EQ(weights["Aphex Twin"], lottery.liked_once * lottery.listening_boost);
  EXPECT_DOUBLE_EQ(weights["Autechre"], lottery.liked_once * lottery.listening_boost);
}

TEST(ArtistWeightsTest, ArtistCountedOncePerTrack) {
  ListenerProfile profile;
  store::Track track;
  track.id = "dup";
  track.artists = {"Duo", "duo"};
  profile.liked_tracks = {track};
  track.id = "dup2";
  profile.liked_tracks.push_back(track);

  config::LotteryConfig lottery;
  auto weights = BuildArtistWeights(profile, lottery);
  ASSERT_EQ(weights.size(), 1U);
  EXPECT_DOUBLE_EQ(weights["Duo"], lottery.liked_twice);
}

TEST(ArtistWeightsTest, FourOrMoreUsesLikedMore) {
  ListenerProfile profile;
  for (int i = 0; i < 6; ++i) {
    store::Track track;
    track.id = "t" + std::to_string(i);
    track.artists = {"Prolific"};
    profile.liked_tracks.push_back(track);
  }
  config::LotteryConfig lottery;
  lottery.liked_more = 0.25;

  auto weights = BuildArtistWeights(profile, lottery);
  EXPECT_DOUBLE_EQ(weights["Prolific"], 0.25);
}

TEST(ArtistWeightsTest, ListeningAloneGivesNoWeight) {
  ListenerProfile profile;
  profile.listening.recent = {"Only Heard"};
  config::LotteryConfig lottery;
  EXPECT_TRUE(BuildArtistWeights(profile, lottery).empty());
}

}  // namespace tastemix::profile
