/**
 * @file snapshot_test.cpp
 * @brief Tests for the V1 snapshot format (feature store + genre cache)
 */

#include "storage/snapshot_format_v1.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "fakes/fake_collaborators.h"

namespace fs = std::filesystem;

namespace tastemix::storage {

using test_support::MakeFeatures;
using test_support::MakeTrack;

class SnapshotTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("tastemix_snapshot_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    path_ = (dir_ / "store.snapshot").string();

    auto t1 = MakeTrack("t1", "Artist A", "Song One");
    t1.followers = 42000;
    auto t2 = MakeTrack("t2", "Artist B", "Song Two");
    t2.artists.push_back("Guest C");
    ASSERT_TRUE(features_.Upsert(t1, MakeFeatures(0.25F, 98.0F)));
    ASSERT_TRUE(features_.Upsert(t2, MakeFeatures(0.75F, 140.0F)));
    genres_.Upsert("Artist A", {"rock", "indie"});
    genres_.Upsert("Artist B", {});
  }

  void TearDown() override { fs::remove_all(dir_); }

  void FlipByte(std::streamoff offset_from_end) {
    std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
    file.seekg(-offset_from_end, std::ios::end);
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x5A);
    file.seekp(-offset_from_end, std::ios::end);
    file.write(&byte, 1);
  }

  fs::path dir_;
  std::string path_;
  store::FeatureStore features_;
  store::GenreCache genres_;
};

TEST_F(SnapshotTest, RoundTripPreservesRecordsAndOrder) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));
  EXPECT_FALSE(fs::exists(path_ + ".tmp"));

  store::FeatureStore loaded_features;
  store::GenreCache loaded_genres;
  auto result = snapshot_v1::ReadSnapshotV1(path_, loaded_features, loaded_genres);
  ASSERT_TRUE(result) << result.error().to_string();

  std::vector<std::string> expected_ids = {"t1", "t2"};
  EXPECT_EQ(loaded_features.GetTrackIds(), expected_ids);

  auto t1 = loaded_features.Get("t1");
  ASSERT_TRUE(t1);
  EXPECT_EQ(t1->track.title, "Song One");
  EXPECT_EQ(t1->track.followers, 42000U);
  EXPECT_EQ(t1->track.link, "https://music.example/track/t1");
  EXPECT_EQ(t1->features, MakeFeatures(0.25F, 98.0F));

  auto t2 = loaded_features.Get("t2");
  ASSERT_TRUE(t2);
  EXPECT_FALSE(t2->track.followers.has_value());
  ASSERT_EQ(t2->track.artists.size(), 2U);
  EXPECT_EQ(t2->track.artists[1], "Guest C");

  auto artist_a = loaded_genres.Get("artist a");
  ASSERT_TRUE(artist_a);
  EXPECT_EQ(artist_a->size(), 2U);
  auto artist_b = loaded_genres.Get("Artist B");
  ASSERT_TRUE(artist_b);
  EXPECT_TRUE(artist_b->empty());
}

TEST_F(SnapshotTest, LoadReplacesExistingContents) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));

  store::FeatureStore target;
  store::GenreCache target_genres;
  ASSERT_TRUE(target.Upsert(MakeTrack("stale", "Old Artist"), MakeFeatures(0.1F)));
  target_genres.Upsert("Old Artist", {"polka"});

  ASSERT_TRUE(snapshot_v1::ReadSnapshotV1(path_, target, target_genres));
  EXPECT_FALSE(target.Contains("stale"));
  EXPECT_EQ(target.Size(), 2U);
  EXPECT_FALSE(target_genres.Get("Old Artist").has_value());
}

TEST_F(SnapshotTest, EmptyStoresRoundTrip) {
  store::FeatureStore empty_features;
  store::GenreCache empty_genres;
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, empty_features, empty_genres));

  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  ASSERT_TRUE(snapshot_v1::ReadSnapshotV1(path_, loaded, loaded_genres));
  EXPECT_EQ(loaded.Size(), 0U);
  EXPECT_EQ(loaded_genres.Size(), 0U);
}

TEST_F(SnapshotTest, WriteCreatesParentDirectories) {
  std::string nested = (dir_ / "a" / "b" / "store.snapshot").string();
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(nested, features_, genres_));
  EXPECT_TRUE(fs::exists(nested));
}

TEST_F(SnapshotTest, MissingFileFails) {
  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  auto result = snapshot_v1::ReadSnapshotV1((dir_ / "missing.snapshot").string(), loaded, loaded_genres);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageDumpReadError);
}

TEST_F(SnapshotTest, BadMagicIsRejected) {
  {
    std::ofstream file(path_, std::ios::binary);
    file << "NOPE0000 not a snapshot";
  }
  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  auto result = snapshot_v1::ReadSnapshotV1(path_, loaded, loaded_genres);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageDumpReadError);
}

TEST_F(SnapshotTest, UnsupportedVersionIsRejected) {
  {
    std::ofstream file(path_, std::ios::binary);
    file.write("TMIX", 4);
    uint32_t version = 99;
    file.write(reinterpret_cast<const char*>(&version), sizeof(version));  // NOLINT
  }
  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  auto result = snapshot_v1::ReadSnapshotV1(path_, loaded, loaded_genres);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageVersionMismatch);
}

TEST_F(SnapshotTest, CorruptedBodyIsDetectedAndStoresUntouched) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));
  FlipByte(3);

  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  ASSERT_TRUE(loaded.Upsert(MakeTrack("keep", "Keeper"), MakeFeatures(0.1F)));

  snapshot_format::IntegrityError integrity;
  auto result = snapshot_v1::ReadSnapshotV1(path_, loaded, loaded_genres, &integrity);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageCRCMismatch);
  EXPECT_TRUE(integrity.HasError());
  EXPECT_TRUE(loaded.Contains("keep"));
  EXPECT_EQ(loaded.Size(), 1U);
}

TEST_F(SnapshotTest, TruncatedFileIsDetected) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));
  auto size = fs::file_size(path_);
  fs::resize_file(path_, size - 10);

  snapshot_format::IntegrityError integrity;
  auto result = snapshot_v1::VerifySnapshotIntegrity(path_, integrity);
  ASSERT_FALSE(result);
  EXPECT_EQ(integrity.type, snapshot_format::CRCErrorType::FileCRC);
}

TEST_F(SnapshotTest, VerifyIntegrityPassesForFreshSnapshot) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));
  snapshot_format::IntegrityError integrity;
  auto result = snapshot_v1::VerifySnapshotIntegrity(path_, integrity);
  EXPECT_TRUE(result) << result.error().to_string();
  EXPECT_FALSE(integrity.HasError());
}

TEST_F(SnapshotTest, SnapshotInfoReportsCounts) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));
  snapshot_v1::SnapshotInfo info;
  ASSERT_TRUE(snapshot_v1::GetSnapshotInfo(path_, info));
  EXPECT_EQ(info.version, 1U);
  EXPECT_EQ(info.section_count, 2U);
  EXPECT_EQ(info.track_count, 2U);
  EXPECT_EQ(info.artist_count, 2U);
  EXPECT_EQ(info.file_size, fs::file_size(path_));
  EXPECT_NE(info.flags & snapshot_format::flags_v1::kWithCRC, 0U);
  EXPECT_GT(info.timestamp, 0U);
}

TEST_F(SnapshotTest, OversizedSectionLengthIsRejected) {
  ASSERT_TRUE(snapshot_v1::WriteSnapshotV1(path_, features_, genres_));

  // Body: section count, then the "features" name (length + 8 bytes), then the section length
  uint32_t header_size = 0;
  {
    std::ifstream file(path_, std::ios::binary);
    file.seekg(static_cast<std::streamoff>(snapshot_format::kFixedHeaderSize));
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));  // NOLINT
  }
  const auto length_offset = static_cast<std::streamoff>(snapshot_format::kFixedHeaderSize + header_size +
                                                         sizeof(uint32_t) + sizeof(uint32_t) + 8);
  {
    std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(length_offset);
    uint32_t huge = 0xFFFFFFF0U;
    file.write(reinterpret_cast<const char*>(&huge), sizeof(huge));  // NOLINT
  }

  snapshot_v1::SnapshotInfo info;
  auto info_result = snapshot_v1::GetSnapshotInfo(path_, info);
  ASSERT_FALSE(info_result);
  EXPECT_EQ(info_result.error().code(), utils::ErrorCode::kStorageDumpReadError);

  store::FeatureStore loaded;
  store::GenreCache loaded_genres;
  EXPECT_FALSE(snapshot_v1::ReadSnapshotV1(path_, loaded, loaded_genres));
  EXPECT_EQ(loaded.Size(), 0U);
}

TEST_F(SnapshotTest, CRC32MatchesZlibReference) {
  // Standard check value for "123456789"
  EXPECT_EQ(snapshot_v1::CalculateCRC32(std::string("123456789")), 0xCBF43926U);
}

}  // namespace tastemix::storage
