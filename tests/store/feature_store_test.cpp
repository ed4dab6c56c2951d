/**
 * @file feature_store_test.cpp
 * @brief Unit tests for FeatureStore
 */

#include "store/feature_store.h"

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>
#include <vector>

#include "fakes/fake_collaborators.h"

namespace tastemix::store {

using test_support::MakeFeatures;
using test_support::MakeTrack;

class FeatureStoreTest : public ::testing::Test {
 protected:
  FeatureStore store_;
};

TEST_F(FeatureStoreTest, UpsertAndGet) {
  auto track = MakeTrack("t1", "Artist A", "First Song");
  track.followers = 1500;
  ASSERT_TRUE(store_.Upsert(track, MakeFeatures(0.25F)));

  auto record = store_.Get("t1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->track.title, "First Song");
  EXPECT_EQ(record->track.PrimaryArtist(), "Artist A");
  EXPECT_EQ(record->track.followers, 1500U);
  EXPECT_EQ(record->features, MakeFeatures(0.25F));
  EXPECT_TRUE(store_.Contains("t1"));
  EXPECT_EQ(store_.Size(), 1U);
}

TEST_F(FeatureStoreTest, GetMissingReturnsNullopt) {
  EXPECT_FALSE(store_.Get("missing").has_value());
  EXPECT_FALSE(store_.Contains("missing"));
}

TEST_F(FeatureStoreTest, RejectsTrackWithoutId) {
  auto result = store_.Upsert(MakeTrack("", "Artist A"), MakeFeatures(0.1F));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kTrackInvalid);
  EXPECT_EQ(store_.Size(), 0U);
}

TEST_F(FeatureStoreTest, RejectsTrackWithoutArtists) {
  Track track;
  track.id = "t1";
  auto result = store_.Upsert(track, MakeFeatures(0.1F));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kTrackInvalid);
}

TEST_F(FeatureStoreTest, RejectsNonFiniteFeatures) {
  auto vec = MakeFeatures(0.1F);
  vec.values[5] = std::numeric_limits<float>::infinity();
  auto result = store_.Upsert(MakeTrack("t1", "Artist A"), vec);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kFeatureInvalidValue);
  EXPECT_FALSE(store_.Contains("t1"));
}

TEST_F(FeatureStoreTest, InsertionOrderIsStable) {
  ASSERT_TRUE(store_.Upsert(MakeTrack("c", "Artist C"), MakeFeatures(0.3F)));
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A"), MakeFeatures(0.1F)));
  ASSERT_TRUE(store_.Upsert(MakeTrack("b", "Artist B"), MakeFeatures(0.2F)));

  std::vector<std::string> expected = {"c", "a", "b"};
  EXPECT_EQ(store_.GetTrackIds(), expected);

  auto records = store_.Snapshot();
  ASSERT_EQ(records.size(), 3U);
  EXPECT_EQ(records[0].track.id, "c");
  EXPECT_EQ(records[2].track.id, "b");
}

TEST_F(FeatureStoreTest, ReplaceKeepsOriginalPosition) {
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A"), MakeFeatures(0.1F)));
  ASSERT_TRUE(store_.Upsert(MakeTrack("b", "Artist B"), MakeFeatures(0.2F)));
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A", "Remaster"), MakeFeatures(0.9F)));

  std::vector<std::string> expected = {"a", "b"};
  EXPECT_EQ(store_.GetTrackIds(), expected);
  EXPECT_EQ(store_.Size(), 2U);

  auto record = store_.Get("a");
  ASSERT_TRUE(record);
  EXPECT_EQ(record->track.title, "Remaster");
  EXPECT_EQ(record->features, MakeFeatures(0.9F));
}

TEST_F(FeatureStoreTest, SnapshotIsIndependentCopy) {
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A"), MakeFeatures(0.1F)));
  auto records = store_.Snapshot();
  ASSERT_TRUE(store_.Upsert(MakeTrack("b", "Artist B"), MakeFeatures(0.2F)));
  EXPECT_EQ(records.size(), 1U);
  EXPECT_EQ(store_.Size(), 2U);
}

TEST_F(FeatureStoreTest, ClearRemovesEverything) {
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A"), MakeFeatures(0.1F)));
  store_.Clear();
  EXPECT_EQ(store_.Size(), 0U);
  EXPECT_TRUE(store_.GetTrackIds().empty());
}

TEST_F(FeatureStoreTest, Statistics) {
  ASSERT_TRUE(store_.Upsert(MakeTrack("a", "Artist A"), MakeFeatures(0.1F)));
  ASSERT_TRUE(store_.Upsert(MakeTrack("b", "Artist B"), MakeFeatures(0.2F)));
  auto stats = store_.GetStatistics();
  EXPECT_EQ(stats.track_count, 2U);
  EXPECT_GT(stats.memory_bytes, 0U);
}

TEST_F(FeatureStoreTest, ConcurrentUpsertsAndReads) {
  const int num_writers = 4;
  const int per_writer = 250;
  std::atomic<bool> stop{false};

  std::thread reader([this, &stop]() {
    while (!stop.load()) {
      auto records = store_.Snapshot();
      for (const auto& record : records) {
        ASSERT_FALSE(record.track.id.empty());
      }
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < num_writers; ++w) {
    writers.emplace_back([this, w]() {
      for (int i = 0; i < per_writer; ++i) {
        auto id = "w" + std::to_string(w) + "-" + std::to_string(i);
        ASSERT_TRUE(store_.Upsert(MakeTrack(id, "Artist"), MakeFeatures(static_cast<float>(i))));
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  stop = true;
  reader.join();

  EXPECT_EQ(store_.Size(), static_cast<size_t>(num_writers * per_writer));
  EXPECT_EQ(store_.GetTrackIds().size(), store_.Size());
}

}  // namespace tastemix::store
