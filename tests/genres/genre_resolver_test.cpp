/**
 * @file genre_resolver_test.cpp
 * @brief Unit tests for cache-first genre resolution
 */

#include "genres/genre_resolver.h"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "fakes/fake_collaborators.h"

namespace tastemix::genres {

using test_support::FakeGenreSource;

class GenreResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto primary = std::make_unique<FakeGenreSource>("primary");
    auto secondary = std::make_unique<FakeGenreSource>("secondary");
    primary_ = primary.get();
    secondary_ = secondary.get();

    std::vector<std::unique_ptr<GenreSource>> sources;
    sources.push_back(std::move(primary));
    sources.push_back(std::move(secondary));
    resolver_ = std::make_unique<GenreResolver>(cache_, std::move(sources));
  }

  store::GenreCache cache_;
  FakeGenreSource* primary_ = nullptr;
  FakeGenreSource* secondary_ = nullptr;
  std::unique_ptr<GenreResolver> resolver_;
};

TEST_F(GenreResolverTest, FirstNonEmptySourceWins) {
  primary_->Set("Artist", {"Rock", "Indie"});
  secondary_->Set("Artist", {"Jazz"});

  auto genres = resolver_->ResolveGenres("Artist");
  store::GenreSet expected = {"indie", "rock"};
  EXPECT_EQ(genres, expected);
  EXPECT_EQ(primary_->Calls(), 1);
  EXPECT_EQ(secondary_->Calls(), 0);
}

TEST_F(GenreResolverTest, FallsBackWhenPrimaryIsEmpty) {
  secondary_->Set("Artist", {"Jazz", "Bebop"});

  auto genres = resolver_->ResolveGenres("Artist");
  store::GenreSet expected = {"bebop", "jazz"};
  EXPECT_EQ(genres, expected);
  EXPECT_EQ(primary_->Calls(), 1);
  EXPECT_EQ(secondary_->Calls(), 1);
}

TEST_F(GenreResolverTest, SourceFailureIsSkipped) {
  primary_->Fail("Artist");
  secondary_->Set("Artist", {"Folk"});

  auto genres = resolver_->ResolveGenres("Artist");
  EXPECT_EQ(genres.count("folk"), 1U);
  EXPECT_EQ(resolver_->GetStatistics().source_failures, 1U);
}

TEST_F(GenreResolverTest, SecondResolutionMakesNoExternalCalls) {
  primary_->Set("Artist", {"Rock"});

  resolver_->ResolveGenres("Artist");
  int calls_after_first = primary_->Calls() + secondary_->Calls();
  auto genres = resolver_->ResolveGenres("artist");

  EXPECT_EQ(primary_->Calls() + secondary_->Calls(), calls_after_first);
  EXPECT_EQ(genres.count("rock"), 1U);
  auto stats = resolver_->GetStatistics();
  EXPECT_EQ(stats.cache_hits, 1U);
  EXPECT_EQ(stats.cache_misses, 1U);
}

TEST_F(GenreResolverTest, EmptyResultIsCachedAsHit) {
  primary_->Fail("Nobody");

  auto genres = resolver_->ResolveGenres("Nobody");
  EXPECT_TRUE(genres.empty());
  auto cached = cache_.Get("Nobody");
  ASSERT_TRUE(cached.has_value());
  EXPECT_TRUE(cached->empty());

  int calls = primary_->Calls() + secondary_->Calls();
  EXPECT_TRUE(resolver_->ResolveGenres("Nobody").empty());
  EXPECT_EQ(primary_->Calls() + secondary_->Calls(), calls);
}

TEST_F(GenreResolverTest, PreexistingCacheEntryIsUsed) {
  cache_.Upsert("Artist", {"shoegaze"});
  primary_->Set("Artist", {"Rock"});

  auto genres = resolver_->ResolveGenres("Artist");
  EXPECT_EQ(genres.count("shoegaze"), 1U);
  EXPECT_EQ(primary_->Calls(), 0);
}

TEST(GenreResolverNoSourcesTest, ResolvesToEmpty) {
  store::GenreCache cache;
  GenreResolver resolver(cache, {});
  EXPECT_TRUE(resolver.ResolveGenres("Anyone").empty());
  EXPECT_EQ(resolver.SourceCount(), 0U);
  EXPECT_EQ(cache.Size(), 1U);
}

}  // namespace tastemix::genres
