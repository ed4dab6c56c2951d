/**
 * @file genre_cache.h
 * @brief Artist -> genre set cache
 */

#pragma once

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tastemix::store {

/**
 * @brief Set of lowercase genre tags
 */
using GenreSet = std::set<std::string>;

/**
 * @brief Build a GenreSet from raw provider tags
 *
 * Tags are trimmed and lowercased; empty tags are dropped.
 */
GenreSet MakeGenreSet(const std::vector<std::string>& tags);

/**
 * @brief Number of tags present in both sets
 */
size_t CountOverlap(const GenreSet& lhs, const GenreSet& rhs);

/**
 * @brief Thread-safe genre cache keyed by normalized artist name
 *
 * An empty GenreSet is a valid cached value: it records that no source
 * knew the artist, and Get() returns it as a hit.
 */
class GenreCache {
 public:
  GenreCache() = default;

  GenreCache(const GenreCache&) = delete;
  GenreCache& operator=(const GenreCache&) = delete;

  /**
   * @brief Replace the genres cached for an artist (never merged)
   */
  void Upsert(const std::string& artist, GenreSet genres);

  /**
   * @brief Cached genres, or nullopt on a miss
   */
  std::optional<GenreSet> Get(const std::string& artist) const;

  size_t Size() const;

  /**
   * @brief All entries sorted by normalized artist name
   */
  std::vector<std::pair<std::string, GenreSet>> Entries() const;

  void Clear();

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, GenreSet> genres_;  ///< Normalized artist -> genres
};

}  // namespace tastemix::store
