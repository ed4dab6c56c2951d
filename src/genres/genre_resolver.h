/**
 * @file genre_resolver.h
 * @brief Cache-first genre resolution with an ordered source fallback chain
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "genres/genre_source.h"
#include "store/genre_cache.h"

namespace tastemix::genres {

/**
 * @brief Resolution counters
 */
struct GenreResolverStatistics {
  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  uint64_t source_calls = 0;
  uint64_t source_failures = 0;
};

/**
 * @brief Resolves an artist's genres
 *
 * 1. Cache lookup. A hit, including a cached empty set, returns without
 *    any external call.
 * 2. On a miss, sources are queried in order; the first non-empty result
 *    wins. Results are never merged across sources.
 * 3. The result is written back to the cache, replacing any earlier value.
 *
 * Source failures are logged and skipped. When every source fails or
 * returns nothing, an empty set is cached and returned.
 *
 * Thread-safety: safe for concurrent use if every source is. Two threads
 * missing on the same artist may both query the sources; the last write
 * wins.
 */
class GenreResolver {
 public:
  /**
   * @param cache Shared genre cache (must outlive the resolver)
   * @param sources Sources in priority order
   */
  GenreResolver(store::GenreCache& cache, std::vector<std::unique_ptr<GenreSource>> sources);

  /**
   * @brief Resolve genres for an artist
   * @return Genre set, empty when nothing is known
   */
  store::GenreSet ResolveGenres(const std::string& artist);

  size_t SourceCount() const { return sources_.size(); }

  GenreResolverStatistics GetStatistics() const;

 private:
  store::GenreCache& cache_;
  std::vector<std::unique_ptr<GenreSource>> sources_;

  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> source_calls_{0};
  std::atomic<uint64_t> source_failures_{0};
};

}  // namespace tastemix::genres
