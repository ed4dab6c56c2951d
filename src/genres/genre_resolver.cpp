/**
 * @file genre_resolver.cpp
 * @brief Genre resolver implementation
 */

#include "genres/genre_resolver.h"

#include "utils/structured_log.h"

namespace tastemix::genres {

GenreResolver::GenreResolver(store::GenreCache& cache, std::vector<std::unique_ptr<GenreSource>> sources)
    : cache_(cache), sources_(std::move(sources)) {}

store::GenreSet GenreResolver::ResolveGenres(const std::string& artist) {
  if (auto cached = cache_.Get(artist)) {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
    return *cached;
  }
  cache_misses_.fetch_add(1, std::memory_order_relaxed);

  store::GenreSet genres;
  std::string winning_source;
  for (const auto& source : sources_) {
    source_calls_.fetch_add(1, std::memory_order_relaxed);
    auto result = source->Lookup(artist);
    if (!result) {
      source_failures_.fetch_add(1, std::memory_order_relaxed);
      utils::LogGenreSourceFailure(source->Name(), artist, result.error().to_string());
      continue;
    }
    if (!result->empty()) {
      genres = std::move(*result);
      winning_source = source->Name();
      break;
    }
  }

  cache_.Upsert(artist, genres);

  utils::StructuredLog()
      .Event("genres_resolved")
      .Field("artist", artist)
      .Field("source", winning_source.empty() ? std::string("none") : winning_source)
      .Field("genre_count", static_cast<uint64_t>(genres.size()))
      .Debug();

  return genres;
}

GenreResolverStatistics GenreResolver::GetStatistics() const {
  GenreResolverStatistics stats;
  stats.cache_hits = cache_hits_.load(std::memory_order_relaxed);
  stats.cache_misses = cache_misses_.load(std::memory_order_relaxed);
  stats.source_calls = source_calls_.load(std::memory_order_relaxed);
  stats.source_failures = source_failures_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace tastemix::genres
