/**
 * @file genre_cache.cpp
 * @brief Genre cache implementation
 */

#include "store/genre_cache.h"

#include <algorithm>
#include <mutex>

#include "utils/string_utils.h"

namespace tastemix::store {

GenreSet MakeGenreSet(const std::vector<std::string>& tags) {
  GenreSet genres;
  for (const auto& tag : tags) {
    std::string normalized = utils::NormalizeName(tag);
    if (!normalized.empty()) {
      genres.insert(std::move(normalized));
    }
  }
  return genres;
}

size_t CountOverlap(const GenreSet& lhs, const GenreSet& rhs) {
  size_t count = 0;
  auto left = lhs.begin();
  auto right = rhs.begin();
  // Both sets are ordered, so a single merge pass is enough
  while (left != lhs.end() && right != rhs.end()) {
    if (*left < *right) {
      ++left;
    } else if (*right < *left) {
      ++right;
    } else {
      ++count;
      ++left;
      ++right;
    }
  }
  return count;
}

void GenreCache::Upsert(const std::string& artist, GenreSet genres) {
  std::string key = utils::NormalizeName(artist);
  std::unique_lock lock(mutex_);
  genres_[key] = std::move(genres);
}

std::optional<GenreSet> GenreCache::Get(const std::string& artist) const {
  std::string key = utils::NormalizeName(artist);
  std::shared_lock lock(mutex_);

  auto iter = genres_.find(key);
  if (iter == genres_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

size_t GenreCache::Size() const {
  std::shared_lock lock(mutex_);
  return genres_.size();
}

std::vector<std::pair<std::string, GenreSet>> GenreCache::Entries() const {
  std::vector<std::pair<std::string, GenreSet>> entries;
  {
    std::shared_lock lock(mutex_);
    entries.assign(genres_.begin(), genres_.end());
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  return entries;
}

void GenreCache::Clear() {
  std::unique_lock lock(mutex_);
  genres_.clear();
}

}  // namespace tastemix::store
