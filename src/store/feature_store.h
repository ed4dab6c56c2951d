/**
 * @file feature_store.h
 * @brief Persistent keyed cache: track id -> (Track, FeatureVector)
 *
 * Thread-safe, upsert-only storage for extracted feature vectors. Records
 * are enumerated in insertion order; replacing an existing id keeps its
 * original position.
 */

#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "features/feature_vector.h"
#include "store/track.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::store {

/**
 * @brief A track together with its extracted features
 */
struct FeatureRecord {
  Track track;
  features::FeatureVector features;
};

/**
 * @brief Feature store statistics
 */
struct FeatureStoreStatistics {
  size_t track_count = 0;   ///< Number of stored records
  size_t memory_bytes = 0;  ///< Estimated memory usage in bytes
};

/**
 * @brief Thread-safe feature vector storage
 *
 * Thread-safety:
 * - Multiple concurrent readers (Get, Contains, Snapshot, etc.)
 * - Exclusive writer (Upsert, Clear); last writer wins on whole records
 *
 * Example:
 * @code
 * FeatureStore store;
 * auto result = store.Upsert(track, vec);
 * if (result) {
 *   auto record = store.Get(track.id);
 * }
 * @endcode
 */
class FeatureStore {
 public:
  FeatureStore() = default;

  FeatureStore(const FeatureStore&) = delete;
  FeatureStore& operator=(const FeatureStore&) = delete;

  /**
   * @brief Insert or replace the record for track.id
   *
   * @param track Track metadata (id and at least one artist required)
   * @param vec Feature vector (all components finite)
   * @return Expected<void, Error> Success, kTrackInvalid or kFeatureInvalidValue
   */
  utils::Expected<void, utils::Error> Upsert(const Track& track, const features::FeatureVector& vec);

  /**
   * @brief Retrieve a record by track id
   * @return Record copy, or nullopt if not found
   */
  std::optional<FeatureRecord> Get(const std::string& track_id) const;

  bool Contains(const std::string& track_id) const;

  /**
   * @brief All track ids in insertion order
   */
  std::vector<std::string> GetTrackIds() const;

  /**
   * @brief Copy of all records in insertion order
   *
   * The copy is a consistent view; later upserts do not affect it.
   */
  std::vector<FeatureRecord> Snapshot() const;

  size_t Size() const;

  /**
   * @brief Remove all records
   */
  void Clear();

  FeatureStoreStatistics GetStatistics() const;

 private:
  size_t MemoryUsageLocked() const;

  mutable std::shared_mutex mutex_;                         ///< Reader-writer lock
  std::vector<std::string> order_;                          ///< Track ids in insertion order
  std::unordered_map<std::string, FeatureRecord> records_;  ///< Track id -> record
};

}  // namespace tastemix::store
