/**
 * @file feature_store.cpp
 * @brief Feature store implementation
 */

#include "store/feature_store.h"

#include <mutex>

#include "utils/structured_log.h"

namespace tastemix::store {

utils::Expected<void, utils::Error> FeatureStore::Upsert(const Track& track, const features::FeatureVector& vec) {
  if (track.id.empty()) {
    auto error = utils::MakeError(utils::ErrorCode::kTrackInvalid, "Track id cannot be empty");
    utils::LogStoreError("upsert", track.id, error.message());
    return utils::MakeUnexpected(error);
  }

  if (track.artists.empty()) {
    auto error = utils::MakeError(utils::ErrorCode::kTrackInvalid, "Track must have at least one artist");
    utils::LogStoreError("upsert", track.id, error.message());
    return utils::MakeUnexpected(error);
  }

  if (!vec.IsFinite()) {
    auto error = utils::MakeError(utils::ErrorCode::kFeatureInvalidValue, "Feature vector has non-finite values");
    utils::LogStoreError("upsert", track.id, error.message());
    return utils::MakeUnexpected(error);
  }

  std::unique_lock lock(mutex_);
  auto iter = records_.find(track.id);
  if (iter == records_.end()) {
    order_.push_back(track.id);
    records_.emplace(track.id, FeatureRecord{track, vec});
  } else {
    iter->second = FeatureRecord{track, vec};
  }
  return {};
}

std::optional<FeatureRecord> FeatureStore::Get(const std::string& track_id) const {
  std::shared_lock lock(mutex_);

  auto iter = records_.find(track_id);
  if (iter == records_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

bool FeatureStore::Contains(const std::string& track_id) const {
  std::shared_lock lock(mutex_);
  return records_.find(track_id) != records_.end();
}

std::vector<std::string> FeatureStore::GetTrackIds() const {
  std::shared_lock lock(mutex_);
  return order_;
}

std::vector<FeatureRecord> FeatureStore::Snapshot() const {
  std::shared_lock lock(mutex_);

  std::vector<FeatureRecord> records;
  records.reserve(order_.size());
  for (const auto& track_id : order_) {
    records.push_back(records_.at(track_id));
  }
  return records;
}

size_t FeatureStore::Size() const {
  std::shared_lock lock(mutex_);
  return records_.size();
}

void FeatureStore::Clear() {
  std::unique_lock lock(mutex_);
  order_.clear();
  records_.clear();
}

FeatureStoreStatistics FeatureStore::GetStatistics() const {
  std::shared_lock lock(mutex_);

  FeatureStoreStatistics stats;
  stats.track_count = records_.size();
  stats.memory_bytes = MemoryUsageLocked();
  return stats;
}

size_t FeatureStore::MemoryUsageLocked() const {
  size_t total = sizeof(*this);

  for (const auto& track_id : order_) {
    total += sizeof(std::string) + track_id.capacity();
  }

  for (const auto& [track_id, record] : records_) {
    total += sizeof(std::string) + track_id.capacity();
    total += sizeof(FeatureRecord);
    total += record.track.title.capacity() + record.track.link.capacity();
    for (const auto& artist : record.track.artists) {
      total += sizeof(std::string) + artist.capacity();
    }
  }

  return total;
}

}  // namespace tastemix::store
