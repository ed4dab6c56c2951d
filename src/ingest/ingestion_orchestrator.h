/**
 * @file ingestion_orchestrator.h
 * @brief Guarantees a seed feature vector for a lottery winner
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "config/config.h"
#include "ingest/feature_extractor.h"
#include "store/feature_store.h"

namespace tastemix::ingest {

/**
 * @brief Seed acquisition states
 *
 * TRYING(track, attempt) -> READY(vector) on extraction success or a cached
 * track; TRYING -> TRYING(next track, attempt + 1) on failure while
 * attempts remain; TRYING -> EXHAUSTED when attempts or tracks run out.
 */
enum class SeedState : std::uint8_t {
  kTrying,
  kReady,
  kExhausted,
};

const char* SeedStateToString(SeedState state);

/**
 * @brief Per-winner retry bookkeeping
 */
struct RetryState {
  uint32_t attempt = 0;                  ///< Extraction attempts made
  std::set<std::string> tried;           ///< Track ids already attempted
  uint32_t consecutive_rate_limits = 0;  ///< Rate-limited failures in a row
};

/**
 * @brief A seed ready for matching
 */
struct SeedReady {
  store::FeatureRecord seed;  ///< Seed track and its features
  uint32_t attempts = 0;      ///< Extraction calls made (0 for a cached track)
  bool from_cache = false;    ///< True when no extraction was needed
};

/**
 * @brief Runs the retry state machine for one winner at a time
 *
 * Successful extractions are upserted into the feature store before the
 * seed is returned. The attempt budget is scoped to a single EnsureSeed()
 * call. A rate-limited failure is followed by an exponential backoff
 * (base * 2^(n-1), capped) before the next attempt; the attempt budget does
 * not depend on the failure kind.
 */
class IngestionOrchestrator {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param store Feature store receiving new vectors (must outlive this object)
   * @param extractor Extraction boundary (must outlive this object)
   * @param config Attempt budget and backoff settings
   * @param sleeper Backoff sleep function (defaults to std::this_thread::sleep_for)
   */
  IngestionOrchestrator(store::FeatureStore& store, FeatureExtractor& extractor, config::IngestionConfig config,
                        Sleeper sleeper = nullptr);

  /**
   * @brief Obtain a seed vector for a winner
   *
   * A candidate already in the store is returned first without any
   * extraction call. Otherwise untried candidates are extracted in order.
   *
   * @param winner_artist Artist that won the lottery (for logs and errors)
   * @param candidates The winner's tracks, in the order to try them
   * @return Seed, or kSeedExhausted after max_attempts failures or when no
   *         untried track is left
   */
  utils::Expected<SeedReady, utils::Error> EnsureSeed(const std::string& winner_artist,
                                                      const std::vector<store::Track>& candidates);

  /**
   * @brief Delay applied after the n-th consecutive rate-limited failure
   */
  std::chrono::milliseconds BackoffDelay(uint32_t consecutive_rate_limits) const;

 private:
  store::FeatureStore& store_;
  FeatureExtractor& extractor_;
  config::IngestionConfig config_;
  Sleeper sleeper_;
};

}  // namespace tastemix::ingest
