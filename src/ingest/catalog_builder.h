/**
 * @file catalog_builder.h
 * @brief Bulk feature ingestion on a worker pool
 */

#pragma once

#include <cstddef>
#include <vector>

#include "config/config.h"
#include "ingest/feature_extractor.h"
#include "store/feature_store.h"

namespace tastemix::ingest {

/**
 * @brief Outcome counts of one catalog build
 */
struct CatalogReport {
  size_t processed = 0;  ///< Tracks extracted and upserted
  size_t skipped = 0;    ///< Tracks already present (overwrite disabled)
  size_t failed = 0;     ///< Tracks whose extraction or upsert failed
};

/**
 * @brief Extracts and stores feature vectors for a list of tracks
 *
 * Work is spread over a fixed-size utils::ThreadPool. Individual failures
 * are logged and counted; they never abort the batch.
 */
class CatalogBuilder {
 public:
  /**
   * @param store Destination store (must outlive this object)
   * @param extractor Extraction boundary, called concurrently (must outlive this object)
   * @param config Worker count and overwrite flag
   */
  CatalogBuilder(store::FeatureStore& store, FeatureExtractor& extractor, config::CatalogConfig config);

  /**
   * @brief Process every track and block until all are done
   */
  CatalogReport Build(const std::vector<store::Track>& tracks);

 private:
  store::FeatureStore& store_;
  FeatureExtractor& extractor_;
  config::CatalogConfig config_;
};

}  // namespace tastemix::ingest
