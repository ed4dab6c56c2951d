/**
 * @file feature_extractor.h
 * @brief Feature extraction boundary
 */

#pragma once

#include "features/feature_vector.h"
#include "store/track.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::ingest {

/**
 * @brief Turns a track into a feature vector
 *
 * Extraction is slow and failure-prone. Error codes distinguish the
 * failure kinds the ingestion layer cares about:
 * - kExtractionUnavailable: source audio or service unavailable
 * - kExtractionRateLimited: the service asked us to slow down
 * - kTimeout: the call exceeded its per-call timeout
 * - kExtractionInvalidResponse: the service answered with garbage
 *
 * Implementations must be safe to call from several threads at once.
 */
class FeatureExtractor {
 public:
  virtual ~FeatureExtractor() = default;

  virtual utils::Expected<features::FeatureVector, utils::Error> Extract(const store::Track& track) = 0;
};

}  // namespace tastemix::ingest
