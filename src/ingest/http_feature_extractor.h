/**
 * @file http_feature_extractor.h
 * @brief Feature extractor calling an extraction service over HTTP
 */

#pragma once

#include <string>

#include "config/config.h"
#include "ingest/feature_extractor.h"

namespace tastemix::ingest {

/**
 * @brief Parse an extraction service response
 *
 * Expected body: {"features": {"tempo_bpm": 120.0, ..., "acousticness": 0.1}}
 * with every dimension present and numeric. Unknown keys are ignored.
 *
 * @return Feature vector or kExtractionInvalidResponse
 */
utils::Expected<features::FeatureVector, utils::Error> ParseFeatureResponse(const std::string& body);

/**
 * @brief Build the JSON request body for a track
 */
std::string BuildFeatureRequest(const store::Track& track);

/**
 * @brief HTTP feature extractor (cpp-httplib client)
 *
 * POSTs the track as JSON to `extractor.url + extractor.path`. Connect and
 * read timeouts come from `extractor.timeout_ms`.
 *
 * Status mapping:
 * - 200: parse body
 * - 429: kExtractionRateLimited
 * - read failure (timeout): kTimeout
 * - anything else: kExtractionUnavailable
 */
class HttpFeatureExtractor : public FeatureExtractor {
 public:
  explicit HttpFeatureExtractor(config::ExtractorConfig config);

  utils::Expected<features::FeatureVector, utils::Error> Extract(const store::Track& track) override;

 private:
  config::ExtractorConfig config_;
};

}  // namespace tastemix::ingest
