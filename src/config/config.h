/**
 * @file config.h
 * @brief Configuration structures and YAML parser for tastemix
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::config {

// Default values for configuration
namespace defaults {

// Run defaults
constexpr uint32_t kRunCount = 10;
constexpr uint32_t kMaxRunCount = 50;
constexpr uint32_t kSafetyCapMultiplier = 3;  // Total winner draws <= count * multiplier
constexpr uint64_t kRunSeed = 0;              // 0 = seed from std::random_device

// Lottery weights by number of liked tracks
constexpr double kLikedOnce = 10.0;
constexpr double kLikedTwice = 5.0;
constexpr double kLikedThrice = 2.0;
constexpr double kLikedMore = 1.0;
constexpr double kListeningBoost = 1.5;
constexpr double kRecentWeight = 3.0;
constexpr double kShortTermWeight = 2.0;
constexpr double kMediumTermWeight = 1.0;

// Ingestion defaults
constexpr uint32_t kMaxAttempts = 5;
constexpr uint32_t kBackoffBaseMs = 1000;
constexpr uint32_t kBackoffMaxMs = 8000;

// Matcher defaults
constexpr uint32_t kStrictMinOverlap = 3;
constexpr uint32_t kRelaxedMinOverlap = 1;
constexpr uint32_t kStrictScanLimit = 100;
constexpr uint64_t kMaxFollowerCount = 0;  // 0 = no popularity cap

// External collaborator defaults
constexpr uint32_t kExtractorTimeoutMs = 30000;
constexpr uint32_t kGenreSourceTimeoutMs = 5000;
constexpr const char* kExtractorPath = "/v1/features";

// Storage defaults
constexpr const char* kSnapshotPath = "tastemix.snapshot";

// Catalog builder defaults
constexpr uint32_t kCatalogThreads = 4;

}  // namespace defaults

/**
 * @brief Run configuration
 */
struct RunConfig {
  uint32_t count = defaults::kRunCount;                             ///< Recommendations requested per run
  uint32_t safety_cap_multiplier = defaults::kSafetyCapMultiplier;  ///< Winner draw cap factor
  uint64_t seed = defaults::kRunSeed;                               ///< RNG seed (0 = random)
};

/**
 * @brief Artist weight derivation
 */
struct LotteryConfig {
  double liked_once = defaults::kLikedOnce;                 ///< Weight for an artist with one liked track
  double liked_twice = defaults::kLikedTwice;               ///< Two liked tracks
  double liked_thrice = defaults::kLikedThrice;             ///< Three liked tracks
  double liked_more = defaults::kLikedMore;                 ///< Four or more
  double listening_boost = defaults::kListeningBoost;       ///< Multiplier when listened to recently
  double recent_weight = defaults::kRecentWeight;           ///< Listening signal per recent play
  double short_term_weight = defaults::kShortTermWeight;    ///< Per short-term top track
  double medium_term_weight = defaults::kMediumTermWeight;  ///< Per medium-term top track
};

/**
 * @brief Seed ingestion configuration
 */
struct IngestionConfig {
  uint32_t max_attempts = defaults::kMaxAttempts;       ///< Extraction attempts per winner
  uint32_t backoff_base_ms = defaults::kBackoffBaseMs;  ///< First backoff after a rate-limited failure
  uint32_t backoff_max_ms = defaults::kBackoffMaxMs;    ///< Backoff ceiling
};

/**
 * @brief Similarity matcher configuration
 */
struct MatcherConfig {
  uint32_t strict_min_overlap = defaults::kStrictMinOverlap;    ///< Phase 1 genre overlap threshold
  uint32_t relaxed_min_overlap = defaults::kRelaxedMinOverlap;  ///< Phase 2 genre overlap threshold
  uint32_t strict_scan_limit = defaults::kStrictScanLimit;      ///< Eligible candidates examined in phase 1
  uint64_t max_follower_count = defaults::kMaxFollowerCount;    ///< Popularity cap (0 = disabled)
};

/**
 * @brief Feature extraction service
 */
struct ExtractorConfig {
  std::string url;                                      ///< Base URL, e.g. "http://127.0.0.1:9000"
  std::string path = defaults::kExtractorPath;          ///< Request path
  uint32_t timeout_ms = defaults::kExtractorTimeoutMs;  ///< Connect and read timeout
  std::string api_key;                                  ///< Sent as a bearer token when set
};

/**
 * @brief One external genre provider, in priority order
 */
struct GenreSourceConfig {
  std::string name;  ///< Display name used in logs
  std::string kind;  ///< spotify, lastfm, musicbrainz or audiodb
  std::string url;   ///< Base URL of the provider API
  std::string api_key;
  uint32_t timeout_ms = defaults::kGenreSourceTimeoutMs;
};

/**
 * @brief Snapshot persistence
 */
struct StorageConfig {
  std::string snapshot_path = defaults::kSnapshotPath;  ///< Store snapshot file
  bool autosave = true;                                 ///< Save after run / build-catalog
};

/**
 * @brief Bulk catalog ingestion
 */
struct CatalogConfig {
  uint32_t threads = defaults::kCatalogThreads;  ///< Worker pool size
  bool overwrite = false;                        ///< Re-extract tracks already in the store
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  RunConfig run;
  LotteryConfig lottery;
  IngestionConfig ingestion;
  MatcherConfig matcher;
  ExtractorConfig extractor;
  std::vector<GenreSourceConfig> genre_sources;
  StorageConfig storage;
  CatalogConfig catalog;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML file
 *
 * The file is converted to JSON and checked against the embedded schema
 * before the sections are parsed, then ValidateConfig runs on the result.
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace tastemix::config
