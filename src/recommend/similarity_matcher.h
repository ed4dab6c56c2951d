/**
 * @file similarity_matcher.h
 * @brief Genre-overlap matching with a feature-distance fallback
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "config/config.h"
#include "genres/genre_resolver.h"
#include "store/feature_store.h"

namespace tastemix::recommend {

/**
 * @brief Which rule produced a match
 */
enum class MatchPhase : std::uint8_t {
  kStrict,    // Overlap >= strict threshold within the scan limit
  kRelaxed,   // Overlap >= relaxed threshold, unbounded scan
  kDistance,  // Seed artist has no genres; nearest feature vector
};

const char* MatchPhaseToString(MatchPhase phase);

/**
 * @brief A recommended track and the reason it was chosen
 */
struct CandidateResult {
  std::string seed_artist;         ///< Lottery winner that produced the seed
  store::Track track;              ///< Recommended track
  size_t overlap = 0;              ///< Shared genres with the seed artist
  std::optional<double> distance;  ///< Euclidean distance (distance phase only)
  store::GenreSet genres;          ///< Candidate's genres
  MatchPhase phase = MatchPhase::kStrict;
};

/**
 * @brief Finds one recommendation for a seed track
 *
 * The candidate population is the feature store, enumerated in insertion
 * order. A candidate is eligible unless it is the seed track itself, has no
 * artists, lists the seed artist or an excluded artist, or its primary
 * artist's known follower count exceeds the popularity cap.
 *
 * 1. Strict phase: the first of at most strict_scan_limit eligible
 *    candidates whose primary artist shares >= strict_min_overlap genres
 *    with the seed artist.
 * 2. Relaxed phase: restart from the beginning, no bound, first candidate
 *    with overlap >= relaxed_min_overlap.
 * 3. When the seed artist has no genres, both phases are skipped and the
 *    eligible candidate with the smallest L2 distance wins (first on ties).
 *
 * The only side effects are genre cache writes made by the resolver.
 */
class SimilarityMatcher {
 public:
  SimilarityMatcher(const store::FeatureStore& store, genres::GenreResolver& resolver, config::MatcherConfig config);

  /**
   * @brief Find a match for a seed
   *
   * @param seed_artist Artist whose genres drive the match
   * @param seed Seed track and features
   * @param excluded_artists Artists that must not be recommended (any case)
   * @return Match, or kNoMatch when no candidate qualifies
   */
  utils::Expected<CandidateResult, utils::Error> FindMatch(const std::string& seed_artist,
                                                           const store::FeatureRecord& seed,
                                                           const std::set<std::string>& excluded_artists);

 private:
  bool IsEligible(const store::FeatureRecord& candidate, const store::FeatureRecord& seed,
                  const std::set<std::string>& blocked) const;

  const store::FeatureStore& store_;
  genres::GenreResolver& resolver_;
  config::MatcherConfig config_;
};

}  // namespace tastemix::recommend
