/**
 * @file run_controller.h
 * @brief Drives one recommendation run from lottery to results
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.h"
#include "ingest/ingestion_orchestrator.h"
#include "profile/listener_profile.h"
#include "recommend/lottery_selector.h"
#include "recommend/similarity_matcher.h"

namespace tastemix::recommend {

/**
 * @brief Why a run stopped
 */
enum class RunOutcome : std::uint8_t {
  kCompleted,         // Every drawn winner was processed
  kPoolExhausted,     // A replacement draw found no positive weight
  kSafetyCapReached,  // A replacement was needed but the draw cap was hit
};

const char* RunOutcomeToString(RunOutcome outcome);

/**
 * @brief Result of one run
 *
 * Best-effort: results may hold fewer than the requested count.
 */
struct RunReport {
  std::vector<CandidateResult> results;        ///< Accepted results in production order
  uint32_t winner_draws = 0;                   ///< Total lottery draws, replacements included
  std::vector<std::string> exhausted_winners;  ///< Winners discarded after seed exhaustion
  std::vector<std::string> unmatched_winners;  ///< Winners with a seed but no match
  RunOutcome outcome = RunOutcome::kCompleted;
};

/**
 * @brief Run controller
 *
 * 1. Draw count winners.
 * 2. For each winner, obtain a seed from its liked tracks. On seed
 *    exhaustion the winner's weight is zeroed for the rest of the run and a
 *    replacement is drawn and processed next.
 * 3. Match the seed with excluded = liked artists, artists on the
 *    profile's existing_tracks and artists already accepted in this run. A winner without a match yields no result and
 *    is not replaced.
 *
 * Total winner draws never exceed count * safety_cap_multiplier. count is
 * capped at config::defaults::kMaxRunCount.
 */
class RunController {
 public:
  /**
   * @param selector Lottery (owns the run's random engine)
   * @param orchestrator Seed acquisition
   * @param matcher Similarity matcher
   * @param config Count and safety cap
   */
  RunController(LotterySelector& selector, ingest::IngestionOrchestrator& orchestrator, SimilarityMatcher& matcher,
                config::RunConfig config);

  /**
   * @brief Execute a run
   *
   * @param profile Listener profile supplying seed tracks and exclusions
   * @param weights Lottery weights derived from the profile
   * @param count Number of results wanted (0 = configured count)
   * @return Report, or kEmptyPool when the initial draw is impossible
   */
  utils::Expected<RunReport, utils::Error> Run(const profile::ListenerProfile& profile, ArtistWeights weights,
                                               uint32_t count = 0);

 private:
  LotterySelector& selector_;
  ingest::IngestionOrchestrator& orchestrator_;
  SimilarityMatcher& matcher_;
  config::RunConfig config_;
};

}  // namespace tastemix::recommend
