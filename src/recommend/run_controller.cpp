/**
 * @file run_controller.cpp
 * @brief Run controller implementation
 */

#include "recommend/run_controller.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <set>
#include <string>
#include <utility>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace tastemix::recommend {

const char* RunOutcomeToString(RunOutcome outcome) {
  switch (outcome) {
    case RunOutcome::kCompleted:
      return "completed";
    case RunOutcome::kPoolExhausted:
      return "pool_exhausted";
    case RunOutcome::kSafetyCapReached:
      return "safety_cap_reached";
  }
  return "unknown";
}

RunController::RunController(LotterySelector& selector, ingest::IngestionOrchestrator& orchestrator,
                             SimilarityMatcher& matcher, config::RunConfig config)
    : selector_(selector), orchestrator_(orchestrator), matcher_(matcher), config_(config) {}

utils::Expected<RunReport, utils::Error> RunController::Run(const profile::ListenerProfile& profile,
                                                           ArtistWeights weights, uint32_t count) {
  auto start_time = std::chrono::steady_clock::now();
  if (count == 0) {
    count = config_.count;
  }
  if (count > config::defaults::kMaxRunCount) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kInvalidArgument,
        "Requested " + std::to_string(count) + " recommendations, maximum is " +
            std::to_string(config::defaults::kMaxRunCount)));
  }
  const uint64_t draw_cap = static_cast<uint64_t>(count) * config_.safety_cap_multiplier;

  RunReport report;

  auto initial = selector_.Draw(weights, count);
  if (!initial) {
    return utils::MakeUnexpected(initial.error());
  }
  report.winner_draws = count;
  std::deque<std::string> winners(initial->begin(), initial->end());

  std::set<std::string> excluded = profile.ExcludedArtists();
  std::set<std::string> discarded;

  while (!winners.empty()) {
    std::string winner = std::move(winners.front());
    winners.pop_front();

    // Earlier draws may name an artist discarded since
    bool needs_replacement = discarded.count(utils::NormalizeName(winner)) > 0;

    if (!needs_replacement) {
      auto tracks = profile.TracksByArtist(winner);
      std::shuffle(tracks.begin(), tracks.end(), selector_.Engine());

      auto seed = orchestrator_.EnsureSeed(winner, tracks);
      if (!seed) {
        report.exhausted_winners.push_back(winner);
        discarded.insert(utils::NormalizeName(winner));
        weights[winner] = 0.0;
        needs_replacement = true;
      } else {
        auto match = matcher_.FindMatch(winner, seed->seed, excluded);
        if (match) {
          for (const auto& artist : match->track.artists) {
            excluded.insert(utils::NormalizeName(artist));
          }
          report.results.push_back(std::move(*match));
        } else {
          report.unmatched_winners.push_back(winner);
        }
      }
    }

    if (needs_replacement) {
      if (report.winner_draws >= draw_cap) {
        report.outcome = RunOutcome::kSafetyCapReached;
        break;
      }
      auto replacement = selector_.DrawOne(weights);
      if (!replacement) {
        report.outcome = RunOutcome::kPoolExhausted;
        break;
      }
      ++report.winner_draws;
      winners.push_front(std::move(*replacement));
    }
  }

  auto elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
  utils::StructuredLog()
      .Event("run_complete")
      .Field("requested", static_cast<uint64_t>(count))
      .Field("results", static_cast<uint64_t>(report.results.size()))
      .Field("winner_draws", static_cast<uint64_t>(report.winner_draws))
      .Field("exhausted", static_cast<uint64_t>(report.exhausted_winners.size()))
      .Field("unmatched", static_cast<uint64_t>(report.unmatched_winners.size()))
      .Field("outcome", RunOutcomeToString(report.outcome))
      .Field("elapsed_ms", elapsed_ms)
      .Info();
  return report;
}

}  // namespace tastemix::recommend
