/**
 * @file similarity_matcher.cpp
 * @brief Similarity matcher implementation
 */

#include "recommend/similarity_matcher.h"

#include <chrono>
#include <limits>
#include <utility>
#include <vector>

#include "features/distance.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace tastemix::recommend {

namespace {

double ElapsedMicros(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::micro>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

const char* MatchPhaseToString(MatchPhase phase) {
  switch (phase) {
    case MatchPhase::kStrict:
      return "strict";
    case MatchPhase::kRelaxed:
      return "relaxed";
    case MatchPhase::kDistance:
      return "distance";
  }
  return "unknown";
}

SimilarityMatcher::SimilarityMatcher(const store::FeatureStore& store, genres::GenreResolver& resolver,
                                     config::MatcherConfig config)
    : store_(store), resolver_(resolver), config_(config) {}

bool SimilarityMatcher::IsEligible(const store::FeatureRecord& candidate, const store::FeatureRecord& seed,
                                   const std::set<std::string>& blocked) const {
  const auto& track = candidate.track;
  if (track.id == seed.track.id || track.artists.empty()) {
    return false;
  }
  for (const auto& artist : track.artists) {
    if (blocked.count(utils::NormalizeName(artist)) > 0) {
      return false;
    }
  }
  if (config_.max_follower_count > 0 && track.followers && *track.followers > config_.max_follower_count) {
    return false;
  }
  return true;
}

utils::Expected<CandidateResult, utils::Error> SimilarityMatcher::FindMatch(
    const std::string& seed_artist, const store::FeatureRecord& seed, const std::set<std::string>& excluded_artists) {
  auto start_time = std::chrono::steady_clock::now();

  std::set<std::string> blocked;
  for (const auto& artist : excluded_artists) {
    blocked.insert(utils::NormalizeName(artist));
  }
  blocked.insert(utils::NormalizeName(seed_artist));

  // One consistent view for every phase of this match
  const std::vector<store::FeatureRecord> population = store_.Snapshot();
  const store::GenreSet seed_genres = resolver_.ResolveGenres(seed_artist);

  auto make_result = [&](const store::FeatureRecord& candidate, MatchPhase phase, size_t overlap,
                         store::GenreSet genres) {
    CandidateResult result;
    result.seed_artist = seed_artist;
    result.track = candidate.track;
    result.overlap = overlap;
    result.genres = std::move(genres);
    result.phase = phase;
    return result;
  };

  int examined = 0;

  if (seed_genres.empty()) {
    const store::FeatureRecord* best = nullptr;
    double best_distance = std::numeric_limits<double>::infinity();
    for (const auto& candidate : population) {
      if (!IsEligible(candidate, seed, blocked)) {
        continue;
      }
      ++examined;
      double distance = features::L2Distance(seed.features, candidate.features);
      if (distance < best_distance) {
        best_distance = distance;
        best = &candidate;
      }
    }
    if (best != nullptr) {
      auto genres = resolver_.ResolveGenres(best->track.PrimaryArtist());
      auto result = make_result(*best, MatchPhase::kDistance, 0, std::move(genres));
      result.distance = best_distance;
      utils::LogMatchOutcome(seed_artist, MatchPhaseToString(MatchPhase::kDistance), best->track.id, examined,
                             ElapsedMicros(start_time));
      return result;
    }
  } else {
    // Phase 1: bounded strict scan
    uint32_t scanned = 0;
    for (const auto& candidate : population) {
      if (scanned >= config_.strict_scan_limit) {
        break;
      }
      if (!IsEligible(candidate, seed, blocked)) {
        continue;
      }
      ++scanned;
      ++examined;
      auto genres = resolver_.ResolveGenres(candidate.track.PrimaryArtist());
      size_t overlap = store::CountOverlap(seed_genres, genres);
      if (overlap >= config_.strict_min_overlap) {
        utils::LogMatchOutcome(seed_artist, MatchPhaseToString(MatchPhase::kStrict), candidate.track.id, examined,
                               ElapsedMicros(start_time));
        return make_result(candidate, MatchPhase::kStrict, overlap, std::move(genres));
      }
    }

    // Phase 2: relaxed scan from the beginning
    for (const auto& candidate : population) {
      if (!IsEligible(candidate, seed, blocked)) {
        continue;
      }
      ++examined;
      auto genres = resolver_.ResolveGenres(candidate.track.PrimaryArtist());
      size_t overlap = store::CountOverlap(seed_genres, genres);
      if (overlap >= config_.relaxed_min_overlap) {
        utils::LogMatchOutcome(seed_artist, MatchPhaseToString(MatchPhase::kRelaxed), candidate.track.id, examined,
                               ElapsedMicros(start_time));
        return make_result(candidate, MatchPhase::kRelaxed, overlap, std::move(genres));
      }
    }
  }

  utils::LogMatchOutcome(seed_artist, "none", "", examined, ElapsedMicros(start_time));
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNoMatch,
                                                "No eligible candidate for seed " + seed.track.id, seed_artist));
}

}  // namespace tastemix::recommend
