/**
 * @file ingestion_orchestrator.cpp
 * @brief Seed acquisition with bounded retries
 */

#include "ingest/ingestion_orchestrator.h"

#include <algorithm>
#include <thread>
#include <utility>

#include "utils/structured_log.h"

namespace tastemix::ingest {

const char* SeedStateToString(SeedState state) {
  switch (state) {
    case SeedState::kTrying:
      return "trying";
    case SeedState::kReady:
      return "ready";
    case SeedState::kExhausted:
      return "exhausted";
  }
  return "unknown";
}

IngestionOrchestrator::IngestionOrchestrator(store::FeatureStore& store, FeatureExtractor& extractor,
                                             config::IngestionConfig config, Sleeper sleeper)
    : store_(store), extractor_(extractor), config_(config), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::chrono::milliseconds IngestionOrchestrator::BackoffDelay(uint32_t consecutive_rate_limits) const {
  if (consecutive_rate_limits == 0) {
    return std::chrono::milliseconds(0);
  }
  uint64_t delay = config_.backoff_base_ms;
  for (uint32_t i = 1; i < consecutive_rate_limits && delay < config_.backoff_max_ms; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min<uint64_t>(delay, config_.backoff_max_ms));
}

utils::Expected<SeedReady, utils::Error> IngestionOrchestrator::EnsureSeed(
    const std::string& winner_artist, const std::vector<store::Track>& candidates) {
  // Cached vectors cost nothing; use one before spending an attempt
  for (const auto& track : candidates) {
    auto record = store_.Get(track.id);
    if (record) {
      SeedReady ready;
      ready.seed = std::move(*record);
      ready.from_cache = true;
      return ready;
    }
  }

  RetryState retry;
  SeedState state = SeedState::kTrying;
  std::string last_error = "no tracks available";
  size_t next = 0;
  SeedReady ready;

  while (state == SeedState::kTrying) {
    const store::Track* track = nullptr;
    while (next < candidates.size()) {
      const auto& candidate = candidates[next++];
      if (retry.tried.insert(candidate.id).second) {
        track = &candidate;
        break;
      }
    }
    if (track == nullptr) {
      state = SeedState::kExhausted;
      break;
    }

    ++retry.attempt;
    auto extracted = extractor_.Extract(*track);
    if (extracted) {
      auto upsert = store_.Upsert(*track, *extracted);
      if (upsert) {
        ready.seed = store::FeatureRecord{*track, *extracted};
        ready.attempts = retry.attempt;
        state = SeedState::kReady;
        break;
      }
      last_error = upsert.error().to_string();
      retry.consecutive_rate_limits = 0;
    } else {
      last_error = extracted.error().to_string();
      if (extracted.error().code() == utils::ErrorCode::kExtractionRateLimited) {
        ++retry.consecutive_rate_limits;
      } else {
        retry.consecutive_rate_limits = 0;
      }
    }
    utils::LogExtractionFailure(winner_artist, track->id, static_cast<int>(retry.attempt), last_error);

    if (retry.attempt >= config_.max_attempts) {
      state = SeedState::kExhausted;
      break;
    }
    if (retry.consecutive_rate_limits > 0) {
      sleeper_(BackoffDelay(retry.consecutive_rate_limits));
    }
  }

  if (state == SeedState::kReady) {
    utils::StructuredLog()
        .Event("seed_ready")
        .Field("artist", winner_artist)
        .Field("track_id", ready.seed.track.id)
        .Field("attempts", static_cast<int64_t>(ready.attempts))
        .Debug();
    return ready;
  }

  utils::StructuredLog()
      .Event("seed_exhausted")
      .Field("artist", winner_artist)
      .Field("attempts", static_cast<int64_t>(retry.attempt))
      .Field("candidates", static_cast<uint64_t>(candidates.size()))
      .Field("last_error", last_error)
      .Warn();
  return utils::MakeUnexpected(utils::MakeError(
      utils::ErrorCode::kSeedExhausted,
      "No seed vector after " + std::to_string(retry.attempt) + " attempt(s): " + last_error, winner_artist));
}

}  // namespace tastemix::ingest
