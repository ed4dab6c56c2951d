/**
 * @file catalog_builder.cpp
 * @brief Catalog builder implementation
 */

#include "ingest/catalog_builder.h"

#include <atomic>
#include <chrono>
#include <unordered_set>

#include "utils/structured_log.h"
#include "utils/thread_pool.h"

namespace tastemix::ingest {

CatalogBuilder::CatalogBuilder(store::FeatureStore& store, FeatureExtractor& extractor, config::CatalogConfig config)
    : store_(store), extractor_(extractor), config_(config) {}

CatalogReport CatalogBuilder::Build(const std::vector<store::Track>& tracks) {
  auto start_time = std::chrono::steady_clock::now();

  std::atomic<size_t> processed{0};
  std::atomic<size_t> skipped{0};
  std::atomic<size_t> failed{0};

  // Duplicate ids in the input are processed once
  std::unordered_set<std::string> seen;
  std::vector<const store::Track*> work;
  work.reserve(tracks.size());
  for (const auto& track : tracks) {
    if (!seen.insert(track.id).second) {
      skipped.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    if (!config_.overwrite && store_.Contains(track.id)) {
      skipped.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    work.push_back(&track);
  }

  {
    utils::ThreadPool pool(config_.threads);
    for (const store::Track* track : work) {
      bool submitted = pool.Submit([this, track, &processed, &failed]() {
        auto extracted = extractor_.Extract(*track);
        if (!extracted) {
          failed.fetch_add(1, std::memory_order_relaxed);
          utils::LogExtractionFailure(track->PrimaryArtist(), track->id, 1, extracted.error().to_string());
          return;
        }
        auto upsert = store_.Upsert(*track, *extracted);
        if (!upsert) {
          failed.fetch_add(1, std::memory_order_relaxed);
          utils::LogStoreError("upsert", track->id, upsert.error().to_string());
          return;
        }
        processed.fetch_add(1, std::memory_order_relaxed);
      });
      if (!submitted) {
        failed.fetch_add(1, std::memory_order_relaxed);
        utils::LogStoreError("catalog_submit", track->id, "worker pool rejected task");
      }
    }
    pool.WaitIdle();
  }

  CatalogReport report;
  report.processed = processed.load();
  report.skipped = skipped.load();
  report.failed = failed.load();

  auto elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
  utils::StructuredLog()
      .Event("catalog_build_complete")
      .Field("tracks", static_cast<uint64_t>(tracks.size()))
      .Field("processed", static_cast<uint64_t>(report.processed))
      .Field("skipped", static_cast<uint64_t>(report.skipped))
      .Field("failed", static_cast<uint64_t>(report.failed))
      .Field("elapsed_ms", elapsed_ms)
      .Info();
  return report;
}

}  // namespace tastemix::ingest
