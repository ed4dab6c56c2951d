/**
 * @file main.cpp
 * @brief Entry point for the tastemix command-line tool
 */

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "config/config.h"
#include "genres/genre_resolver.h"
#include "genres/http_genre_source.h"
#include "ingest/catalog_builder.h"
#include "ingest/http_feature_extractor.h"
#include "ingest/ingestion_orchestrator.h"
#include "output/playlist_writer.h"
#include "profile/listener_profile.h"
#include "recommend/lottery_selector.h"
#include "recommend/run_controller.h"
#include "recommend/similarity_matcher.h"
#include "storage/snapshot_format_v1.h"
#include "store/feature_store.h"
#include "store/genre_cache.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {

using tastemix::config::Config;

/**
 * @brief Parsed command line
 */
struct CommandLine {
  std::string config_path;
  std::string command;
  std::string profile_path;
  std::string catalog_path;
  std::string output_path = "-";
  uint32_t count = 0;  // 0 = run.count from configuration
  bool config_test = false;
};

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] <command> [ARGS]\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  run --profile <file> [--count N] [--output <file>]   Produce recommendations\n";
  std::cout << "  build-catalog --catalog <file>                      Extract features for a track list\n";
  std::cout << "  snapshot-info                                       Show snapshot metadata\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c tastemix.yaml run --profile me.json --count 20 --output playlist.json\n";
}

/**
 * @brief Parse arguments
 * @return Exit code to return immediately, or -1 to continue
 */
int ParseCommandLine(int argc, char* argv[], CommandLine& cmd) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](std::string& out) -> bool {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "tastemix version " << tastemix::Version::String() << " (snapshot format "
                << tastemix::Version::SnapshotFormat() << ")\n";
      std::cout << "Lottery-seeded music recommendation engine with a persistent feature cache\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      cmd.config_test = true;
    } else if (arg == "-c" || arg == "--config") {
      if (!next_value(cmd.config_path)) {
        return 1;
      }
    } else if (arg == "--profile") {
      if (!next_value(cmd.profile_path)) {
        return 1;
      }
    } else if (arg == "--catalog") {
      if (!next_value(cmd.catalog_path)) {
        return 1;
      }
    } else if (arg == "--output" || arg == "-o") {
      if (!next_value(cmd.output_path)) {
        return 1;
      }
    } else if (arg == "--count" || arg == "-n") {
      std::string value;
      if (!next_value(value)) {
        return 1;
      }
      char* end = nullptr;
      unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || parsed == 0 ||
          parsed > tastemix::config::defaults::kMaxRunCount) {
        std::cerr << "Error: --count must be between 1 and " << tastemix::config::defaults::kMaxRunCount << "\n";
        return 1;
      }
      cmd.count = static_cast<uint32_t>(parsed);
    } else if (arg[0] != '-' && cmd.command.empty()) {
      cmd.command = arg;
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return -1;
}

/**
 * @brief Apply logging configuration to spdlog and StructuredLog
 */
bool SetupLogging(const tastemix::config::LoggingConfig& logging) {
  auto result = tastemix::utils::SetupLogging(logging.level, logging.json, logging.file);
  if (!result) {
    std::cerr << "Error: " << result.error().to_string() << "\n";
    return false;
  }
  return true;
}

void PrintConfigSummary(const Config& config) {
  std::cout << "Configuration file is valid\n";
  std::cout << "\nConfiguration summary:\n";
  std::cout << "  Run:\n";
  std::cout << "    count: " << config.run.count << "\n";
  std::cout << "    safety_cap_multiplier: " << config.run.safety_cap_multiplier << "\n";
  std::cout << "  Ingestion:\n";
  std::cout << "    max_attempts: " << config.ingestion.max_attempts << "\n";
  std::cout << "    backoff_base_ms: " << config.ingestion.backoff_base_ms << "\n";
  std::cout << "  Matcher:\n";
  std::cout << "    strict_min_overlap: " << config.matcher.strict_min_overlap << "\n";
  std::cout << "    relaxed_min_overlap: " << config.matcher.relaxed_min_overlap << "\n";
  std::cout << "    strict_scan_limit: " << config.matcher.strict_scan_limit << "\n";
  std::cout << "  Extractor:\n";
  std::cout << "    url: " << (config.extractor.url.empty() ? "(none)" : config.extractor.url) << "\n";
  std::cout << "  Genre sources:\n";
  for (const auto& source : config.genre_sources) {
    std::cout << "    - " << source.name << " (" << source.kind << "): " << source.url << "\n";
  }
  std::cout << "  Storage:\n";
  std::cout << "    snapshot_path: " << config.storage.snapshot_path << "\n";
  std::cout << "    autosave: " << (config.storage.autosave ? "true" : "false") << "\n";
}

int ShowSnapshotInfo(const Config& config) {
  namespace snapshot_v1 = tastemix::storage::snapshot_v1;
  snapshot_v1::SnapshotInfo info;
  auto result = snapshot_v1::GetSnapshotInfo(config.storage.snapshot_path, info);
  if (!result) {
    std::cerr << "Error: " << result.error().to_string() << "\n";
    return 1;
  }
  tastemix::storage::snapshot_format::IntegrityError integrity;
  auto verified = snapshot_v1::VerifySnapshotIntegrity(config.storage.snapshot_path, integrity);

  std::cout << "Snapshot: " << config.storage.snapshot_path << "\n";
  std::cout << "  version: " << info.version << "\n";
  std::cout << "  file_size: " << info.file_size << "\n";
  std::cout << "  timestamp: " << info.timestamp << "\n";
  std::cout << "  sections: " << info.section_count << "\n";
  std::cout << "  tracks: " << info.track_count << "\n";
  std::cout << "  artists: " << info.artist_count << "\n";
  std::cout << "  integrity: " << (verified ? "ok" : integrity.message) << "\n";
  return verified ? 0 : 1;
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  CommandLine cmd;
  int parse_status = ParseCommandLine(argc, argv, cmd);
  if (parse_status >= 0) {
    return parse_status;
  }

  Config config;
  if (!cmd.config_path.empty()) {
    auto config_result = tastemix::config::LoadConfig(cmd.config_path);
    if (!config_result) {
      std::cerr << "Error: Failed to load config: " << config_result.error().to_string() << "\n";
      return 1;
    }
    config = *config_result;
  }
  if (cmd.config_test) {
    if (cmd.config_path.empty()) {
      std::cerr << "Error: --config-test requires -c <file>\n";
      return 1;
    }
    PrintConfigSummary(config);
    return 0;
  }

  if (cmd.command.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }
  if (!SetupLogging(config.logging)) {
    return 1;
  }
  if (cmd.command == "snapshot-info") {
    return ShowSnapshotInfo(config);
  }
  if (cmd.command != "run" && cmd.command != "build-catalog") {
    std::cerr << "Error: Unknown command: " << cmd.command << "\n";
    return 1;
  }

  spdlog::info("tastemix {} starting ({})", tastemix::Version::String(), cmd.command);

  tastemix::store::FeatureStore feature_store;
  tastemix::store::GenreCache genre_cache;

  std::error_code ec;
  if (std::filesystem::exists(config.storage.snapshot_path, ec)) {
    auto loaded = tastemix::storage::snapshot_v1::ReadSnapshotV1(config.storage.snapshot_path, feature_store,
                                                                 genre_cache);
    if (!loaded) {
      tastemix::utils::LogStorageError("load", config.storage.snapshot_path, loaded.error().to_string());
      return 1;
    }
    spdlog::info("Loaded snapshot: {} tracks, {} artists", feature_store.Size(), genre_cache.Size());
  }

  tastemix::ingest::HttpFeatureExtractor extractor(config.extractor);
  int exit_code = 0;

  if (cmd.command == "build-catalog") {
    if (cmd.catalog_path.empty()) {
      std::cerr << "Error: build-catalog requires --catalog <file>\n";
      return 1;
    }
    auto tracks = tastemix::profile::LoadCatalog(cmd.catalog_path);
    if (!tracks) {
      spdlog::error("Failed to load catalog: {}", tracks.error().to_string());
      return 1;
    }
    tastemix::ingest::CatalogBuilder builder(feature_store, extractor, config.catalog);
    auto report = builder.Build(*tracks);
    std::cout << "processed: " << report.processed << ", skipped: " << report.skipped
              << ", failed: " << report.failed << "\n";
  } else {
    if (cmd.profile_path.empty()) {
      std::cerr << "Error: run requires --profile <file>\n";
      return 1;
    }
    auto profile = tastemix::profile::LoadListenerProfile(cmd.profile_path);
    if (!profile) {
      spdlog::error("Failed to load profile: {}", profile.error().to_string());
      return 1;
    }

    auto sources = tastemix::genres::BuildGenreSources(config.genre_sources);
    if (!sources) {
      spdlog::error("Failed to build genre sources: {}", sources.error().to_string());
      return 1;
    }
    tastemix::genres::GenreResolver resolver(genre_cache, std::move(*sources));
    tastemix::ingest::IngestionOrchestrator orchestrator(feature_store, extractor, config.ingestion);
    tastemix::recommend::SimilarityMatcher matcher(feature_store, resolver, config.matcher);
    tastemix::recommend::LotterySelector selector(config.run.seed);
    tastemix::recommend::RunController controller(selector, orchestrator, matcher, config.run);

    auto weights = tastemix::profile::BuildArtistWeights(*profile, config.lottery);
    auto report = controller.Run(*profile, std::move(weights), cmd.count);
    if (!report) {
      spdlog::error("Run failed: {}", report.error().to_string());
      exit_code = 1;
    } else {
      if (report->outcome == tastemix::recommend::RunOutcome::kSafetyCapReached) {
        auto capped = tastemix::utils::MakeError(
            tastemix::utils::ErrorCode::kRunCapReached,
            "Winner draw cap reached with " + std::to_string(report->results.size()) + " result(s)");
        spdlog::warn("{}", capped.to_string());
      } else if (report->outcome == tastemix::recommend::RunOutcome::kPoolExhausted) {
        spdlog::warn("No artist left to draw; returning {} result(s)", report->results.size());
      }
      tastemix::output::JsonPlaylistWriter writer(cmd.output_path);
      auto written = writer.Write(report->results);
      if (!written) {
        spdlog::error("{}", written.error().to_string());
        exit_code = 1;
      }
    }
  }

  if (config.storage.autosave) {
    auto saved = tastemix::storage::snapshot_v1::WriteSnapshotV1(config.storage.snapshot_path, feature_store,
                                                                 genre_cache);
    if (!saved) {
      tastemix::utils::LogStorageError("save", config.storage.snapshot_path, saved.error().to_string());
      exit_code = 1;
    }
  }

  return exit_code;
}
