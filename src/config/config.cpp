/**
 * @file config.cpp
 * @brief Configuration parser implementation for tastemix
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace tastemix::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Quoted scalars stay strings so that an API key such as "12345" does not
 * turn into a number before schema validation.
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    if (yaml_node.Tag() == "!") {
      return yaml_node.as<std::string>();
    }
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.as<std::string>();
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      std::string key = pair.first.as<std::string>();
      json_object[key] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Read an optional key, keeping the current value when absent
 */
template <typename T>
void ReadOptional(const YAML::Node& node, const char* key, T& target) {
  if (node[key]) {
    target = node[key].as<T>();
  }
}

RunConfig ParseRunConfig(const YAML::Node& node) {
  RunConfig config;
  ReadOptional(node, "count", config.count);
  ReadOptional(node, "safety_cap_multiplier", config.safety_cap_multiplier);
  ReadOptional(node, "seed", config.seed);
  return config;
}

LotteryConfig ParseLotteryConfig(const YAML::Node& node) {
  LotteryConfig config;
  ReadOptional(node, "liked_once", config.liked_once);
  ReadOptional(node, "liked_twice", config.liked_twice);
  ReadOptional(node, "liked_thrice", config.liked_thrice);
  ReadOptional(node, "liked_more", config.liked_more);
  ReadOptional(node, "listening_boost", config.listening_boost);
  ReadOptional(node, "recent_weight", config.recent_weight);
  ReadOptional(node, "short_term_weight", config.short_term_weight);
  ReadOptional(node, "medium_term_weight", config.medium_term_weight);
  return config;
}

IngestionConfig ParseIngestionConfig(const YAML::Node& node) {
  IngestionConfig config;
  ReadOptional(node, "max_attempts", config.max_attempts);
  ReadOptional(node, "backoff_base_ms", config.backoff_base_ms);
  ReadOptional(node, "backoff_max_ms", config.backoff_max_ms);
  return config;
}

MatcherConfig ParseMatcherConfig(const YAML::Node& node) {
  MatcherConfig config;
  ReadOptional(node, "strict_min_overlap", config.strict_min_overlap);
  ReadOptional(node, "relaxed_min_overlap", config.relaxed_min_overlap);
  ReadOptional(node, "strict_scan_limit", config.strict_scan_limit);
  ReadOptional(node, "max_follower_count", config.max_follower_count);
  return config;
}

ExtractorConfig ParseExtractorConfig(const YAML::Node& node) {
  ExtractorConfig config;
  ReadOptional(node, "url", config.url);
  ReadOptional(node, "path", config.path);
  ReadOptional(node, "timeout_ms", config.timeout_ms);
  ReadOptional(node, "api_key", config.api_key);
  return config;
}

/**
 * @brief Parse the ordered genre source list
 */
std::vector<GenreSourceConfig> ParseGenreSources(const YAML::Node& node) {
  std::vector<GenreSourceConfig> sources;
  if (!node.IsSequence()) {
    return sources;
  }
  for (const auto& source_node : node) {
    GenreSourceConfig source;
    ReadOptional(source_node, "name", source.name);
    ReadOptional(source_node, "kind", source.kind);
    ReadOptional(source_node, "url", source.url);
    ReadOptional(source_node, "api_key", source.api_key);
    ReadOptional(source_node, "timeout_ms", source.timeout_ms);
    if (source.name.empty()) {
      source.name = source.kind;
    }
    sources.push_back(std::move(source));
  }
  return sources;
}

StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;
  ReadOptional(node, "snapshot_path", config.snapshot_path);
  ReadOptional(node, "autosave", config.autosave);
  return config;
}

CatalogConfig ParseCatalogConfig(const YAML::Node& node) {
  CatalogConfig config;
  ReadOptional(node, "threads", config.threads);
  ReadOptional(node, "overwrite", config.overwrite);
  return config;
}

LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;
  ReadOptional(node, "level", config.level);
  ReadOptional(node, "json", config.json);
  ReadOptional(node, "file", config.file);
  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (check spelling of section and field names)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid genre source kind (spotify, lastfm, musicbrainz, audiodb)\n";
      err_msg << "    - Out of range values (check min/max constraints)";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

utils::Expected<void, utils::Error> InvalidValue(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, message));
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty file is a valid configuration made of defaults
    nlohmann::json config_json = root.IsNull() ? nlohmann::json::object() : YamlToJson(root);

    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    if (root["run"]) {
      config.run = ParseRunConfig(root["run"]);
    }
    if (root["lottery"]) {
      config.lottery = ParseLotteryConfig(root["lottery"]);
    }
    if (root["ingestion"]) {
      config.ingestion = ParseIngestionConfig(root["ingestion"]);
    }
    if (root["matcher"]) {
      config.matcher = ParseMatcherConfig(root["matcher"]);
    }
    if (root["extractor"]) {
      config.extractor = ParseExtractorConfig(root["extractor"]);
    }
    if (root["genre_sources"]) {
      config.genre_sources = ParseGenreSources(root["genre_sources"]);
    }
    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["catalog"]) {
      config.catalog = ParseCatalogConfig(root["catalog"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Run
  if (config.run.count == 0) {
    return InvalidValue("run.count must be greater than 0");
  }
  if (config.run.count > defaults::kMaxRunCount) {
    return InvalidValue("run.count must not exceed " + std::to_string(defaults::kMaxRunCount));
  }
  if (config.run.safety_cap_multiplier == 0) {
    return InvalidValue("run.safety_cap_multiplier must be greater than 0");
  }

  // Lottery
  const LotteryConfig& lottery = config.lottery;
  if (lottery.liked_once < 0.0 || lottery.liked_twice < 0.0 || lottery.liked_thrice < 0.0 || lottery.liked_more < 0.0) {
    return InvalidValue("lottery liked-count weights must be >= 0");
  }
  if (lottery.listening_boost <= 0.0) {
    return InvalidValue("lottery.listening_boost must be greater than 0");
  }
  if (lottery.recent_weight < 0.0 || lottery.short_term_weight < 0.0 || lottery.medium_term_weight < 0.0) {
    return InvalidValue("lottery listening signal weights must be >= 0");
  }

  // Ingestion
  if (config.ingestion.max_attempts == 0) {
    return InvalidValue("ingestion.max_attempts must be greater than 0");
  }
  if (config.ingestion.backoff_max_ms < config.ingestion.backoff_base_ms) {
    return InvalidValue("ingestion.backoff_max_ms must be >= backoff_base_ms");
  }

  // Matcher
  if (config.matcher.relaxed_min_overlap == 0) {
    return InvalidValue("matcher.relaxed_min_overlap must be greater than 0");
  }
  if (config.matcher.strict_min_overlap < config.matcher.relaxed_min_overlap) {
    return InvalidValue("matcher.strict_min_overlap must be >= relaxed_min_overlap");
  }
  if (config.matcher.strict_scan_limit == 0) {
    return InvalidValue("matcher.strict_scan_limit must be greater than 0");
  }

  // Extractor
  if (config.extractor.timeout_ms == 0) {
    return InvalidValue("extractor.timeout_ms must be greater than 0");
  }

  // Genre sources
  for (const auto& source : config.genre_sources) {
    if (source.kind != "spotify" && source.kind != "lastfm" && source.kind != "musicbrainz" &&
        source.kind != "audiodb") {
      return InvalidValue("genre_sources[].kind must be one of: spotify, lastfm, musicbrainz, audiodb (got: " +
                          source.kind + ")");
    }
    if (source.url.empty()) {
      return InvalidValue("genre_sources[" + source.name + "].url must not be empty");
    }
    if (source.timeout_ms == 0) {
      return InvalidValue("genre_sources[" + source.name + "].timeout_ms must be greater than 0");
    }
  }

  // Storage
  if (config.storage.snapshot_path.empty()) {
    return InvalidValue("storage.snapshot_path must not be empty");
  }

  // Catalog
  if (config.catalog.threads == 0) {
    return InvalidValue("catalog.threads must be greater than 0");
  }

  // Logging
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return InvalidValue("logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level +
                        ")");
  }

  return {};
}

}  // namespace tastemix::config
