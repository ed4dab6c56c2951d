/**
 * @file http_feature_extractor.cpp
 * @brief HTTP feature extractor implementation
 */

#include "ingest/http_feature_extractor.h"

#include <httplib.h>

#include <ctime>

#include <nlohmann/json.hpp>

#include "version.h"

namespace tastemix::ingest {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpTooManyRequests = 429;

utils::Expected<features::FeatureVector, utils::Error> InvalidResponse(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kExtractionInvalidResponse, message));
}

}  // namespace

utils::Expected<features::FeatureVector, utils::Error> ParseFeatureResponse(const std::string& body) {
  nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return InvalidResponse("Response is not a JSON object");
  }
  if (!doc.contains("features") || !doc["features"].is_object()) {
    return InvalidResponse("Response has no features object");
  }

  const auto& feature_obj = doc["features"];
  const auto& names = features::FeatureNames();
  std::vector<float> values;
  values.reserve(names.size());
  for (const char* name : names) {
    if (!feature_obj.contains(name) || !feature_obj[name].is_number()) {
      return InvalidResponse(std::string("Missing or non-numeric feature: ") + name);
    }
    values.push_back(feature_obj[name].get<float>());
  }

  auto vec = features::FeatureVector::FromValues(values);
  if (!vec) {
    return InvalidResponse(vec.error().message());
  }
  return *vec;
}

std::string BuildFeatureRequest(const store::Track& track) {
  nlohmann::json request = {
      {"track_id", track.id},
      {"title", track.title},
      {"artists", track.artists},
      {"link", track.link},
  };
  return request.dump();
}

HttpFeatureExtractor::HttpFeatureExtractor(config::ExtractorConfig config) : config_(std::move(config)) {}

utils::Expected<features::FeatureVector, utils::Error> HttpFeatureExtractor::Extract(const store::Track& track) {
  if (config_.url.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kExtractionUnavailable, "No extraction service configured", track.id));
  }

  httplib::Client client(config_.url);
  const time_t timeout_sec = static_cast<time_t>(config_.timeout_ms / 1000);
  const time_t timeout_usec = static_cast<time_t>((config_.timeout_ms % 1000) * 1000);
  client.set_connection_timeout(timeout_sec, timeout_usec);
  client.set_read_timeout(timeout_sec, timeout_usec);

  httplib::Headers headers = {{"User-Agent", "tastemix/" + Version::String()}};
  if (!config_.api_key.empty()) {
    headers.emplace("Authorization", "Bearer " + config_.api_key);
  }

  auto res = client.Post(config_.path, headers, BuildFeatureRequest(track), "application/json");
  if (!res) {
    auto http_error = res.error();
    if (http_error == httplib::Error::Read) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kTimeout, "Extraction timed out after " +
                                                           std::to_string(config_.timeout_ms) + "ms", track.id));
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kExtractionUnavailable,
                                                  "Extraction request failed: " + httplib::to_string(http_error),
                                                  track.id));
  }

  if (res->status == kHttpTooManyRequests) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kExtractionRateLimited, "Extraction service rate limited", track.id));
  }
  if (res->status != kHttpOk) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kExtractionUnavailable,
                                                  "Extraction service returned HTTP " + std::to_string(res->status),
                                                  track.id));
  }

  return ParseFeatureResponse(res->body);
}

}  // namespace tastemix::ingest
