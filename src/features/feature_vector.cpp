/**
 * @file feature_vector.cpp
 * @brief Feature vector helpers
 */

#include "features/feature_vector.h"

#include <cmath>

namespace tastemix::features {

const std::array<const char*, kFeatureDimension>& FeatureNames() {
  static const std::array<const char*, kFeatureDimension> kNames = {
      "tempo_bpm",     "key_musical",    "beat_regularity", "brightness_hz", "treble_hz", "fullness_hz",
      "dynamic_range", "percussiveness", "loudness",        "warmth",        "punch",     "texture",
      "energy",        "danceability",   "mood_positive",   "acousticness",
  };
  return kNames;
}

std::optional<size_t> FeatureIndex(std::string_view name) {
  const auto& names = FeatureNames();
  for (size_t i = 0; i < names.size(); ++i) {
    if (name == names[i]) {
      return i;
    }
  }
  return std::nullopt;
}

bool FeatureVector::IsFinite() const {
  for (float value : values) {
    if (!std::isfinite(value)) {
      return false;
    }
  }
  return true;
}

utils::Expected<FeatureVector, utils::Error> FeatureVector::FromValues(const std::vector<float>& values) {
  if (values.size() != kFeatureDimension) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kFeatureInvalidValue,
                                                  "Feature vector dimension mismatch: expected " +
                                                      std::to_string(kFeatureDimension) + ", got " +
                                                      std::to_string(values.size())));
  }

  FeatureVector vec;
  for (size_t i = 0; i < kFeatureDimension; ++i) {
    if (!std::isfinite(values[i])) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kFeatureInvalidValue,
                                                    "Non-finite value for feature " +
                                                        std::string(FeatureNames()[i])));
    }
    vec.values[i] = values[i];
  }
  return vec;
}

}  // namespace tastemix::features
