/**
 * @file feature_vector.h
 * @brief Fixed-dimension audio feature vector
 *
 * A FeatureVector holds 16 named numeric dimensions in a fixed order:
 * rhythm, spectral, temporal, harmonic/percussive and timbral
 * measurements followed by four perceptual scores in [0, 1]. Values are
 * kept at their native scale; no normalization is applied anywhere.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::features {

constexpr size_t kFeatureDimension = 16;

/**
 * @brief Index of each named dimension
 */
enum class Feature : size_t {
  // Rhythm
  kTempoBpm = 0,
  kKeyMusical,
  kBeatRegularity,
  // Spectral
  kBrightnessHz,
  kTrebleHz,
  kFullnessHz,
  kDynamicRange,
  // Temporal
  kPercussiveness,
  kLoudness,
  // Harmonic / percussive
  kWarmth,
  kPunch,
  // Timbral
  kTexture,
  // Perceptual scores
  kEnergy,
  kDanceability,
  kMoodPositive,
  kAcousticness,
};

/**
 * @brief Dimension names in vector order ("tempo_bpm", ..., "acousticness")
 */
const std::array<const char*, kFeatureDimension>& FeatureNames();

/**
 * @brief Look up a dimension index by name
 * @return Index, or nullopt for an unknown name
 */
std::optional<size_t> FeatureIndex(std::string_view name);

/**
 * @brief Immutable feature vector, replaced wholesale on re-extraction
 */
struct FeatureVector {
  std::array<float, kFeatureDimension> values{};

  float operator[](Feature feature) const { return values[static_cast<size_t>(feature)]; }
  float operator[](size_t index) const { return values[index]; }

  bool operator==(const FeatureVector& other) const { return values == other.values; }
  bool operator!=(const FeatureVector& other) const { return !(*this == other); }

  /**
   * @brief True when every component is finite
   */
  bool IsFinite() const;

  /**
   * @brief Build a vector from exactly kFeatureDimension values
   *
   * @param values Components in FeatureNames() order
   * @return Vector, or kFeatureInvalidValue for a wrong count or a
   *         non-finite component
   */
  static utils::Expected<FeatureVector, utils::Error> FromValues(const std::vector<float>& values);
};

}  // namespace tastemix::features
