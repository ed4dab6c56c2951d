/**
 * @file distance.h
 * @brief Distance between feature vectors
 */

#pragma once

#include <cmath>
#include <cstddef>

#include "features/feature_vector.h"

namespace tastemix::features {

/**
 * @brief Squared Euclidean distance over raw component arrays
 *
 * @param a First vector data
 * @param b Second vector data
 * @param n Vector dimension
 * @return sum((a[i] - b[i])^2) for i in [0, n)
 */
inline double SquaredL2(const float* a, const float* b, size_t n) {
  double sum_sq = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    sum_sq += diff * diff;
  }
  return sum_sq;
}

/**
 * @brief Euclidean distance over all 16 dimensions at native scale
 *
 * Components are not weighted, so tempo and Hz dimensions dominate the
 * 0-1 perceptual scores. Accumulation is done in double.
 */
inline double L2Distance(const FeatureVector& a, const FeatureVector& b) {
  return std::sqrt(SquaredL2(a.values.data(), b.values.data(), kFeatureDimension));
}

}  // namespace tastemix::features
