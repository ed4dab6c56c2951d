/**
 * @file lottery_selector.h
 * @brief Weighted random selection of seed artists
 */

#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::recommend {

/**
 * @brief Artist name -> non-negative lottery weight
 */
using ArtistWeights = std::map<std::string, double>;

/**
 * @brief Weighted lottery over artists
 *
 * Draws are independent and with replacement: cumulative weights are laid
 * out in key order, a uniform value in [0, total) is drawn and the first
 * artist whose cumulative weight exceeds it wins. Zero-weight artists are
 * never returned.
 *
 * Not thread-safe (owns its random engine).
 */
class LotterySelector {
 public:
  /**
   * @param seed Engine seed (0 = seed from std::random_device)
   */
  explicit LotterySelector(uint64_t seed = 0);

  /**
   * @brief Draw a single winner
   * @return Artist, kEmptyPool when no weight is positive, or
   *         kInvalidArgument for a negative or non-finite weight
   */
  utils::Expected<std::string, utils::Error> DrawOne(const ArtistWeights& weights);

  /**
   * @brief Draw n winners with replacement
   */
  utils::Expected<std::vector<std::string>, utils::Error> Draw(const ArtistWeights& weights, size_t n);

  std::mt19937_64& Engine() { return engine_; }

 private:
  static utils::Expected<double, utils::Error> TotalWeight(const ArtistWeights& weights);

  std::mt19937_64 engine_;
};

}  // namespace tastemix::recommend
