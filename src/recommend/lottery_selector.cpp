/**
 * @file lottery_selector.cpp
 * @brief Weighted lottery implementation
 */

#include "recommend/lottery_selector.h"

#include <cmath>
#include <utility>

namespace tastemix::recommend {

namespace {

uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return (static_cast<uint64_t>(device()) << 32) | device();
}

}  // namespace

LotterySelector::LotterySelector(uint64_t seed) : engine_(ResolveSeed(seed)) {}

utils::Expected<double, utils::Error> LotterySelector::TotalWeight(const ArtistWeights& weights) {
  double total = 0.0;
  for (const auto& [artist, weight] : weights) {
    if (!std::isfinite(weight) || weight < 0.0) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                    "Lottery weight must be finite and non-negative", artist));
    }
    total += weight;
  }
  if (total <= 0.0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kEmptyPool, "No artist with a positive lottery weight"));
  }
  return total;
}

utils::Expected<std::string, utils::Error> LotterySelector::DrawOne(const ArtistWeights& weights) {
  auto total = TotalWeight(weights);
  if (!total) {
    return utils::MakeUnexpected(total.error());
  }

  std::uniform_real_distribution<double> dist(0.0, *total);
  const double ticket = dist(engine_);

  double cumulative = 0.0;
  const std::string* last_positive = nullptr;
  for (const auto& [artist, weight] : weights) {
    if (weight <= 0.0) {
      continue;
    }
    cumulative += weight;
    last_positive = &artist;
    if (cumulative > ticket) {
      return artist;
    }
  }
  // Rounding can leave the ticket at the very end of the range
  return *last_positive;
}

utils::Expected<std::vector<std::string>, utils::Error> LotterySelector::Draw(const ArtistWeights& weights, size_t n) {
  auto total = TotalWeight(weights);
  if (!total) {
    return utils::MakeUnexpected(total.error());
  }

  std::vector<std::string> winners;
  winners.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    auto winner = DrawOne(weights);
    if (!winner) {
      return utils::MakeUnexpected(winner.error());
    }
    winners.push_back(std::move(*winner));
  }
  return winners;
}

}  // namespace tastemix::recommend
