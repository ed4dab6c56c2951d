/**
 * @file expected_test.cpp
 * @brief Unit tests for Expected<T, E> and Error
 */

#include "utils/expected.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "utils/error.h"

using namespace tastemix::utils;

// ========== Expected<T, E> with value ==========

TEST(ExpectedTest, DefaultConstructor) {
  Expected<int, Error> result;
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 0);
}

TEST(ExpectedTest, ValueConstructor) {
  Expected<double, Error> result(2.5);
  ASSERT_TRUE(result);
  EXPECT_DOUBLE_EQ(*result, 2.5);
  EXPECT_DOUBLE_EQ(result.value(), 2.5);
}

TEST(ExpectedTest, ErrorConstructor) {
  Expected<std::string, Error> result(MakeUnexpected(MakeError(ErrorCode::kNoMatch, "nothing eligible", "Artist1")));
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kNoMatch);
  EXPECT_EQ(result.error().message(), "nothing eligible");
  EXPECT_EQ(result.error().context(), "Artist1");
}

TEST(ExpectedTest, ArrowOperator) {
  Expected<std::vector<std::string>, Error> result(std::vector<std::string>{"rock", "indie"});
  EXPECT_EQ(result->size(), 2U);
  EXPECT_EQ(result->front(), "rock");
}

TEST(ExpectedTest, ValueAccessThrows) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kSeedExhausted)));
  EXPECT_THROW({ (void)result.value(); }, BadExpectedAccess<Error>);
}

TEST(ExpectedTest, BadExpectedAccessCarriesError) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kEmptyPool, "no weights")));
  try {
    (void)result.value();
    FAIL() << "value() should throw";
  } catch (const BadExpectedAccess<Error>& e) {
    EXPECT_EQ(e.error().code(), ErrorCode::kEmptyPool);
    EXPECT_STREQ(e.what(), "Bad Expected access: contains error");
  }
}

TEST(ExpectedTest, ValueOr) {
  Expected<int, Error> success(7);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kTimeout)));
  EXPECT_EQ(success.value_or(0), 7);
  EXPECT_EQ(failure.value_or(3), 3);
}

TEST(ExpectedTest, ValueOrMove) {
  Expected<std::string, Error> failure(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  std::string fallback = std::move(failure).value_or("fallback");
  EXPECT_EQ(fallback, "fallback");
}

// ========== Expected<void, E> ==========

TEST(ExpectedVoidTest, DefaultConstructor) {
  Expected<void, Error> result;
  EXPECT_TRUE(result);
  EXPECT_NO_THROW(result.value());
}

TEST(ExpectedVoidTest, ErrorConstructor) {
  Expected<void, Error> result(MakeUnexpected(MakeError(ErrorCode::kStorageCRCMismatch, "bad crc")));
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageCRCMismatch);
  EXPECT_THROW(result.value(), BadExpectedAccess<Error>);
}

TEST(ExpectedVoidTest, AndThenRunsOnlyOnSuccess) {
  int calls = 0;
  Expected<void, Error> ok;
  auto chained = ok.and_then([&calls]() -> Expected<int, Error> {
    ++calls;
    return 5;
  });
  ASSERT_TRUE(chained);
  EXPECT_EQ(*chained, 5);

  Expected<void, Error> failed(MakeUnexpected(MakeError(ErrorCode::kInternalError)));
  auto skipped = failed.and_then([&calls]() -> Expected<int, Error> {
    ++calls;
    return 6;
  });
  EXPECT_FALSE(skipped);
  EXPECT_EQ(skipped.error().code(), ErrorCode::kInternalError);
  EXPECT_EQ(calls, 1);
}

// ========== Monadic operations ==========

TEST(ExpectedTest, Transform) {
  Expected<int, Error> overlap(3);
  auto doubled = overlap.transform([](int value) { return value * 2; });
  ASSERT_TRUE(doubled);
  EXPECT_EQ(*doubled, 6);

  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kNoMatch)));
  auto passed = failure.transform([](int value) { return std::to_string(value); });
  EXPECT_FALSE(passed);
  EXPECT_EQ(passed.error().code(), ErrorCode::kNoMatch);
}

TEST(ExpectedTest, AndThen) {
  auto parse_positive = [](int value) -> Expected<unsigned, Error> {
    if (value <= 0) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "must be positive"));
    }
    return static_cast<unsigned>(value);
  };

  Expected<int, Error> good(4);
  auto result = good.and_then(parse_positive);
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, 4U);

  Expected<int, Error> bad(-1);
  auto rejected = bad.and_then(parse_positive);
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedTest, OrElse) {
  Expected<std::string, Error> failure(MakeUnexpected(MakeError(ErrorCode::kGenreSourceFailed)));
  auto recovered = failure.or_else([](const Error& error) -> Expected<std::string, Error> {
    if (error.code() == ErrorCode::kGenreSourceFailed) {
      return std::string("unknown");
    }
    return MakeUnexpected(error);
  });
  ASSERT_TRUE(recovered);
  EXPECT_EQ(*recovered, "unknown");

  Expected<std::string, Error> success(std::string("rock"));
  auto untouched = success.or_else([](const Error&) -> Expected<std::string, Error> { return std::string("x"); });
  EXPECT_EQ(*untouched, "rock");
}

TEST(ExpectedTest, TransformError) {
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kExtractionRateLimited, "slow down")));
  auto mapped = failure.transform_error([](const Error& error) { return std::string(ErrorCodeToString(error.code())); });
  ASSERT_FALSE(mapped);
  EXPECT_EQ(mapped.error(), "ExtractionRateLimited");
}

TEST(ExpectedTest, CopyAndMove) {
  Expected<std::string, Error> original(std::string("track-1"));
  Expected<std::string, Error> copy = original;
  EXPECT_EQ(*copy, "track-1");

  Expected<std::string, Error> moved = std::move(original);
  EXPECT_EQ(*moved, "track-1");

  copy = Expected<std::string, Error>(MakeUnexpected(MakeError(ErrorCode::kTrackNotFound)));
  EXPECT_FALSE(copy);
}

// ========== Error ==========

TEST(ErrorTest, ToStringIncludesNameMessageAndContext) {
  auto error = MakeError(ErrorCode::kSeedExhausted, "No seed vector after 5 attempt(s)", "Artist X");
  EXPECT_EQ(error.to_string(), "[SeedExhausted] No seed vector after 5 attempt(s) (Artist X)");
}

TEST(ErrorTest, ToStringWithoutContext) {
  auto error = MakeError(ErrorCode::kEmptyPool, "No artist with a positive lottery weight");
  EXPECT_EQ(error.to_string(), "[EmptyPool] No artist with a positive lottery weight");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kNoMatch), "NoMatch");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kTimeout), "Timeout");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kConfigInvalidValue), "ConfigInvalidValue");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kProfileParseError), "ProfileParseError");
}
