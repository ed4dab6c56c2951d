/**
 * @file expected.h
 * @brief Minimal Expected<T, E> for C++17 (subset of std::expected)
 *
 * Holds either a value of type T or an error of type E. Supports the
 * monadic operations transform, and_then, or_else and transform_error.
 *
 * Example:
 * @code
 * Expected<FeatureVector, Error> result = extractor.Extract(track);
 * if (!result) {
 *   spdlog::warn("{}", result.error().message());
 *   return MakeUnexpected(result.error());
 * }
 * Use(*result);
 * @endcode
 */

#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tastemix::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad Expected access: contains error"; }
  const E& error() const { return error_; }

 private:
  E error_;
};

namespace detail {
template <typename T>
struct IsUnexpected : std::false_type {};
template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};
}  // namespace detail

template <typename T, typename E>
class Expected;

namespace detail {
template <typename T>
struct IsExpected : std::false_type {};
template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};
}  // namespace detail

/**
 * @brief Value-or-error holder
 */
template <typename T, typename E>
class Expected {
  static constexpr size_t kValueIndex = 0;
  static constexpr size_t kErrorIndex = 1;

 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<kValueIndex>) {}

  template <typename U = T,
            std::enable_if_t<std::is_constructible_v<T, U&&> && !std::is_same_v<std::decay_t<U>, Expected> &&
                                 !detail::IsUnexpected<std::decay_t<U>>::value,
                             int> = 0>
  Expected(U&& value)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<kValueIndex>, std::forward<U>(value)) {}

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<kErrorIndex>, unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<kErrorIndex>, std::move(unexpected).error()) {}

  bool has_value() const { return storage_.index() == kValueIndex; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<kValueIndex>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<kValueIndex>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::move(std::get<kValueIndex>(storage_));
  }

  T& operator*() & { return std::get<kValueIndex>(storage_); }
  const T& operator*() const& { return std::get<kValueIndex>(storage_); }
  T&& operator*() && { return std::move(std::get<kValueIndex>(storage_)); }

  T* operator->() { return &std::get<kValueIndex>(storage_); }
  const T* operator->() const { return &std::get<kValueIndex>(storage_); }

  const E& error() const& { return std::get<kErrorIndex>(storage_); }
  E& error() & { return std::get<kErrorIndex>(storage_); }
  E&& error() && { return std::move(std::get<kErrorIndex>(storage_)); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value with f, passing errors through
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(Unexpected<E>(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::invoke(std::forward<F>(func), **this);
      return Expected<void, E>();
    } else {
      return Expected<U, E>(std::invoke(std::forward<F>(func), **this));
    }
  }

  /**
   * @brief Chain an operation returning Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using R = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<R>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return R(Unexpected<E>(error()));
    }
    return std::invoke(std::forward<F>(func), **this);
  }

  /**
   * @brief Recover from an error with an operation returning Expected<T, E>
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::invoke(std::forward<F>(func), error());
  }

  /**
   * @brief Map the error with f, passing values through
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(Unexpected<G>(std::invoke(std::forward<F>(func), error())));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations without a result value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(std::move(unexpected).error()) {}

  bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  const E& error() const& { return *error_; }
  E& error() & { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto transform(F&& func) const -> Expected<std::invoke_result_t<F>, E> {
    using U = std::invoke_result_t<F>;
    if (!has_value()) {
      return Expected<U, E>(Unexpected<E>(*error_));
    }
    if constexpr (std::is_void_v<U>) {
      std::invoke(std::forward<F>(func));
      return Expected<void, E>();
    } else {
      return Expected<U, E>(std::invoke(std::forward<F>(func)));
    }
  }

  template <typename F>
  auto and_then(F&& func) const -> std::invoke_result_t<F> {
    using R = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<R>::value, "and_then callback must return Expected");
    if (!has_value()) {
      return R(Unexpected<E>(*error_));
    }
    return std::invoke(std::forward<F>(func));
  }

  template <typename F>
  Expected or_else(F&& func) const {
    if (has_value()) {
      return *this;
    }
    return std::invoke(std::forward<F>(func), *error_);
  }

  template <typename F>
  auto transform_error(F&& func) const -> Expected<void, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(Unexpected<G>(std::invoke(std::forward<F>(func), *error_)));
  }

 private:
  std::optional<E> error_;
};

}  // namespace tastemix::utils
