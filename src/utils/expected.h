/**
 * @file expected.h
 * @brief Minimal std::expected-like type for C++17
 *
 * Expected<T, E> holds either a value of type T or an error of type E.
 * Errors are constructed through MakeUnexpected():
 *
 * @code
 * Expected<int, Error> Parse(const std::string& str) {
 *   if (str.empty()) {
 *     return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Empty input"));
 *   }
 *   return std::stoi(str);
 * }
 * @endcode
 */

#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace vecscope::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

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

template <typename T, typename E>
class Expected;

namespace detail {

template <typename T>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

template <typename T>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !detail::IsExpected<std::decay_t<U>>::value &&
                                        !detail::IsUnexpected<std::decay_t<U>>::value>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, E(unexpected.error())) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, E(std::move(unexpected).error())) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::move(std::get<0>(storage_));
  }

  const E& error() const& { return std::get<1>(storage_); }
  E& error() & { return std::get<1>(storage_); }
  E&& error() && { return std::move(std::get<1>(storage_)); }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value with func, keeping the error untouched
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)(std::get<0>(storage_));
      return Expected<void, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)(std::get<0>(storage_)));
    }
  }

  /**
   * @brief Chain an operation that itself returns an Expected
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using R = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return R(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(std::get<0>(storage_));
  }

  /**
   * @brief Recover from an error with an operation returning Expected<T, E>
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error with func, keeping the value untouched
   */
  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(std::get<0>(storage_));
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that return no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : has_error_(true), error_(unexpected.error()) {}

  template <typename G>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : has_error_(true), error_(std::move(unexpected).error()) {}

  bool has_value() const { return !has_error_; }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (has_error_) {
      throw BadExpectedAccess<E>(error_);
    }
  }

  const E& error() const& { return error_; }
  E& error() & { return error_; }

  template <typename F>
  auto and_then(F&& func) const& {
    using R = std::invoke_result_t<F>;
    if (has_error_) {
      return R(MakeUnexpected(error_));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::invoke_result_t<F, const E&>;
    if (!has_error_) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::forward<F>(func)(error_)));
  }

 private:
  bool has_error_ = false;
  E error_{};
};

}  // namespace vecscope::utils
