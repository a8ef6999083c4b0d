/**
 * @file expected.h
 * @brief Minimal Expected<T, E> (value-or-error) in the spirit of std::expected
 *
 * Example usage:
 * @code
 * Expected<bsoncxx::oid, Error> id = DecodeObjectId(raw);
 * if (!id) {
 *   return MakeUnexpected(id.error());
 * }
 * @endcode
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace mongokit::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by Expected::value() when an error is held
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  [[nodiscard]] const E& error() const { return error_; }

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

/**
 * @brief Holds either a value of type T or an error of type E
 */
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
  // NOLINTNEXTLINE(google-explicit-constructor) - implicit success conversion, like std::expected
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }

  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }

  T&& value() && {
    ThrowIfError();
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(std::get<1>(storage_));
  }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

  template <typename U>
  T value_or(U&& fallback) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(fallback));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::decay_t<std::invoke_result_t<F, const T&>>, E> {
    if (has_value()) {
      return std::forward<F>(func)(std::get<0>(storage_));
    }
    return MakeUnexpected(std::get<1>(storage_));
  }

  /**
   * @brief Chain an operation that itself returns Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::decay_t<std::invoke_result_t<F, const T&>> {
    if (has_value()) {
      return std::forward<F>(func)(std::get<0>(storage_));
    }
    return MakeUnexpected(std::get<1>(storage_));
  }

  /**
   * @brief Recover from an error with an operation returning Expected
   */
  template <typename F>
  auto or_else(F&& func) const& -> std::decay_t<std::invoke_result_t<F, const E&>> {
    if (has_value()) {
      return std::get<0>(storage_);
    }
    return std::forward<F>(func)(std::get<1>(storage_));
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::decay_t<std::invoke_result_t<F, const E&>>> {
    if (has_value()) {
      return std::get<0>(storage_);
    }
    return MakeUnexpected(std::forward<F>(func)(std::get<1>(storage_)));
  }

 private:
  std::variant<T, E> storage_;

  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }
};

/**
 * @brief Specialization for operations that produce no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

  template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  E&& error() && {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::move(*error_);
  }

  template <typename F>
  auto and_then(F&& func) const& -> std::decay_t<std::invoke_result_t<F>> {
    if (has_value()) {
      return std::forward<F>(func)();
    }
    return MakeUnexpected(*error_);
  }

 private:
  std::optional<E> error_;
};

}  // namespace mongokit::utils
