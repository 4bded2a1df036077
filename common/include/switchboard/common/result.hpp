#pragma once
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace switchboard {

  template <typename T, typename E> class Result;

  /// Error carrier used to construct a failed Result (mirrors std::unexpected)
  template <typename E> class Unexpected {
  public:
    explicit constexpr Unexpected(const E& err) : error_(err) {}
    explicit constexpr Unexpected(E&& err) : error_(std::move(err)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E& error() & noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }

  private:
    E error_;
  };

  template <typename E> Unexpected(E) -> Unexpected<E>;

  /// Value-or-error return type used across the engine in place of std::expected
  template <typename T, typename E> class Result {
  public:
    using value_type = T;
    using error_type = E;

    constexpr Result(const T& value) : storage_(std::in_place_index<0>, value) {}
    constexpr Result(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

    template <typename U> constexpr Result(const Unexpected<U>& err)
        : storage_(std::in_place_index<1>, E(err.error())) {}

    template <typename U> constexpr Result(Unexpected<U>&& err)
        : storage_(std::in_place_index<1>, E(std::move(err).error())) {}

    [[nodiscard]] constexpr bool has_value() const noexcept { return storage_.index() == 0; }

    [[nodiscard]] constexpr explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] constexpr T& value() & {
      if (!has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains error");
      }
      return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr const T& value() const& {
      if (!has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains error");
      }
      return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr T&& value() && {
      if (!has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains error");
      }
      return std::get<0>(std::move(storage_));
    }

    template <typename U> [[nodiscard]] constexpr T value_or(U&& fallback) const& {
      return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
    }

    [[nodiscard]] constexpr E& error() & {
      if (has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains value");
      }
      return std::get<1>(storage_);
    }

    [[nodiscard]] constexpr const E& error() const& {
      if (has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains value");
      }
      return std::get<1>(storage_);
    }

    [[nodiscard]] constexpr T& operator*() & { return value(); }
    [[nodiscard]] constexpr const T& operator*() const& { return value(); }
    [[nodiscard]] constexpr T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] constexpr T* operator->() { return &value(); }
    [[nodiscard]] constexpr const T* operator->() const { return &value(); }

  private:
    std::variant<T, E> storage_;
  };

  /// Result without a payload; success is the absence of an error
  template <typename E> class Result<void, E> {
  public:
    using value_type = void;
    using error_type = E;

    constexpr Result() noexcept = default;

    template <typename U> constexpr Result(const Unexpected<U>& err) : error_(E(err.error())) {}

    template <typename U> constexpr Result(Unexpected<U>&& err)
        : error_(E(std::move(err).error())) {}

    [[nodiscard]] constexpr bool has_value() const noexcept { return !error_.has_value(); }

    [[nodiscard]] constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr void value() const {
      if (!has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains error");
      }
    }

    [[nodiscard]] constexpr const E& error() const& {
      if (has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains value");
      }
      return *error_;
    }

    [[nodiscard]] constexpr E& error() & {
      if (has_value()) [[unlikely]] {
        throw std::runtime_error("Result contains value");
      }
      return *error_;
    }

  private:
    std::optional<E> error_;
  };

}  // namespace switchboard
