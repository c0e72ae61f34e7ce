#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace tsm {

// Either a value or a structured error. Accessing the wrong alternative
// throws std::bad_variant_access.
template <typename T, typename Err>
class [[nodiscard]] Result {
 public:
  using value_type = T;
  using error_type = Err;

  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(Err error) : storage_(std::in_place_index<1>, std::move(error)) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & { return std::get<0>(storage_); }
  const T& value() const& { return std::get<0>(storage_); }
  T&& value() && { return std::get<0>(std::move(storage_)); }

  T& operator*() & { return value(); }
  const T& operator*() const& { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

  const Err& error() const { return std::get<1>(storage_); }

 private:
  std::variant<T, Err> storage_;
};

template <typename Err>
class [[nodiscard]] Result<void, Err> {
 public:
  using value_type = void;
  using error_type = Err;

  Result() = default;
  Result(Err error) : storage_(std::in_place_index<1>, std::move(error)) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  const Err& error() const { return std::get<1>(storage_); }

 private:
  std::variant<std::monostate, Err> storage_;
};

}  // namespace tsm
