#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tsm::detail {

namespace adl {
using std::to_string;

template <typename T>
concept has_to_string = requires(const T& value) {
  { to_string(value) } -> std::convertible_to<std::string>;
};

template <typename T>
std::string call_to_string(const T& value) {
  return to_string(value);
}
}  // namespace adl

template <typename T>
concept streamable = requires(std::ostream& os, const T& value) {
  { os << value } -> std::convertible_to<std::ostream&>;
};

// Renders an opaque state or event value as text. Lookup order: string-like,
// an ADL-visible to_string() (std::to_string for arithmetic types),
// operator<<, the underlying integer of an enum.
template <typename T>
std::string to_display_string(const T& value) {
  if constexpr (std::is_convertible_v<const T&, std::string_view>) {
    return std::string(std::string_view(value));
  } else if constexpr (adl::has_to_string<T>) {
    return adl::call_to_string(value);
  } else if constexpr (streamable<T>) {
    std::ostringstream os;
    os << value;
    return os.str();
  } else if constexpr (std::is_enum_v<T>) {
    return std::to_string(static_cast<std::underlying_type_t<T>>(value));
  } else {
    return "<opaque>";
  }
}

}  // namespace tsm::detail
