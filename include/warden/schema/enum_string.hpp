#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace warden::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

/// Specialized beside each enum that is printed in logs or parsed from the
/// command line, exposing `static constexpr std::array table`.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<std::string_view> name_of(const Enum value) {
  const auto& table = enum_names<Enum>::table;
  auto found = std::find_if(
      std::begin(table), std::end(table),
      [value](const auto& mapping) { return mapping.second == value; });
  if (found == std::end(table)) {
    return std::nullopt;
  }
  return found->first;
}

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  const auto& table = enum_names<Enum>::table;
  auto found = std::find_if(
      std::begin(table), std::end(table),
      [name](const auto& mapping) { return mapping.first == name; });
  if (found == std::end(table)) {
    return std::nullopt;
  }
  return found->second;
}

}  // namespace warden::schema
