#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace orca::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<enum_mapping_t<Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view to_string(const Enum value,
                                     const enum_mappings_t<Enum, N>& mappings,
                                     const std::string_view fallback) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return fallback;
}

/// Specialized next to each enum that has a mapping table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace orca::schema
