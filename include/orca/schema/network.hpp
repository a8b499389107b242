#pragma once

#include <orca/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace orca::schema {

/// Network discriminant carried in the low nibble of every address header.
enum class network_t : uint8_t { testnet = 0, mainnet = 1 };

inline constexpr auto kNetworkMappings = enum_mappings_t<network_t, 2>{
    {{"testnet", network_t::testnet}, {"mainnet", network_t::mainnet}}};

template <>
inline std::optional<network_t> try_from_string<network_t>(
    const std::string_view value) {
  return from_string(value, kNetworkMappings);
}

inline constexpr std::string_view to_string(const network_t value) {
  return to_string(value, kNetworkMappings, "unknown");
}

}  // namespace orca::schema
