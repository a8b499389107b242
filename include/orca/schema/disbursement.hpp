#pragma once

#include <orca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace orca::schema {

/// Where Close sends the fee tokens still held by the state UTxO.
enum class disbursement_t : uint8_t { to_nodes = 0, to_owner = 1 };

inline constexpr auto kDisbursementMappings =
    enum_mappings_t<disbursement_t, 2>{
        {{"to_nodes", disbursement_t::to_nodes},
         {"to_owner", disbursement_t::to_owner}}};

template <>
inline std::optional<disbursement_t> try_from_string<disbursement_t>(
    const std::string_view value) {
  return from_string(value, kDisbursementMappings);
}

inline constexpr std::string_view to_string(const disbursement_t value) {
  return to_string(value, kDisbursementMappings, "unknown");
}

}  // namespace orca::schema
