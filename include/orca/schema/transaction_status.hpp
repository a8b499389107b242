#pragma once

#include <orca/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace orca::schema {

enum class transaction_status_t : uint8_t {
  unsigned_transaction = 0,
  partially_signed = 1,
  fully_signed = 2,
  submitted = 3,
  confirmed = 4,
  rejected = 5
};

inline constexpr auto kTransactionStatusMappings =
    enum_mappings_t<transaction_status_t, 6>{
        {{"unsigned", transaction_status_t::unsigned_transaction},
         {"partially_signed", transaction_status_t::partially_signed},
         {"fully_signed", transaction_status_t::fully_signed},
         {"submitted", transaction_status_t::submitted},
         {"confirmed", transaction_status_t::confirmed},
         {"rejected", transaction_status_t::rejected}}};

template <>
inline std::optional<transaction_status_t>
try_from_string<transaction_status_t>(const std::string_view value) {
  return from_string(value, kTransactionStatusMappings);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return to_string(value, kTransactionStatusMappings, "unknown");
}

}  // namespace orca::schema
