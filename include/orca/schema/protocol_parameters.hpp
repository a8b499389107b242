#pragma once

#include <orca/schema/primitives.hpp>

namespace orca::schema {

struct rational_t final {
  uint64_t numerator{};
  uint64_t denominator{1};

  bool operator==(const rational_t&) const = default;
};

template <uint16_t Version>
struct protocol_parameters;

/// Ledger parameters that shape fees and minimum output values. Defaults are
/// the Babbage mainnet values.
template <>
struct protocol_parameters<1> final {
  uint16_t version{1};
  uint64_t min_fee_a{44};
  uint64_t min_fee_b{155'381};
  uint64_t coins_per_utxo_byte{4'310};
  uint64_t max_tx_size{16'384};
  rational_t price_memory{.numerator = 577, .denominator = 10'000};
  rational_t price_steps{.numerator = 721, .denominator = 10'000'000};
  uint32_t collateral_percentage{150};
  uint32_t max_collateral_inputs{3};
  bytes_t language_views;  // cost model view hashed into script_data_hash

  bool operator==(const protocol_parameters&) const = default;
};

using protocol_parameters_t = protocol_parameters<1>;

}  // namespace orca::schema
