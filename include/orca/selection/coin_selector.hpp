#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/protocol_parameters.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/utxo.hpp>
#include <orca/schema/value.hpp>

#include <functional>
#include <optional>
#include <set>
#include <vector>

namespace orca::selection {

struct selection_request_t final {
  // Value the transaction spends: outputs, fee and burned tokens.
  orca::schema::value_t required;
  // Value already supplied by inputs the caller fixed (state UTxO, mint).
  orca::schema::value_t provided;
  std::vector<orca::schema::utxo_t> candidates;
  // Never selected, whatever their value. The builder puts the state and
  // reference-script UTxOs here.
  std::set<orca::schema::output_reference_t> exclude;
  orca::schema::bytes_t change_address;
  orca::schema::protocol_parameters_t parameters;
};

struct selection_t final {
  std::vector<orca::schema::utxo_t> inputs;  // ordered by reference
  std::optional<orca::schema::transaction_output_t> change;
  // Sub-minimum pure-coin change added to the fee instead of an output.
  orca::schema::lovelace_t folded_into_fee{};

  bool operator==(const selection_t&) const = default;
};

using coin_selector_t = std::function<orca::schema::result<selection_t>(
    const selection_request_t& request)>;

/// Minimum coin an output must hold: (160 + serialized size) multiplied by
/// coins_per_utxo_byte, evaluated with the output carrying that minimum.
orca::schema::lovelace_t minimum_lovelace(
    const orca::schema::transaction_output_t& output,
    const orca::schema::protocol_parameters_t& parameters);

/// Largest-first selection. Tokens the fixed inputs lack are covered first
/// from the largest holders, then coin from the largest-coin UTxOs; ties are
/// broken by output reference so equal inputs always select the same set.
/// insufficient_funds reports the missing value in `info`.
orca::schema::result<selection_t> select_largest_first(
    const selection_request_t& request);

}  // namespace orca::selection
