#pragma once

#include <orca/schema/primitives.hpp>
#include <orca/schema/value.hpp>

#include <compare>
#include <optional>
#include <string>

namespace orca::schema {

struct output_reference_t final {
  tx_id_t tx_id{};
  uint32_t index{};

  auto operator<=>(const output_reference_t&) const = default;
  bool operator==(const output_reference_t&) const = default;
};

struct transaction_output_t final {
  bytes_t address;
  value_t value;
  std::optional<bytes_t> datum;             // inline datum, Plutus data CBOR
  std::optional<bytes_t> reference_script;  // Plutus V2 script bytes

  bool operator==(const transaction_output_t&) const = default;
};

struct utxo_t final {
  output_reference_t input;
  transaction_output_t output;

  bool operator==(const utxo_t&) const = default;
};

/// `<tx id hex>#<index>`
std::string to_string(const output_reference_t& reference);

}  // namespace orca::schema
