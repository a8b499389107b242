#pragma once

#include <orca/schema/enum_string.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/utxo.hpp>
#include <orca/schema/value.hpp>

#include <optional>
#include <vector>

// Schema type: transaction.
// Babbage-era transaction shape restricted to the fields the oracle flows
// produce.
namespace orca::schema {

enum class redeemer_tag_t : uint8_t { spend = 0, mint = 1 };

inline constexpr auto kRedeemerTagMappings = enum_mappings_t<redeemer_tag_t, 2>{
    {{"spend", redeemer_tag_t::spend}, {"mint", redeemer_tag_t::mint}}};

inline constexpr std::string_view to_string(const redeemer_tag_t value) {
  return to_string(value, kRedeemerTagMappings, "unknown");
}

struct ex_units_t final {
  uint64_t memory{};
  uint64_t steps{};

  bool operator==(const ex_units_t&) const = default;
};

struct redeemer_t final {
  redeemer_tag_t tag{redeemer_tag_t::spend};
  uint32_t index{};
  bytes_t data;  // Plutus data CBOR
  ex_units_t ex_units;

  bool operator==(const redeemer_t&) const = default;
};

struct vkey_witness_t final {
  ed25519_public_key_t vkey{};
  ed25519_signature_t signature{};

  bool operator==(const vkey_witness_t&) const = default;
};

struct witness_set_t final {
  std::vector<vkey_witness_t> vkey_witnesses;
  std::vector<bytes_t> plutus_v2_scripts;
  std::vector<redeemer_t> redeemers;

  bool operator==(const witness_set_t&) const = default;
};

template <uint16_t Version>
struct transaction_body;

template <>
struct transaction_body<1> final {
  uint16_t version{1};
  std::vector<output_reference_t> inputs;
  std::vector<transaction_output_t> outputs;
  lovelace_t fee{};
  std::optional<slot_t> ttl;
  std::optional<slot_t> validity_start;
  mint_t mint;
  std::optional<hash32_t> script_data_hash;
  std::vector<output_reference_t> collateral;
  std::vector<key_hash_t> required_signers;
  std::vector<output_reference_t> reference_inputs;

  bool operator==(const transaction_body&) const = default;
};

using transaction_body_t = transaction_body<1>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_body_t body;
  witness_set_t witnesses;
  bool is_valid{true};

  bool operator==(const transaction&) const = default;
};

using transaction_t = transaction<1>;

}  // namespace orca::schema
