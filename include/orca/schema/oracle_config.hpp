#pragma once

#include <orca/schema/network.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/transaction.hpp>
#include <orca/schema/value.hpp>

// Schema type: oracle config.
// Deployment facts the engine needs to locate and spend the oracle. Loaded by
// the executables from program options; never stored on chain.
namespace orca::schema {

template <uint16_t Version>
struct oracle_config;

template <>
struct oracle_config<1> final {
  uint16_t version{1};
  network_t network{network_t::testnet};
  bytes_t oracle_address;
  asset_id_t state_nft;
  bytes_t minting_policy_script;
  bytes_t validator_script;
  bytes_t reference_script_address;
  slot_t ttl_slots{1000};
  lovelace_t collateral_minimum{5'000'000};
  ex_units_t spend_ex_units{.memory = 1'400'000, .steps = 500'000'000};
  ex_units_t mint_ex_units{.memory = 400'000, .steps = 150'000'000};

  bool operator==(const oracle_config&) const = default;
};

using oracle_config_t = oracle_config<1>;

}  // namespace orca::schema
